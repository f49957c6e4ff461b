// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fastoct/pixel/jpeg_decoder.h"

#include <algorithm>
#include <array>
#include <csetjmp>
#include <cstring>
#include <utility>
#include <vector>

#include <jpeglib.h>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace pixel {

namespace {  // ---- JPEG: thread-local reusable decompressor ----

struct ThreadLocalJpeg {
  jpeg_decompress_struct cinfo{};
  jpeg_error_mgr jerr{};
  std::jmp_buf jump_buffer{};
  char error_message[JMSG_LENGTH_MAX]{};
  char warning_message[JMSG_LENGTH_MAX]{};
  // Output lives here rather than on the stack of the setjmp caller, whose
  // non-volatile locals are indeterminate after a longjmp.
  std::vector<uint8_t> pixels;
  bool inited{false};

  ~ThreadLocalJpeg() {
    if (inited)
      jpeg_destroy_decompress(&cinfo);
  }

  /// @brief Error exit handler that longjmps instead of calling exit()
  static void ErrorExit(j_common_ptr cinfo) {
    ThreadLocalJpeg* self =
        reinterpret_cast<ThreadLocalJpeg*>(cinfo->client_data);
    (*cinfo->err->format_message)(cinfo, self->error_message);
    std::longjmp(self->jump_buffer, 1);
  }

  /// @brief Keeps the first warning (e.g. premature end of data) instead of
  ///        printing it to stderr
  static void EmitMessage(j_common_ptr cinfo, int msg_level) {
    if (msg_level >= 0) {
      return;  // trace messages
    }
    ThreadLocalJpeg* self =
        reinterpret_cast<ThreadLocalJpeg*>(cinfo->client_data);
    if (cinfo->err->num_warnings == 0) {
      (*cinfo->err->format_message)(cinfo, self->warning_message);
    }
    cinfo->err->num_warnings++;
  }

  jpeg_decompress_struct* Get() {
    if (!inited) {
      cinfo.err = jpeg_std_error(&jerr);
      jerr.error_exit = ErrorExit;
      jerr.emit_message = EmitMessage;
      cinfo.client_data = this;
      jpeg_create_decompress(&cinfo);
      inited = true;
    } else {
      // Reset state in case a previous call aborted early.
      jpeg_abort_decompress(&cinfo);
    }
    jerr.num_warnings = 0;
    return &cinfo;
  }
};

static thread_local ThreadLocalJpeg g_tls_jpeg;

constexpr std::array<uint8_t, 4> kJ2kCodestream = {0xFF, 0x4F, 0xFF, 0x51};
constexpr std::array<uint8_t, 12> kJp2Signature = {
    0x00, 0x00, 0x00, 0x0C, 0x6A, 0x50, 0x20, 0x20, 0x0D, 0x0A, 0x87, 0x0A};

template <size_t N>
bool StartsWith(ByteView data, const std::array<uint8_t, N>& prefix) {
  return data.size() >= N && std::equal(prefix.begin(), prefix.end(),
                                        data.begin());
}

}  // namespace

Codec SniffCodec(ByteView data) {
  if (data.size() >= 2 && data[0] == 0xFF && data[1] == 0xD8) {
    return Codec::kJpeg;
  }
  if (StartsWith(data, kJ2kCodestream) || StartsWith(data, kJp2Signature)) {
    return Codec::kJpeg2000;
  }
  return Codec::kUnknown;
}

absl::StatusOr<Slice> DecodeJpeg(ByteView data, JpegOutput output) {
  if (data.empty()) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode, "Empty JPEG data");
  }

  jpeg_decompress_struct* c = g_tls_jpeg.Get();
  std::vector<uint8_t>& pixels = g_tls_jpeg.pixels;
  pixels.clear();

  if (setjmp(g_tls_jpeg.jump_buffer)) {
    jpeg_abort_decompress(c);
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("JPEG decode error: %s", g_tls_jpeg.error_message));
  }

  jpeg_mem_src(c, data.data(), static_cast<unsigned long>(data.size()));

  if (jpeg_read_header(c, TRUE) != JPEG_HEADER_OK) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             "Failed to read JPEG header");
  }

  c->quantize_colors = FALSE;
  c->dither_mode = JDITHER_NONE;

  switch (output) {
    case JpegOutput::kNative:
      c->out_color_space = c->num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;
      break;
    case JpegOutput::kGray:
      c->out_color_space = JCS_GRAYSCALE;
      break;
    case JpegOutput::kRGB:
      c->out_color_space = JCS_RGB;
      break;
  }

  if (!jpeg_start_decompress(c)) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             "Failed to start JPEG decompression");
  }

  const uint32_t width = static_cast<uint32_t>(c->output_width);
  const uint32_t height = static_cast<uint32_t>(c->output_height);
  const int channels = c->output_components;
  if (channels != 1 && channels != 3) {
    jpeg_abort_decompress(c);
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Unsupported JPEG component count %d", channels));
  }

  const JDIMENSION row_stride = static_cast<JDIMENSION>(width * channels);
  pixels.resize(static_cast<size_t>(row_stride) * height);

  // Batch a few scanlines to reduce call overhead
  const JDIMENSION kBatch = 32;
  std::array<JSAMPROW, kBatch> rows;

  while (c->output_scanline < c->output_height) {
    JDIMENSION n =
        std::min<JDIMENSION>(kBatch, c->output_height - c->output_scanline);
    for (JDIMENSION i = 0; i < n; ++i) {
      rows[i] = pixels.data() +
                (static_cast<size_t>(c->output_scanline) + i) * row_stride;
    }
    JDIMENSION got = jpeg_read_scanlines(c, rows.data(), n);
    if (got == 0) {
      jpeg_abort_decompress(c);
      return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                               "jpeg_read_scanlines returned 0");
    }
  }

  jpeg_finish_decompress(c);

  if (g_tls_jpeg.jerr.num_warnings > 0) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Corrupt JPEG data: %s", g_tls_jpeg.warning_message));
  }

  const SliceGeometry geometry{
      width, height, channels == 1 ? PixelFormat::kGray : PixelFormat::kRGB,
      DataType::kUInt8};
  return Slice::FromPixels(geometry, std::exchange(pixels, {}));
}

absl::StatusOr<Slice> DecodeCompressedPlane(ByteView data, JpegOutput output) {
  const Codec codec = SniffCodec(data);
  switch (codec) {
    case Codec::kJpeg:
      return DecodeJpeg(data, output);
    case Codec::kJpeg2000:
      return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                               "JPEG 2000 codestreams are not supported");
    case Codec::kUnknown:
      break;
  }
  return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                           "Unrecognised compressed codestream");
}

}  // namespace pixel
}  // namespace fastoct
