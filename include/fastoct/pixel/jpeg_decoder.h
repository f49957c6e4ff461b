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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_JPEG_DECODER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_JPEG_DECODER_H_

#include "absl/status/statusor.h"
#include "fastoct/core/slice.h"
#include "fastoct/io/byte_cursor.h"

namespace fastoct {
namespace pixel {

/// @brief Compressed codestream families found in vendor containers
enum class Codec {
  kUnknown,
  kJpeg,     ///< JPEG baseline/extended (SOI marker)
  kJpeg2000  ///< Raw J2K codestream or JP2 box file
};

constexpr const char* GetName(Codec codec) {
  switch (codec) {
    case Codec::kUnknown:
      return "unknown";
    case Codec::kJpeg:
      return "JPEG";
    case Codec::kJpeg2000:
      return "JPEG 2000";
  }
  return "unknown";
}

/// @brief Colour handling of decoded JPEG planes
enum class JpegOutput {
  kNative,  ///< Gray for single-component streams, RGB otherwise
  kGray,    ///< Always 8-bit gray
  kRGB      ///< Always 8-bit RGB
};

/// @brief Identify the codestream by its leading signature
[[nodiscard]] Codec SniffCodec(ByteView data);

/// @brief Decode a JPEG codestream with libjpeg
///
/// Uses a thread-local decompressor; libjpeg errors are turned into
/// statuses through setjmp/longjmp instead of terminating the process.
///
/// @retval PixelDecodeError if the stream is empty, truncated or corrupt
absl::StatusOr<Slice> DecodeJpeg(ByteView data,
                                 JpegOutput output = JpegOutput::kNative);

/// @brief Decode a compressed plane, dispatching on SniffCodec()
/// @retval PixelDecodeError for JPEG 2000 (unsupported codec) and for
///         unrecognised codestreams
absl::StatusOr<Slice> DecodeCompressedPlane(
    ByteView data, JpegOutput output = JpegOutput::kNative);

}  // namespace pixel
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_JPEG_DECODER_H_
