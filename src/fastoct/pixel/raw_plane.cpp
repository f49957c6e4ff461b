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

#include "fastoct/pixel/raw_plane.h"

#include <algorithm>
#include <bit>
#include <cstring>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace pixel {

namespace {

bool NeedsSwap(Endian endian) {
  const bool big_host = std::endian::native == std::endian::big;
  return (endian == Endian::kBig) != big_host;
}

}  // namespace

absl::StatusOr<Slice> DecodeRawPlane(ByteView data, const RawPlaneSpec& spec) {
  if (spec.width == 0 || spec.height == 0) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Empty plane %ux%u", spec.width, spec.height));
  }
  if (data.size() < spec.ByteSize()) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Plane %ux%u %s needs %u bytes, got %u", spec.width,
                        spec.height, GetName(spec.dtype), spec.ByteSize(),
                        data.size()));
  }

  const SliceGeometry geometry{spec.width, spec.height, PixelFormat::kGray,
                               spec.dtype};
  const size_t sample = GetDataTypeSize(spec.dtype);
  const bool swap = sample > 1 && NeedsSwap(spec.endian);
  std::vector<uint8_t> pixels(geometry.ByteSize());

  if (spec.order == SampleOrder::kRowMajor && !swap) {
    std::memcpy(pixels.data(), data.data(), pixels.size());
  } else {
    for (uint32_t y = 0; y < spec.height; ++y) {
      for (uint32_t x = 0; x < spec.width; ++x) {
        const size_t src_index =
            spec.order == SampleOrder::kRowMajor
                ? static_cast<size_t>(y) * spec.width + x
                : static_cast<size_t>(x) * spec.height + y;
        const uint8_t* src = data.data() + src_index * sample;
        uint8_t* dst =
            pixels.data() + (static_cast<size_t>(y) * spec.width + x) * sample;
        if (swap) {
          std::reverse_copy(src, src + sample, dst);
        } else {
          std::memcpy(dst, src, sample);
        }
      }
    }
  }

  return Slice::FromPixels(geometry, std::move(pixels));
}

absl::StatusOr<Slice> DecodePlanarBgr(ByteView data, uint32_t width,
                                      uint32_t height) {
  const size_t plane = static_cast<size_t>(width) * height;
  if (plane == 0) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Empty BGR plane %ux%u", width, height));
  }
  if (data.size() < 3 * plane) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Planar BGR %ux%u needs %u bytes, got %u", width,
                        height, 3 * plane, data.size()));
  }

  const uint8_t* blue = data.data();
  const uint8_t* green = blue + plane;
  const uint8_t* red = green + plane;

  std::vector<uint8_t> pixels(3 * plane);
  for (size_t i = 0; i < plane; ++i) {
    pixels[3 * i + 0] = red[i];
    pixels[3 * i + 1] = green[i];
    pixels[3 * i + 2] = blue[i];
  }
  return Slice::FromPixels(
      SliceGeometry{width, height, PixelFormat::kRGB, DataType::kUInt8},
      std::move(pixels));
}

}  // namespace pixel
}  // namespace fastoct
