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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_RAW_PLANE_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_RAW_PLANE_H_

#include <cstdint>
#include <limits>

#include "absl/status/statusor.h"
#include "fastoct/core/slice.h"
#include "fastoct/io/byte_cursor.h"

namespace fastoct {
namespace pixel {

/// @brief Order in which samples are stored on disk
enum class SampleOrder {
  kRowMajor,   ///< One image row after the other
  kAScanMajor  ///< One A-scan (image column) after the other
};

/// @brief Shape of an uncompressed single-channel plane
struct RawPlaneSpec {
  uint32_t width = 0;   ///< A-scans per plane (image columns)
  uint32_t height = 0;  ///< Samples per A-scan (image rows)
  DataType dtype = DataType::kUInt8;
  Endian endian = Endian::kLittle;
  SampleOrder order = SampleOrder::kRowMajor;

  /// @brief Bytes of one plane, saturated at UINT64_MAX
  [[nodiscard]] uint64_t ByteSize() const {
    const uint64_t samples = static_cast<uint64_t>(width) * height;
    const uint64_t size = GetDataTypeSize(dtype);
    if (size != 0 && samples > std::numeric_limits<uint64_t>::max() / size) {
      return std::numeric_limits<uint64_t>::max();
    }
    return samples * size;
  }
};

/// @brief Reinterpret @p data as a gray plane, transposing A-scan-major data
///
/// Bytes past ByteSize() are ignored.
/// @retval PixelDecodeError if the plane is empty or @p data is too short
absl::StatusOr<Slice> DecodeRawPlane(ByteView data, const RawPlaneSpec& spec);

/// @brief Interleave three consecutive 8-bit B, G, R planes into RGB
/// @retval PixelDecodeError if @p data holds fewer than 3 * width * height
///         bytes
absl::StatusOr<Slice> DecodePlanarBgr(ByteView data, uint32_t width,
                                      uint32_t height);

}  // namespace pixel
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_RAW_PLANE_H_
