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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_HEIDELBERG_FLOAT_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_HEIDELBERG_FLOAT_H_

#include <array>
#include <cstdint>

#include "absl/status/statusor.h"
#include "fastoct/core/slice.h"
#include "fastoct/io/byte_cursor.h"

/**
 * @file heidelberg_float.h
 * @brief Heidelberg 16-bit unsigned mini-float samples
 *
 * A sample packs a 10-bit mantissa in its low bits and a 6-bit exponent in
 * its high bits: `value = (1 + mantissa / 1024) * 2^(exponent - 63)`.
 * The mantissa is stored bit-reversed: bit 0 of the sample is its most
 * significant bit.
 * Intensities are displayed after the `256 * value^(1/2.4)` transfer curve.
 */

namespace fastoct {
namespace pixel {

/// @brief Linear value of one mini-float sample
[[nodiscard]] double DecodeMiniFloat(uint16_t raw);

/// @brief Display intensity for every possible raw sample
///
/// Built once on first use.
[[nodiscard]] const std::array<float, 65536>& HeidelbergIntensityTable();

/// @brief Decode a row-major plane of little-endian mini-float samples into
///        float32 display intensities
/// @param rows Number of image rows
/// @param cols Samples per row
/// @retval PixelDecodeError if the plane is empty or @p data is too short
absl::StatusOr<Slice> DecodeHeidelbergPlane(ByteView data, uint32_t rows,
                                            uint32_t cols);

}  // namespace pixel
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_HEIDELBERG_FLOAT_H_
