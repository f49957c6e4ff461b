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

#include "fastoct/pixel/heidelberg_float.h"

#include <cmath>
#include <cstring>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace pixel {

namespace {

constexpr uint32_t kMantissaBits = 10;
constexpr uint32_t kMantissaMask = (1u << kMantissaBits) - 1;
constexpr int kExponentBias = 63;
constexpr double kGamma = 2.4;

// Mantissa bits are stored least significant first
uint32_t ReverseMantissa(uint32_t bits) {
  uint32_t reversed = 0;
  for (uint32_t i = 0; i < kMantissaBits; ++i) {
    reversed = (reversed << 1) | ((bits >> i) & 1u);
  }
  return reversed;
}

std::array<float, 65536> BuildIntensityTable() {
  std::array<float, 65536> table{};
  for (uint32_t raw = 0; raw < table.size(); ++raw) {
    const double value = DecodeMiniFloat(static_cast<uint16_t>(raw));
    table[raw] = static_cast<float>(256.0 * std::pow(value, 1.0 / kGamma));
  }
  return table;
}

}  // namespace

double DecodeMiniFloat(uint16_t raw) {
  const uint32_t mantissa = ReverseMantissa(raw & kMantissaMask);
  const int exponent = static_cast<int>(raw >> kMantissaBits);
  return (1.0 + mantissa / 1024.0) * std::ldexp(1.0, exponent - kExponentBias);
}

const std::array<float, 65536>& HeidelbergIntensityTable() {
  static const std::array<float, 65536> table = BuildIntensityTable();
  return table;
}

absl::StatusOr<Slice> DecodeHeidelbergPlane(ByteView data, uint32_t rows,
                                            uint32_t cols) {
  const size_t count = static_cast<size_t>(rows) * cols;
  if (count == 0) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Empty Heidelberg plane %ux%u", cols, rows));
  }
  if (data.size() / 2 < count) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Heidelberg plane %ux%u needs %u bytes, got %u", cols,
                        rows, 2 * count, data.size()));
  }

  const auto& table = HeidelbergIntensityTable();
  std::vector<float> values(count);
  for (size_t i = 0; i < count; ++i) {
    const uint16_t raw = static_cast<uint16_t>(data[2 * i] |
                                               (data[2 * i + 1] << 8));
    values[i] = table[raw];
  }

  std::vector<uint8_t> pixels(count * sizeof(float));
  std::memcpy(pixels.data(), values.data(), pixels.size());
  return Slice::FromPixels(
      SliceGeometry{cols, rows, PixelFormat::kGray, DataType::kFloat32},
      std::move(pixels));
}

}  // namespace pixel
}  // namespace fastoct
