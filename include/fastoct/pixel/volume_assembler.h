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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_VOLUME_ASSEMBLER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_VOLUME_ASSEMBLER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/slice.h"

namespace fastoct {
namespace pixel {

/// @brief Orders decoded slices into one consistent volume
///
/// Slices are added in arrival order, each with an optional explicit slice
/// index. Assemble():
/// - sorts by index when every slice has one, otherwise keeps arrival order;
/// - keeps the first arrival of a duplicated index and warns about the rest;
/// - turns failed slices into missing placeholders with a warning;
/// - rejects the volume when decoded slices disagree in geometry
///   (InconsistentVolumeGeometry) or when no slice decoded at all.
///
/// Example usage:
/// ```cpp
/// VolumeAssembler assembler("1_2_3");
/// for (const auto* entry : directory.FindAll(kImgJpeg)) {
///   assembler.Add(entry->index, DecodeJpeg(view), entry->offset);
/// }
/// ASSIGN_OR_RETURN(volume.slices, std::move(assembler).Assemble(warnings));
/// ```
class VolumeAssembler {
 public:
  explicit VolumeAssembler(std::string volume_id)
      : volume_id_(std::move(volume_id)) {}

  /// @brief Add the next slice in arrival order
  /// @param index Explicit slice index, if the container records one
  /// @param slice Decoded slice, or the reason decoding failed
  /// @param offset Absolute offset of the slice record, for warnings
  void Add(std::optional<int64_t> index, absl::StatusOr<Slice> slice,
           std::optional<uint64_t> offset = std::nullopt);

  [[nodiscard]] size_t size() const { return records_.size(); }
  [[nodiscard]] bool empty() const { return records_.empty(); }

  /// @brief Produce the ordered slices; per-slice problems go to @p warnings
  /// @retval InconsistentVolumeGeometry if no slice was added or decoded
  ///         slices disagree in geometry
  /// @retval PixelDecodeError if no slice could be decoded
  absl::StatusOr<std::vector<Slice>> Assemble(WarningSink& warnings) &&;

 private:
  struct Record {
    std::optional<int64_t> index;
    absl::StatusOr<Slice> slice;
    std::optional<uint64_t> offset;
    size_t arrival = 0;
  };

  std::string volume_id_;
  std::vector<Record> records_;
};

}  // namespace pixel

using pixel::VolumeAssembler;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_VOLUME_ASSEMBLER_H_
