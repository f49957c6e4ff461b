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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_DEINTERLACE_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_DEINTERLACE_H_

#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/core/slice.h"

namespace fastoct {
namespace pixel {

/// @brief Split one interlaced frame into its two fields
///
/// The first field is the first half of every A-scan (top rows), the second
/// field the second half. A missing frame yields two missing fields.
/// @retval PixelDecodeError if the frame height is odd
absl::StatusOr<std::pair<Slice, Slice>> SplitFields(const Slice& frame);

/// @brief Replace every frame by its two fields, doubling the slice count
///
/// Frame k becomes slices 2k and 2k + 1. This is a one-shot transform:
/// applying it to its own output halves the depth again.
absl::StatusOr<std::vector<Slice>> Deinterlace(const std::vector<Slice>& frames);

}  // namespace pixel
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_PIXEL_DEINTERLACE_H_
