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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_CONTOURS_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_CONTOURS_H_

#include <vector>

#include "fastoct/core/decode_result.h"
#include "fastoct/core/volume.h"

namespace fastoct {
namespace metadata {

/// @brief Attach contours to the volume they segment
///
/// A contour is kept when its slice index names a slice of @p volume and it
/// has one depth per A-scan. The rest are discarded with one
/// MetadataFieldError warning per layer.
void AttachContours(std::vector<Contour> contours, OctVolume& volume,
                    WarningSink& warnings);

}  // namespace metadata
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_CONTOURS_H_
