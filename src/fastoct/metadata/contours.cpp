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

#include "fastoct/metadata/contours.h"

#include <map>
#include <string>
#include <utility>

#include "absl/strings/str_format.h"

namespace fastoct {
namespace metadata {

void AttachContours(std::vector<Contour> contours, OctVolume& volume,
                    WarningSink& warnings) {
  const SliceGeometry geometry = volume.GetGeometry();
  std::map<std::string, size_t> discarded;
  for (auto& contour : contours) {
    if (contour.slice_index >= volume.slices.size() ||
        contour.depths.size() != geometry.width) {
      ++discarded[contour.layer_name];
      continue;
    }
    volume.contours.push_back(std::move(contour));
  }

  for (const auto& [layer_name, count] : discarded) {
    warnings.Add(
        ErrorKind::kMetadataField,
        absl::StrFormat("Contour '%s': %u rows match no B-scan of %s (%u "
                        "slices of width %u) and were discarded",
                        layer_name, count, volume.volume_id,
                        volume.slices.size(), geometry.width));
  }
}

}  // namespace metadata
}  // namespace fastoct
