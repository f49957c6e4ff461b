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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_VOLUME_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_VOLUME_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/time/civil_time.h"
#include "fastoct/core/metadata.h"
#include "fastoct/core/slice.h"

namespace fastoct {

/// @brief Layer segmentation of one B-scan
///
/// One depth value per A-scan (column) of the slice it belongs to. Unknown
/// depths are NaN.
struct Contour {
  std::string layer_name;
  uint32_t slice_index = 0;
  std::vector<float> depths;
};

/// @brief Ordered stack of B-scans plus acquisition metadata
///
/// All slices share one SliceGeometry and at least one slice is decoded.
/// Slices that failed to decode are present as missing placeholders so that
/// slice indices stay aligned with the acquisition.
struct OctVolume {
  std::string volume_id;
  std::vector<Slice> slices;
  Laterality laterality = Laterality::kUnknown;
  std::optional<absl::CivilSecond> acquisition_datetime;
  PatientMetadata patient;
  DeviceMetadata device;
  std::vector<Contour> contours;

  [[nodiscard]] size_t GetNumSlices() const { return slices.size(); }

  /// @brief Geometry shared by all slices (empty geometry if no slices)
  [[nodiscard]] SliceGeometry GetGeometry() const {
    return slices.empty() ? SliceGeometry{} : slices.front().GetGeometry();
  }

  [[nodiscard]] size_t CountMissing() const {
    size_t n = 0;
    for (const auto& slice : slices) {
      n += slice.IsMissing() ? 1 : 0;
    }
    return n;
  }
};

/// @brief Single 2D fundus photograph or scanning-laser image
struct FundusImage {
  std::string image_id;
  Slice image;
  Laterality laterality = Laterality::kUnknown;
  std::optional<absl::CivilSecond> acquisition_datetime;
  PatientMetadata patient;
  DeviceMetadata device;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_VOLUME_H_
