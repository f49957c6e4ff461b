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

#include "fastoct/core/slice.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {

std::string SliceGeometry::ToString() const {
  return absl::StrFormat("%ux%u %s %s", width, height, GetName(format),
                         GetName(dtype));
}

absl::StatusOr<Slice> Slice::FromPixels(const SliceGeometry& geometry,
                                        std::vector<uint8_t> pixels) {
  if (pixels.size() != geometry.ByteSize()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Pixel buffer of %zu bytes does not match %s (%zu "
                        "bytes)",
                        pixels.size(), geometry.ToString(),
                        geometry.ByteSize()));
  }
  Slice slice;
  slice.geometry_ = geometry;
  slice.data_ = std::move(pixels);
  return slice;
}

}  // namespace fastoct
