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

#include "fastoct/pixel/deinterlace.h"

#include <cstring>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace pixel {

namespace {

using FieldPair = std::pair<Slice, Slice>;

}  // namespace

absl::StatusOr<std::pair<Slice, Slice>> SplitFields(const Slice& frame) {
  const SliceGeometry& geometry = frame.GetGeometry();
  if (geometry.height % 2 != 0) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Cannot de-interlace frame of odd depth %u",
                        geometry.height));
  }

  SliceGeometry field = geometry;
  field.height = geometry.height / 2;

  if (frame.IsMissing()) {
    return std::make_pair(Slice::Missing(field), Slice::Missing(field));
  }

  Slice first(field);
  Slice second(field);
  const size_t half = field.ByteSize();
  std::memcpy(first.GetData(), frame.GetData(), half);
  std::memcpy(second.GetData(), frame.GetData() + half, half);
  return std::make_pair(std::move(first), std::move(second));
}

absl::StatusOr<std::vector<Slice>> Deinterlace(
    const std::vector<Slice>& frames) {
  std::vector<Slice> slices;
  slices.reserve(frames.size() * 2);
  for (size_t k = 0; k < frames.size(); ++k) {
    DECLARE_ASSIGN_OR_RETURN(FieldPair, fields, SplitFields(frames[k]),
                             absl::StrFormat("Frame %u", k));
    slices.push_back(std::move(fields.first));
    slices.push_back(std::move(fields.second));
  }
  return slices;
}

}  // namespace pixel
}  // namespace fastoct
