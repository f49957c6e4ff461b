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

#include "fastoct/pixel/volume_assembler.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace pixel {

void VolumeAssembler::Add(std::optional<int64_t> index,
                          absl::StatusOr<Slice> slice,
                          std::optional<uint64_t> offset) {
  records_.push_back(Record{index, std::move(slice), offset, records_.size()});
}

absl::StatusOr<std::vector<Slice>> VolumeAssembler::Assemble(
    WarningSink& warnings) && {
  if (records_.empty()) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kInconsistentVolumeGeometry,
        absl::StrFormat("Volume %s has no slices", volume_id_));
  }

  const bool indexed =
      std::all_of(records_.begin(), records_.end(),
                  [](const Record& r) { return r.index.has_value(); });

  std::vector<Record> ordered;
  ordered.reserve(records_.size());
  if (indexed) {
    std::stable_sort(
        records_.begin(), records_.end(),
        [](const Record& a, const Record& b) { return *a.index < *b.index; });
    for (auto& record : records_) {
      if (!ordered.empty() && ordered.back().index == record.index) {
        warnings.Add(ErrorKind::kDuplicateSlice,
                     absl::StrFormat("Volume %s: duplicate slice index %d, "
                                     "keeping the first occurrence",
                                     volume_id_, *record.index),
                     record.offset);
        continue;
      }
      ordered.push_back(std::move(record));
    }
  } else {
    ordered = std::move(records_);
  }

  const Record* reference = nullptr;
  for (const auto& record : ordered) {
    if (record.slice.ok()) {
      reference = &record;
      break;
    }
  }
  if (reference == nullptr) {
    for (const auto& record : ordered) {
      Warning warning =
          Warning::FromStatus(record.slice.status(), ErrorKind::kPixelDecode);
      if (!warning.offset.has_value()) {
        warning.offset = record.offset;
      }
      warnings.Add(std::move(warning));
    }
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Volume %s: none of %u slices could be decoded",
                        volume_id_, ordered.size()));
  }

  const SliceGeometry geometry = reference->slice->GetGeometry();
  std::vector<Slice> slices;
  slices.reserve(ordered.size());
  for (auto& record : ordered) {
    const int64_t position =
        record.index.value_or(static_cast<int64_t>(record.arrival));
    if (!record.slice.ok()) {
      Warning warning =
          Warning::FromStatus(record.slice.status(), ErrorKind::kPixelDecode);
      warning.message = absl::StrFormat("Volume %s slice %d: %s", volume_id_,
                                        position, warning.message);
      if (!warning.offset.has_value()) {
        warning.offset = record.offset;
      }
      warnings.Add(std::move(warning));
      slices.push_back(Slice::Missing(geometry));
      continue;
    }
    if (record.slice->GetGeometry() != geometry) {
      return MAKE_DECODE_ERROR(
          ErrorKind::kInconsistentVolumeGeometry,
          absl::StrFormat("Volume %s slice %d is %s, expected %s", volume_id_,
                          position, record.slice->GetGeometry().ToString(),
                          geometry.ToString()));
    }
    slices.push_back(*std::move(record.slice));
  }
  return slices;
}

}  // namespace pixel
}  // namespace fastoct
