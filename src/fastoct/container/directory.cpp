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

#include "fastoct/container/directory.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"

namespace fastoct {
namespace container {

std::string ChunkKey::SeriesId() const {
  return absl::StrFormat("%d_%d_%d", patient_id, study_id, series_id);
}

void Directory::Add(DirectoryEntry entry) {
  by_type_[entry.type].push_back(entries_.size());
  entries_.push_back(std::move(entry));
}

std::vector<const DirectoryEntry*> Directory::FindAll(uint32_t type) const {
  std::vector<const DirectoryEntry*> found;
  auto it = by_type_.find(type);
  if (it == by_type_.end()) {
    return found;
  }
  found.reserve(it->second.size());
  for (size_t index : it->second) {
    found.push_back(&entries_[index]);
  }
  return found;
}

const DirectoryEntry* Directory::FindFirst(uint32_t type) const {
  auto it = by_type_.find(type);
  if (it == by_type_.end() || it->second.empty()) {
    return nullptr;
  }
  return &entries_[it->second.front()];
}

const DirectoryEntry* Directory::FindByName(std::string_view name) const {
  for (const auto& entry : entries_) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

}  // namespace container
}  // namespace fastoct
