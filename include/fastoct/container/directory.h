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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_DIRECTORY_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_DIRECTORY_H_

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fastoct {
namespace container {

/// @brief Compound key of an E2E chunk
struct ChunkKey {
  int32_t patient_id = 0;
  int32_t study_id = 0;
  int32_t series_id = 0;
  int32_t slice_id = 0;

  /// @brief Key of the series this chunk belongs to (slice id cleared)
  [[nodiscard]] ChunkKey SeriesKey() const {
    return ChunkKey{patient_id, study_id, series_id, 0};
  }

  /// @brief "<patient>_<study>_<series>"
  [[nodiscard]] std::string SeriesId() const;

  auto operator<=>(const ChunkKey&) const = default;
};

/// @brief One record of a container directory, resolved to a byte range
///
/// Offsets are absolute positions in the file. Payloads are never
/// interpreted at this level.
struct DirectoryEntry {
  /// @brief Integer tag (E2E chunk type or per-format record enumerator)
  uint32_t type = 0;

  /// @brief On-disk record name for containers that name their records
  std::string name;

  uint64_t offset = 0;
  uint64_t length = 0;

  /// @brief Explicit ordinal (size-prefixed runs) or E2E chunk sub-index
  std::optional<int64_t> index;

  /// @brief Compound key for keyed containers (E2E)
  std::optional<ChunkKey> key;
};

/// @brief Directory entries in file (or chain) order with a per-type index
class Directory {
 public:
  Directory() = default;

  void Add(DirectoryEntry entry);

  /// @brief All entries in the order they were discovered
  [[nodiscard]] const std::vector<DirectoryEntry>& Entries() const {
    return entries_;
  }

  /// @brief All entries of @p type in discovery order
  [[nodiscard]] std::vector<const DirectoryEntry*> FindAll(
      uint32_t type) const;

  /// @brief First entry of @p type, or nullptr
  [[nodiscard]] const DirectoryEntry* FindFirst(uint32_t type) const;

  /// @brief First entry named @p name, or nullptr
  [[nodiscard]] const DirectoryEntry* FindByName(std::string_view name) const;

  [[nodiscard]] size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

  /// @brief Absolute offset just past the last record that was read
  [[nodiscard]] uint64_t GetEndOffset() const { return end_offset_; }
  void SetEndOffset(uint64_t offset) { end_offset_ = offset; }

 private:
  std::vector<DirectoryEntry> entries_;
  std::map<uint32_t, std::vector<size_t>> by_type_;
  uint64_t end_offset_ = 0;
};

}  // namespace container

using container::ChunkKey;
using container::Directory;
using container::DirectoryEntry;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_DIRECTORY_H_
