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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_RECORD_LAYOUT_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_RECORD_LAYOUT_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/container/directory.h"
#include "fastoct/io/byte_cursor.h"

/**
 * @file record_layout.h
 * @brief On-disk shapes of directory records
 *
 * A RecordLayout knows how to read one record header at the cursor
 * position. DirectoryParser drives a layout over a buffer and turns the
 * headers into DirectoryEntry values.
 */

namespace fastoct {
namespace container {

/// @brief Maps an on-disk record name to a per-format type enumerator
using RecordClassifier = std::function<uint32_t(std::string_view name)>;

/// @brief One record header as read by a RecordLayout
struct RecordHeader {
  uint32_t type = 0;
  std::string name;

  /// @brief Payload position relative to the cursor's view
  uint64_t payload_offset = 0;
  uint64_t payload_length = 0;

  std::optional<int64_t> index;
  std::optional<ChunkKey> key;

  /// @brief Payload directly follows the header; the next record starts
  ///        after the payload
  bool payload_inline = true;

  /// @brief No records follow this one
  bool terminal = false;
};

/// @brief Strategy reading successive record headers
class RecordLayout {
 public:
  virtual ~RecordLayout() = default;

  /// @brief Read the record header at the cursor position
  ///
  /// On success the cursor is positioned just past the header. Returns
  /// nullopt when the directory ends at this position.
  virtual absl::StatusOr<std::optional<RecordHeader>> ReadNext(
      ByteCursor& cursor) = 0;

  /// @brief Short name used in log and warning messages
  [[nodiscard]] virtual std::string_view GetName() const = 0;
};

/// @brief Topcon FDA/FDS records
///
/// `u8 name_length` (0 terminates), name, `u32 payload_length`, payload.
class TopconRecordLayout : public RecordLayout {
 public:
  explicit TopconRecordLayout(RecordClassifier classifier)
      : classifier_(std::move(classifier)) {}

  absl::StatusOr<std::optional<RecordHeader>> ReadNext(
      ByteCursor& cursor) override;

  [[nodiscard]] std::string_view GetName() const override { return "topcon"; }

 private:
  RecordClassifier classifier_;
};

/// @brief Key/value records (Bioptigen, Optovue)
///
/// `u32 key_length`, key, `u32 data_length`, data. An optional terminator
/// key ends the directory after its own record.
class KeyedRecordLayout : public RecordLayout {
 public:
  /// Keys longer than this are treated as corruption
  static constexpr uint32_t kMaxKeyLength = 256;

  KeyedRecordLayout(RecordClassifier classifier,
                    std::optional<std::string> terminator_key = std::nullopt)
      : classifier_(std::move(classifier)),
        terminator_key_(std::move(terminator_key)) {}

  absl::StatusOr<std::optional<RecordHeader>> ReadNext(
      ByteCursor& cursor) override;

  [[nodiscard]] std::string_view GetName() const override { return "keyed"; }

 private:
  RecordClassifier classifier_;
  std::optional<std::string> terminator_key_;
};

/// @brief A known number of `u32 length` + payload records
///
/// Every entry gets @p type and its ordinal as index.
///
/// With a sync marker (e.g. the JPEG SOI) a record only counts as a
/// boundary when its length fits the buffer and either its payload starts
/// with the marker or another fitting length (or the end of the run) follows
/// it. A length field that is off leaves the cursor inside the previous
/// payload; the layout then scans forward to the next position where a
/// fitting length is followed by the marker, so one bad length costs only
/// its own record.
class SizePrefixedLayout : public RecordLayout {
 public:
  SizePrefixedLayout(uint32_t type, uint32_t count,
                     std::vector<uint8_t> sync_marker = {})
      : type_(type), count_(count), sync_marker_(std::move(sync_marker)) {}

  absl::StatusOr<std::optional<RecordHeader>> ReadNext(
      ByteCursor& cursor) override;

  [[nodiscard]] std::string_view GetName() const override {
    return "size-prefixed";
  }

 private:
  /// @brief Length stored at @p position, if its payload fits the view
  static std::optional<uint64_t> FittingLength(const ByteCursor& cursor,
                                               uint64_t position);

  /// @brief True if a plausible record starts at @p position
  [[nodiscard]] bool IsBoundary(const ByteCursor& cursor,
                                uint64_t position) const;

  /// @brief Move the cursor to the next plausible record
  /// @return false (cursor unchanged) if none is left
  bool Resynchronize(ByteCursor& cursor) const;

  uint32_t type_;
  uint32_t count_;
  std::vector<uint8_t> sync_marker_;
  uint32_t produced_ = 0;
};

/// @brief Fixed 44-byte entry table of one E2E directory block
///
/// Entries are not inline: each names an absolute chunk position. Empty
/// slots (start 0, or start not past the entry's own position) are skipped.
/// The cursor must span the whole file.
class E2eEntryLayout : public RecordLayout {
 public:
  static constexpr uint64_t kEntrySize = 44;
  static constexpr uint64_t kChunkHeaderSize = 60;

  explicit E2eEntryLayout(uint32_t count) : count_(count) {}

  absl::StatusOr<std::optional<RecordHeader>> ReadNext(
      ByteCursor& cursor) override;

  [[nodiscard]] std::string_view GetName() const override {
    return "e2e-entry";
  }

 private:
  uint32_t count_;
  uint32_t consumed_ = 0;
};

}  // namespace container
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_RECORD_LAYOUT_H_
