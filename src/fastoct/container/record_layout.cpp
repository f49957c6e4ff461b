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

#include "fastoct/container/record_layout.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace container {

absl::StatusOr<std::optional<RecordHeader>> TopconRecordLayout::ReadNext(
    ByteCursor& cursor) {
  if (cursor.AtEnd()) {
    return std::nullopt;
  }

  DECLARE_ASSIGN_OR_RETURN(uint8_t, name_length, cursor.ReadU8());
  if (name_length == 0) {
    return std::nullopt;
  }

  RecordHeader header;
  ASSIGN_OR_RETURN(header.name, cursor.ReadFixedString(name_length),
                   "Failed to read record name");
  ASSIGN_OR_RETURN(header.payload_length, cursor.ReadU32(Endian::kLittle),
                   absl::StrFormat("Failed to read size of %s", header.name));
  header.type = classifier_(header.name);
  header.payload_offset = cursor.Tell();
  return std::optional<RecordHeader>(std::move(header));
}

absl::StatusOr<std::optional<RecordHeader>> KeyedRecordLayout::ReadNext(
    ByteCursor& cursor) {
  if (cursor.AtEnd()) {
    return std::nullopt;
  }

  const uint64_t record_offset = cursor.AbsoluteOffset();
  DECLARE_ASSIGN_OR_RETURN(uint32_t, key_length,
                           cursor.ReadU32(Endian::kLittle));
  if (key_length == 0 || key_length > kMaxKeyLength) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, record_offset,
        absl::StrFormat("Implausible key length %u", key_length));
  }

  RecordHeader header;
  ASSIGN_OR_RETURN(header.name, cursor.ReadFixedString(key_length),
                   "Failed to read record key");
  ASSIGN_OR_RETURN(header.payload_length, cursor.ReadU32(Endian::kLittle),
                   absl::StrFormat("Failed to read length of %s", header.name));
  header.type = classifier_(header.name);
  header.payload_offset = cursor.Tell();
  header.terminal =
      terminator_key_.has_value() && header.name == *terminator_key_;
  return std::optional<RecordHeader>(std::move(header));
}

std::optional<uint64_t> SizePrefixedLayout::FittingLength(
    const ByteCursor& cursor, uint64_t position) {
  auto prefix = cursor.ViewAt(position, 4);
  if (!prefix.ok()) {
    return std::nullopt;
  }
  const uint64_t length = static_cast<uint64_t>((*prefix)[0]) |
                          (static_cast<uint64_t>((*prefix)[1]) << 8) |
                          (static_cast<uint64_t>((*prefix)[2]) << 16) |
                          (static_cast<uint64_t>((*prefix)[3]) << 24);
  if (!io::RangeFits(position + 4, length, cursor.Size())) {
    return std::nullopt;
  }
  return length;
}

bool SizePrefixedLayout::IsBoundary(const ByteCursor& cursor,
                                    uint64_t position) const {
  const auto length = FittingLength(cursor, position);
  if (!length.has_value()) {
    return false;
  }
  auto head = cursor.ViewAt(position + 4, sync_marker_.size());
  if (head.ok() &&
      std::equal(sync_marker_.begin(), sync_marker_.end(), head->begin())) {
    return true;
  }
  // A damaged payload still delimits a record when the next length, or the
  // end of the run, follows it
  const uint64_t end = position + 4 + *length;
  return end == cursor.Size() || FittingLength(cursor, end).has_value();
}

bool SizePrefixedLayout::Resynchronize(ByteCursor& cursor) const {
  const ByteView data = cursor.View();
  auto it = data.begin() + static_cast<std::ptrdiff_t>(cursor.Tell());
  while (true) {
    it = std::search(it, data.end(), sync_marker_.begin(), sync_marker_.end());
    if (it == data.end()) {
      return false;
    }
    const uint64_t marker = static_cast<uint64_t>(it - data.begin());
    if (marker >= cursor.Tell() + 4 && IsBoundary(cursor, marker - 4)) {
      VLOG(1) << "size-prefixed record " << produced_ << ": skipped "
              << marker - 4 - cursor.Tell() << " bytes to the next boundary";
      return cursor.Seek(marker - 4).ok();
    }
    ++it;
  }
}

absl::StatusOr<std::optional<RecordHeader>> SizePrefixedLayout::ReadNext(
    ByteCursor& cursor) {
  if (produced_ >= count_) {
    return std::nullopt;
  }

  if (!sync_marker_.empty() && !IsBoundary(cursor, cursor.Tell()) &&
      !Resynchronize(cursor)) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, cursor.AbsoluteOffset(),
        absl::StrFormat("No boundary found for record %u of %u", produced_,
                        count_));
  }

  RecordHeader header;
  header.type = type_;
  header.index = produced_;
  ASSIGN_OR_RETURN(header.payload_length, cursor.ReadU32(Endian::kLittle),
                   absl::StrFormat("Failed to read size of record %u",
                                   produced_));
  header.payload_offset = cursor.Tell();
  ++produced_;
  header.terminal = produced_ == count_;
  return std::optional<RecordHeader>(std::move(header));
}

absl::StatusOr<std::optional<RecordHeader>> E2eEntryLayout::ReadNext(
    ByteCursor& cursor) {
  while (consumed_ < count_) {
    DECLARE_ASSIGN_OR_RETURN(ByteView, raw, cursor.ReadBytes(kEntrySize));
    ++consumed_;

    ByteCursor entry(raw);
    uint32_t pos = 0;
    uint32_t start = 0;
    uint32_t size = 0;
    ChunkKey key;
    uint32_t type = 0;
    ASSIGN_OR_RETURN(pos, entry.ReadU32(Endian::kLittle));
    ASSIGN_OR_RETURN(start, entry.ReadU32(Endian::kLittle));
    ASSIGN_OR_RETURN(size, entry.ReadU32(Endian::kLittle));
    RETURN_IF_ERROR(entry.Skip(4), "Failed to skip entry field");
    ASSIGN_OR_RETURN(key.patient_id, entry.ReadI32(Endian::kLittle));
    ASSIGN_OR_RETURN(key.study_id, entry.ReadI32(Endian::kLittle));
    ASSIGN_OR_RETURN(key.series_id, entry.ReadI32(Endian::kLittle));
    ASSIGN_OR_RETURN(key.slice_id, entry.ReadI32(Endian::kLittle));
    RETURN_IF_ERROR(entry.Skip(4), "Failed to skip entry field");
    ASSIGN_OR_RETURN(type, entry.ReadU32(Endian::kLittle));

    if (start == 0 || start <= pos) {
      continue;  // empty slot
    }

    RecordHeader header;
    header.type = type;
    header.payload_offset = start;
    header.payload_length = kChunkHeaderSize + static_cast<uint64_t>(size);
    header.key = key;
    header.payload_inline = false;
    return std::optional<RecordHeader>(std::move(header));
  }
  return std::nullopt;
}

}  // namespace container
}  // namespace fastoct
