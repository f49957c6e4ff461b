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

#include "fastoct/container/directory_parser.h"

#include <optional>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace container {

namespace {

std::string DescribeRecord(const RecordHeader& header) {
  if (!header.name.empty()) {
    return header.name;
  }
  if (header.index.has_value()) {
    return absl::StrFormat("#%d (type %u)", *header.index, header.type);
  }
  return absl::StrFormat("type %u", header.type);
}

}  // namespace

absl::StatusOr<Directory> DirectoryParser::Parse(
    ByteCursor cursor, uint64_t start, RecordLayout& layout,
    WarningSink& warnings, const DirectoryParseOptions& options) {
  Directory directory;

  if (auto seek_status = cursor.Seek(start); !seek_status.ok()) {
    warnings.AddStatus(seek_status, ErrorKind::kOutOfBounds);
  } else {
    directory.SetEndOffset(cursor.AbsoluteOffset());

    uint64_t records = 0;
    while (records < options.max_records) {
      const uint64_t record_offset = cursor.AbsoluteOffset();
      auto next = layout.ReadNext(cursor);
      if (!next.ok()) {
        warnings.Add(GetErrorKind(next.status())
                         .value_or(ErrorKind::kOutOfBounds),
                     absl::StrFormat("Unreadable %s record: %s",
                                     layout.GetName(),
                                     ::fastoct::status::StripStackTrace(
                                         next.status().message())),
                     record_offset);
        break;
      }
      if (!next->has_value()) {
        break;
      }

      RecordHeader header = std::move(**next);
      ++records;

      if (!io::RangeFits(header.payload_offset, header.payload_length,
                     cursor.Size())) {
        warnings.Add(
            ErrorKind::kOutOfBounds,
            absl::StrFormat("Record %s: payload of %u bytes at offset %u "
                            "exceeds buffer of %u bytes",
                            DescribeRecord(header), header.payload_length,
                            cursor.BaseOffset() + header.payload_offset,
                            cursor.BaseOffset() + cursor.Size()),
            record_offset);
        if (header.payload_inline) {
          break;  // next record position is unknown
        }
        continue;
      }

      VLOG(1) << layout.GetName() << " record " << DescribeRecord(header)
              << " at " << cursor.BaseOffset() + header.payload_offset
              << " (" << header.payload_length << " bytes)";

      DirectoryEntry entry;
      entry.type = header.type;
      entry.name = std::move(header.name);
      entry.offset = cursor.BaseOffset() + header.payload_offset;
      entry.length = header.payload_length;
      entry.index = header.index;
      entry.key = header.key;
      directory.Add(std::move(entry));

      if (header.payload_inline) {
        if (auto status =
                cursor.Seek(header.payload_offset + header.payload_length);
            !status.ok()) {
          warnings.AddStatus(status, ErrorKind::kOutOfBounds);
          break;
        }
      }
      directory.SetEndOffset(cursor.AbsoluteOffset());

      if (header.terminal) {
        break;
      }
    }
  }

  if (directory.empty() && options.require_entries) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kUnrecognizedFormat, cursor.BaseOffset() + start,
        absl::StrFormat("No %s directory records found", layout.GetName()));
  }
  return directory;
}

}  // namespace container
}  // namespace fastoct
