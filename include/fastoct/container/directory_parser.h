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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_DIRECTORY_PARSER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_DIRECTORY_PARSER_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "fastoct/container/directory.h"
#include "fastoct/container/record_layout.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/io/byte_cursor.h"

namespace fastoct {
namespace container {

/// @brief Knobs for DirectoryParser::Parse
struct DirectoryParseOptions {
  /// @brief Fail with UnrecognizedFormat when no record is found
  bool require_entries = true;

  /// @brief Upper bound on records read in one walk
  uint64_t max_records = uint64_t{1} << 24;
};

/// @brief Walks tag/offset/length directories without reading payloads
///
/// The parser resolves every record to an absolute byte range:
/// - a record whose payload exceeds the buffer is skipped with an
///   OutOfBounds warning naming the record and its offset;
/// - when such a record is inline, the next record cannot be located and the
///   walk stops, keeping the records already read;
/// - an unreadable record header also stops the walk with a warning.
///
/// Example usage:
/// ```cpp
/// TopconRecordLayout layout(ClassifyTopconRecord);
/// ASSIGN_OR_RETURN(auto directory,
///                  DirectoryParser::Parse(cursor, 15, layout, warnings));
/// for (const auto* entry : directory.FindAll(kImgJpeg)) { ... }
/// ```
class DirectoryParser {
 public:
  /// @brief Parse a directory starting at @p start
  /// @param cursor Cursor over the container (positions are relative to it)
  /// @param start Offset of the first record, relative to @p cursor
  /// @param layout Record layout strategy
  /// @param warnings Receives non-fatal problems
  /// @param options Parse options
  /// @return Directory with absolute offsets, or UnrecognizedFormat when
  ///         no record could be read and entries are required
  static absl::StatusOr<Directory> Parse(
      ByteCursor cursor, uint64_t start, RecordLayout& layout,
      WarningSink& warnings,
      const DirectoryParseOptions& options = DirectoryParseOptions());
};

}  // namespace container

using container::DirectoryParseOptions;
using container::DirectoryParser;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_DIRECTORY_PARSER_H_
