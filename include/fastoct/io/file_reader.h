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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_IO_FILE_READER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_IO_FILE_READER_H_

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace fastoct {
namespace io {

/// @brief RAII wrapper for a read-only FILE*
///
/// Every failure is tagged with ErrorKind::kIo. Opening a missing file
/// yields kNotFound, all other failures kInternal.
///
/// Example usage:
/// ```cpp
/// ASSIGN_OR_RETURN(auto reader, FileReader::Open(path));
/// ASSIGN_OR_RETURN(auto bytes, reader.ReadAll());
/// ```
class FileReader {
 public:
  /// @brief Default constructor (creates invalid reader)
  FileReader() : file_(nullptr, fclose) {}

  /// @brief Open a file for binary reading
  /// @param path Path to file
  /// @return FileReader instance or error
  /// @retval absl::NotFoundError if file cannot be opened
  static absl::StatusOr<FileReader> Open(const fs::path& path);

  FileReader(FileReader&& other) noexcept = default;
  FileReader& operator=(FileReader&& other) noexcept = default;
  ~FileReader() = default;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  /// @brief Seek to position in file
  /// @param offset Byte offset
  /// @param whence SEEK_SET, SEEK_CUR, or SEEK_END
  absl::Status Seek(int64_t offset, int whence = SEEK_SET) const;

  /// @brief Get file size without moving the file position
  absl::StatusOr<int64_t> GetSize() const;

  /// @brief Read exactly @p size bytes into @p buffer
  absl::Status Read(void* buffer, size_t size) const;

  /// @brief Read exactly @p size bytes into a vector
  absl::StatusOr<std::vector<uint8_t>> ReadBytes(size_t size) const;

  /// @brief Read the whole file from the beginning
  absl::StatusOr<std::vector<uint8_t>> ReadAll() const;

 private:
  explicit FileReader(FILE* file) : file_(file, fclose) {}

  std::unique_ptr<FILE, decltype(&fclose)> file_;
};

}  // namespace io

using io::FileReader;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_IO_FILE_READER_H_
