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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_IO_RAW_BUFFER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_IO_RAW_BUFFER_H_

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/io/byte_cursor.h"

namespace fastoct {
namespace io {

/// @brief Immutable bytes of one opened file
///
/// Owned exclusively by a reader. The contents never change after load, so
/// cursors and views handed out by Cursor() stay valid for the lifetime of
/// the buffer.
class RawBuffer {
 public:
  RawBuffer() = default;

  /// @brief Load a whole file into memory
  /// @retval absl::NotFoundError if the file cannot be opened (ErrorKind::kIo)
  static absl::StatusOr<RawBuffer> Load(const std::filesystem::path& path);

  /// @brief Take ownership of caller-provided bytes
  static RawBuffer Adopt(std::vector<uint8_t> bytes) {
    return RawBuffer(std::move(bytes));
  }

  RawBuffer(RawBuffer&&) noexcept = default;
  RawBuffer& operator=(RawBuffer&&) noexcept = default;
  RawBuffer(const RawBuffer&) = delete;
  RawBuffer& operator=(const RawBuffer&) = delete;

  [[nodiscard]] ByteView View() const { return bytes_; }
  [[nodiscard]] ByteCursor Cursor() const { return ByteCursor(bytes_); }
  [[nodiscard]] uint64_t Size() const { return bytes_.size(); }
  [[nodiscard]] bool Empty() const { return bytes_.empty(); }

 private:
  explicit RawBuffer(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  std::vector<uint8_t> bytes_;
};

}  // namespace io

using io::RawBuffer;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_IO_RAW_BUFFER_H_
