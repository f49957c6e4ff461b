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

#include "fastoct/io/file_reader.h"

#include <vector>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace io {

namespace {

absl::Status IoError(absl::StatusCode code, const std::string& message) {
  return AttachErrorKind(MAKE_STATUS(code, message), ErrorKind::kIo);
}

}  // namespace

absl::StatusOr<FileReader> FileReader::Open(const fs::path& path) {
  FILE* file = fopen(path.string().c_str(), "rb");
  if (!file) {
    return IoError(absl::StatusCode::kNotFound,
                   absl::StrFormat("Cannot open file: %s", path.string()));
  }
  return FileReader(file);
}

absl::Status FileReader::Seek(int64_t offset, int whence) const {
  if (fseek(file_.get(), offset, whence) != 0) {
    return IoError(absl::StatusCode::kInternal,
                   absl::StrFormat("Failed to seek to offset %d", offset));
  }
  return absl::OkStatus();
}

absl::StatusOr<int64_t> FileReader::GetSize() const {
  const int64_t current_pos = ftell(file_.get());
  if (current_pos < 0) {
    return IoError(absl::StatusCode::kInternal,
                   "Failed to get current file position");
  }

  if (fseek(file_.get(), 0, SEEK_END) != 0) {
    return IoError(absl::StatusCode::kInternal,
                   "Failed to seek to end of file");
  }

  const int64_t size = ftell(file_.get());
  if (size < 0) {
    return IoError(absl::StatusCode::kInternal,
                   "Failed to determine file size");
  }

  // Restore original position
  if (fseek(file_.get(), current_pos, SEEK_SET) != 0) {
    return IoError(absl::StatusCode::kInternal,
                   "Failed to restore file position");
  }

  return size;
}

absl::Status FileReader::Read(void* buffer, size_t size) const {
  if (size == 0) {
    return absl::OkStatus();
  }
  if (fread(buffer, 1, size, file_.get()) != size) {
    return IoError(absl::StatusCode::kInternal,
                   absl::StrFormat("Failed to read %zu bytes", size));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<uint8_t>> FileReader::ReadBytes(size_t size) const {
  std::vector<uint8_t> buffer(size);
  RETURN_IF_ERROR(Read(buffer.data(), size), "Failed to read into buffer");
  return buffer;
}

absl::StatusOr<std::vector<uint8_t>> FileReader::ReadAll() const {
  RETURN_IF_ERROR(Seek(0), "Failed to rewind file");
  DECLARE_ASSIGN_OR_RETURN(int64_t, size, GetSize());
  return ReadBytes(static_cast<size_t>(size));
}

}  // namespace io
}  // namespace fastoct
