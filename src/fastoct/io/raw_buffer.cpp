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

#include "fastoct/io/raw_buffer.h"

#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "fastoct/io/file_reader.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace io {

absl::StatusOr<RawBuffer> RawBuffer::Load(const std::filesystem::path& path) {
  DECLARE_ASSIGN_OR_RETURN(FileReader, reader, FileReader::Open(path),
                           "Failed to open input file");
  DECLARE_ASSIGN_OR_RETURN(std::vector<uint8_t>, bytes, reader.ReadAll(),
                           "Failed to read input file");
  VLOG(1) << "Loaded " << bytes.size() << " bytes from " << path.string();
  return RawBuffer(std::move(bytes));
}

}  // namespace io
}  // namespace fastoct
