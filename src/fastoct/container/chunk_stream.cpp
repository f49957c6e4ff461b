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

#include "fastoct/container/chunk_stream.h"

#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastoct/container/directory_parser.h"
#include "fastoct/container/record_layout.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace container {

namespace {

constexpr std::string_view kFileMagic = "CMDb";
constexpr std::string_view kMainDirectoryMagic = "MDbMDir";
constexpr std::string_view kDirectoryMagic = "MDbDir";
constexpr std::string_view kChunkMagic = "MDbData";
constexpr uint64_t kMagicSize = 12;

/// Fields of a 52-byte directory header that drive the walk
struct DirectoryHeader {
  std::string magic;
  uint32_t num_entries = 0;
  uint32_t current = 0;
  uint32_t prev = 0;
};

absl::StatusOr<DirectoryHeader> ReadDirectoryHeader(const ByteCursor& file,
                                                    uint64_t offset) {
  DECLARE_ASSIGN_OR_RETURN(
      ByteCursor, cursor,
      file.Slice(offset, ChunkStream::kDirectoryHeaderSize),
      "Directory header out of bounds");

  DirectoryHeader header;
  ASSIGN_OR_RETURN(header.magic, cursor.ReadFixedString(kMagicSize));
  RETURN_IF_ERROR(cursor.Skip(4 + 10 * 2), "Failed to skip version fields");
  ASSIGN_OR_RETURN(header.num_entries, cursor.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.current, cursor.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.prev, cursor.ReadU32(Endian::kLittle));
  return header;
}

/// Validate the "MDbData" header of the chunk an entry points at
absl::StatusOr<E2eChunk> ReadChunk(const ByteCursor& file,
                                   const DirectoryEntry& entry) {
  const uint64_t position = entry.offset - file.BaseOffset();
  DECLARE_ASSIGN_OR_RETURN(
      ByteCursor, cursor, file.Slice(position, ChunkStream::kChunkHeaderSize),
      "Chunk header out of bounds");

  DECLARE_ASSIGN_OR_RETURN(std::string, magic,
                           cursor.ReadFixedString(kMagicSize));
  if (magic != kChunkMagic) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kMalformedChunkChain, entry.offset,
        absl::StrFormat("Chunk of type %u has magic '%s'", entry.type, magic));
  }

  RETURN_IF_ERROR(cursor.Skip(3 * 4), "Failed to skip chunk fields");
  DECLARE_ASSIGN_OR_RETURN(uint32_t, size, cursor.ReadU32(Endian::kLittle));
  RETURN_IF_ERROR(cursor.Skip(4), "Failed to skip chunk field");

  ChunkKey key;
  ASSIGN_OR_RETURN(key.patient_id, cursor.ReadI32(Endian::kLittle));
  ASSIGN_OR_RETURN(key.study_id, cursor.ReadI32(Endian::kLittle));
  ASSIGN_OR_RETURN(key.series_id, cursor.ReadI32(Endian::kLittle));
  ASSIGN_OR_RETURN(key.slice_id, cursor.ReadI32(Endian::kLittle));
  DECLARE_ASSIGN_OR_RETURN(uint16_t, sub_index,
                           cursor.ReadU16(Endian::kLittle));
  RETURN_IF_ERROR(cursor.Skip(2), "Failed to skip chunk field");
  DECLARE_ASSIGN_OR_RETURN(uint32_t, type, cursor.ReadU32(Endian::kLittle));

  if (type != entry.type) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kMalformedChunkChain, entry.offset,
        absl::StrFormat("Chunk header type %u disagrees with directory "
                        "entry type %u",
                        type, entry.type));
  }

  const uint64_t payload_position = position + ChunkStream::kChunkHeaderSize;
  if (!io::RangeFits(payload_position, size, file.Size())) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, entry.offset,
        absl::StrFormat("Chunk of type %u: payload of %u bytes exceeds "
                        "buffer",
                        type, size));
  }

  E2eChunk chunk;
  chunk.entry = entry;
  chunk.entry.key = key;
  chunk.entry.index = sub_index;
  chunk.payload_offset = file.BaseOffset() + payload_position;
  chunk.payload_length = size;
  return chunk;
}

}  // namespace

bool ChunkStream::CheckSignature(ByteView data) {
  return data.size() >= kFileHeaderSize &&
         std::string_view(reinterpret_cast<const char*>(data.data()),
                          kFileMagic.size()) == kFileMagic;
}

absl::StatusOr<ChunkStream> ChunkStream::Open(const ByteCursor& cursor,
                                              WarningSink& warnings) {
  if (!CheckSignature(cursor.View())) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat,
                                cursor.BaseOffset(),
                                "Missing CMDb file header");
  }

  auto main = ReadDirectoryHeader(cursor, kFileHeaderSize);
  if (!main.ok() || main->magic != kMainDirectoryMagic) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat,
                                cursor.BaseOffset() + kFileHeaderSize,
                                "Missing MDbMDir main directory");
  }

  ChunkStream stream;
  std::set<uint64_t> visited;
  const uint64_t max_blocks = cursor.Size() / kDirectoryHeaderSize;
  DirectoryParseOptions options;
  options.require_entries = false;

  uint64_t current = main->current;
  while (current != 0) {
    const uint64_t absolute = cursor.BaseOffset() + current;
    if (!visited.insert(current).second) {
      warnings.Add(ErrorKind::kMalformedChunkChain,
                   absl::StrFormat("Directory block at %u visited twice; "
                                   "chain is cyclic",
                                   absolute),
                   absolute);
      break;
    }
    if (visited.size() > max_blocks) {
      warnings.Add(ErrorKind::kMalformedChunkChain,
                   absl::StrFormat("Directory chain exceeds %u blocks",
                                   max_blocks),
                   absolute);
      break;
    }

    auto block = ReadDirectoryHeader(cursor, current);
    if (!block.ok()) {
      warnings.Add(ErrorKind::kMalformedChunkChain,
                   absl::StrFormat("Directory block pointer %u is outside "
                                   "the file",
                                   absolute),
                   absolute);
      break;
    }
    if (block->magic != kDirectoryMagic &&
        block->magic != kMainDirectoryMagic) {
      warnings.Add(ErrorKind::kMalformedChunkChain,
                   absl::StrFormat("Directory block at %u has magic '%s'",
                                   absolute, block->magic),
                   absolute);
      break;
    }

    ++stream.num_blocks_;
    VLOG(1) << "E2E directory block at " << absolute << " with "
            << block->num_entries << " entries, prev " << block->prev;

    E2eEntryLayout layout(block->num_entries);
    DECLARE_ASSIGN_OR_RETURN(
        Directory, directory,
        DirectoryParser::Parse(cursor, current + kDirectoryHeaderSize, layout,
                               warnings, options));

    for (const auto& entry : directory.Entries()) {
      auto chunk = ReadChunk(cursor, entry);
      if (!chunk.ok()) {
        warnings.AddStatus(chunk.status(), ErrorKind::kOutOfBounds);
        continue;
      }
      stream.Add(*std::move(chunk));
    }

    current = block->prev;
  }

  VLOG(1) << "E2E chain: " << stream.num_blocks_ << " blocks, "
          << stream.chunks_.size() << " chunks";
  return stream;
}

void ChunkStream::Add(E2eChunk chunk) {
  const size_t position = chunks_.size();
  by_type_[chunk.GetType()].push_back(position);
  by_key_[{chunk.GetType(), chunk.GetKey()}].push_back(position);
  chunks_.push_back(std::move(chunk));
}

std::vector<const E2eChunk*> ChunkStream::Find(uint32_t type) const {
  std::vector<const E2eChunk*> result;
  if (auto it = by_type_.find(type); it != by_type_.end()) {
    result.reserve(it->second.size());
    for (size_t position : it->second) {
      result.push_back(&chunks_[position]);
    }
  }
  return result;
}

std::vector<const E2eChunk*> ChunkStream::Find(uint32_t type,
                                               const ChunkKey& key) const {
  std::vector<const E2eChunk*> result;
  if (auto it = by_key_.find({type, key}); it != by_key_.end()) {
    result.reserve(it->second.size());
    for (size_t position : it->second) {
      result.push_back(&chunks_[position]);
    }
  }
  return result;
}

}  // namespace container
}  // namespace fastoct
