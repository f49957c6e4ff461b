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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_CHUNK_STREAM_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_CHUNK_STREAM_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/container/directory.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/io/byte_cursor.h"

/**
 * @file chunk_stream.h
 * @brief Heidelberg E2E directory chain
 *
 * An E2E file starts with a 36-byte "CMDb" header and a 52-byte "MDbMDir"
 * main directory. The main directory points at the newest directory block;
 * every block lists up to `num_entries` 44-byte entries and links to the
 * previous block. Each entry points at a chunk that starts with a 60-byte
 * "MDbData" header.
 */

namespace fastoct {
namespace container {

/// @brief One validated E2E chunk
struct E2eChunk {
  /// @brief Entry as listed in the directory. `offset` is the position of the
  ///        chunk header, `key` is taken from the chunk header and `index`
  ///        holds the chunk's sub-index (`ind`).
  DirectoryEntry entry;

  /// @brief Absolute position of the data following the chunk header
  uint64_t payload_offset = 0;
  uint64_t payload_length = 0;

  [[nodiscard]] uint32_t GetType() const { return entry.type; }
  [[nodiscard]] const ChunkKey& GetKey() const { return *entry.key; }
  [[nodiscard]] int64_t GetSubIndex() const { return entry.index.value_or(0); }
};

/// @brief Chunks of an E2E file in chain traversal order
///
/// The chain is walked from the head block following `prev` pointers. A
/// block visited twice, a pointer outside the buffer or a block without
/// directory magic ends the walk with a MalformedChunkChain warning; chunks
/// found so far are kept.
class ChunkStream {
 public:
  static constexpr uint64_t kFileHeaderSize = 36;
  static constexpr uint64_t kDirectoryHeaderSize = 52;
  static constexpr uint64_t kChunkHeaderSize = 60;

  /// @brief True if @p data starts with the "CMDb" file magic
  [[nodiscard]] static bool CheckSignature(ByteView data);

  /// @brief Walk the directory chain of a whole-file cursor
  /// @retval UnrecognizedFormat if the file or main directory header is
  ///         missing
  static absl::StatusOr<ChunkStream> Open(const ByteCursor& cursor,
                                          WarningSink& warnings);

  [[nodiscard]] const std::vector<E2eChunk>& Chunks() const { return chunks_; }

  /// @brief Chunks of @p type in traversal order
  [[nodiscard]] std::vector<const E2eChunk*> Find(uint32_t type) const;

  /// @brief Chunks of @p type with exactly @p key, in traversal order
  [[nodiscard]] std::vector<const E2eChunk*> Find(uint32_t type,
                                                  const ChunkKey& key) const;

  /// @brief Number of directory blocks that were walked
  [[nodiscard]] size_t NumBlocks() const { return num_blocks_; }

  [[nodiscard]] size_t size() const { return chunks_.size(); }
  [[nodiscard]] bool empty() const { return chunks_.empty(); }

 private:
  ChunkStream() = default;

  void Add(E2eChunk chunk);

  std::vector<E2eChunk> chunks_;
  std::map<uint32_t, std::vector<size_t>> by_type_;
  std::map<std::pair<uint32_t, ChunkKey>, std::vector<size_t>> by_key_;
  size_t num_blocks_ = 0;
};

}  // namespace container

using container::ChunkStream;
using container::E2eChunk;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CONTAINER_CHUNK_STREAM_H_
