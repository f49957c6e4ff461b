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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_HEIDELBERG_E2E_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_HEIDELBERG_E2E_H_

#include <memory>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/container/chunk_stream.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/volume.h"
#include "fastoct/format_reader.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file e2e.h
 * @brief Heidelberg Engineering .e2e reader
 *
 * An E2E file can hold several patients, studies and series. Chunks are
 * grouped by their series key; each series with OCT image chunks becomes
 * one volume named "<patient>_<study>_<series>" and each fundus image chunk
 * becomes one FundusImage named after its series (with a "_<n>" suffix for
 * the second and later images of the same series).
 *
 * - Patient data (chunk 9) is shared by every series of that patient id
 * - Laterality (11) and acquisition time (10004) belong to one series
 * - Contours (10019) are attached to the volume of their series
 *
 * Example usage:
 * ```cpp
 * ASSIGN_OR_RETURN(auto reader, E2eReader::Open("exam.e2e"));
 * ASSIGN_OR_RETURN(auto volumes, reader->ReadOctVolumes());
 * for (const auto& [volume, warnings] : volumes.items) {
 *   ...
 * }
 * ```
 */

namespace fastoct {
namespace formats {
namespace heidelberg {

/// @brief Heidelberg .e2e reader
class E2eReader : public FormatReader, public ReaderFactory<E2eReader> {
 public:
  static constexpr const char* kManufacturer = "Heidelberg Engineering";

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "E2E";
  }

  [[nodiscard]] absl::StatusOr<DecodeResult<OctVolume>> ReadOctVolumes()
      const override;

  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadFundusImages()
      const override;

  /// @brief Chunks found while walking the directory chain
  [[nodiscard]] const ChunkStream& GetChunks() const { return chunks_; }

 private:
  friend class ReaderFactory<E2eReader>;

  E2eReader(RawBuffer buffer, const ReadOptions& options, ChunkStream chunks,
            std::vector<Warning> chain_warnings);

  /// @brief Hook 1: "CMDb" magic
  static absl::Status ValidateSignature(ByteView data);

  /// @brief Hook 2: walk the directory chain
  static absl::StatusOr<std::unique_ptr<E2eReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);

  ChunkStream chunks_;
  std::vector<Warning> chain_warnings_;
};

/// @brief Registry descriptor for .e2e files
FormatDescriptor CreateE2eFormatDescriptor();

}  // namespace heidelberg
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_HEIDELBERG_E2E_H_
