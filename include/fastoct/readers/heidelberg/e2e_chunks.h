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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_HEIDELBERG_E2E_CHUNKS_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_HEIDELBERG_E2E_CHUNKS_H_

#include <cstdint>
#include <optional>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/time/civil_time.h"
#include "fastoct/container/chunk_stream.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/metadata.h"
#include "fastoct/core/slice.h"
#include "fastoct/core/volume.h"
#include "fastoct/io/byte_cursor.h"

/**
 * @file e2e_chunks.h
 * @brief Payload layouts of the E2E chunk types fastoct decodes
 *
 * | Type       | Payload                                                   |
 * |------------|-----------------------------------------------------------|
 * | 9          | first[31], surname[66], u32 birthdate, sex[1], id[25]     |
 * | 11         | 14 unknown bytes, u8 'R'/'L'                              |
 * | 10004      | B-scan metadata, u64 acquisition time at offset 88        |
 * | 10019      | u32, u32 layer id, u32, u32 width, float32 depths[width]  |
 * | 0x40000000 | u32 size, type, unknown, width, height; then samples      |
 *
 * Image chunks with sub-index 0 are 8-bit fundus images of height x width.
 * Sub-index 1 holds one B-scan of Heidelberg mini-float samples with
 * `width` rows and `height` columns.
 */

namespace fastoct {
namespace formats {
namespace heidelberg {

/// @brief Known chunk types
enum class E2eChunkType : uint32_t {
  kUnknown = 0,
  kPatient = 9,
  kLaterality = 11,
  kBscanMetadata = 10004,
  kContour = 10019,
  kImage = 0x40000000,
};

constexpr std::string_view GetName(E2eChunkType type) {
  switch (type) {
    case E2eChunkType::kUnknown:
      return "unknown";
    case E2eChunkType::kPatient:
      return "patient";
    case E2eChunkType::kLaterality:
      return "laterality";
    case E2eChunkType::kBscanMetadata:
      return "B-scan metadata";
    case E2eChunkType::kContour:
      return "contour";
    case E2eChunkType::kImage:
      return "image";
  }
  return "unknown";
}

constexpr uint32_t ToType(E2eChunkType type) {
  return static_cast<uint32_t>(type);
}

/// @brief Map a raw chunk type onto the known types; others are kUnknown
[[nodiscard]] E2eChunkType ClassifyE2eChunk(uint32_t type);

/// @brief Image chunk sub-indices
enum class E2eImageKind : int64_t {
  kFundus = 0,
  kOct = 1,
};

/// @brief Header in front of the samples of an image chunk
struct E2eImageHeader {
  static constexpr uint64_t kSize = 20;

  uint32_t size = 0;
  uint32_t type = 0;
  uint32_t width = 0;
  uint32_t height = 0;
};

/// @brief Acquisition metadata of one series
struct E2eSeriesMetadata {
  Laterality laterality = Laterality::kUnknown;
  std::optional<absl::CivilSecond> acquisition_datetime;
};

/// @brief Payload of @p chunk as a cursor reporting absolute offsets
absl::StatusOr<ByteCursor> ChunkPayload(const E2eChunk& chunk,
                                        const ByteCursor& file);

/// @brief Slice position encoded in a key: `slice_id / 2 - 1`
[[nodiscard]] int64_t E2eSliceIndex(const container::ChunkKey& key);

/// @brief Decode a patient chunk (type 9) into @p patient
///
/// A bad field is reported and left absent; an unreadable chunk is reported
/// once as a MetadataFieldError.
void ApplyPatientChunk(const E2eChunk& chunk, const ByteCursor& file,
                       PatientMetadata& patient, WarningSink& warnings);

/// @brief Merge a laterality (11) or B-scan metadata (10004) chunk into
///        @p series
///
/// The first recorded laterality and the earliest acquisition time win.
/// Chunks of other types are ignored.
void ApplySeriesChunk(const E2eChunk& chunk, const ByteCursor& file,
                      E2eSeriesMetadata& series, WarningSink& warnings);

/// @brief Decode a contour chunk (10019)
///
/// The layer is named "contour<id>". Depths below 1e-9 and FLT_MAX are
/// unknown and become NaN.
/// @retval MetadataFieldError if the chunk names no valid slice
absl::StatusOr<Contour> DecodeE2eContour(const E2eChunk& chunk,
                                         const ByteCursor& file);

/// @brief Decode an OCT image chunk (sub-index 1) into a float32 B-scan
absl::StatusOr<Slice> DecodeE2eBscan(const E2eChunk& chunk,
                                     const ByteCursor& file);

/// @brief Decode a fundus image chunk (sub-index 0) into an 8-bit plane
absl::StatusOr<Slice> DecodeE2eFundus(const E2eChunk& chunk,
                                      const ByteCursor& file);

}  // namespace heidelberg
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_HEIDELBERG_E2E_CHUNKS_H_
