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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_BIOPTIGEN_BIOPTIGEN_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_BIOPTIGEN_BIOPTIGEN_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/container/directory.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/volume.h"
#include "fastoct/format_reader.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file bioptigen.h
 * @brief Bioptigen .oct reader
 *
 * | Offset | Size | Field            |
 * |--------|------|------------------|
 * | 0      | 2    | 0xFFFF           |
 * | 2      | 2    | 0x9205           |
 * | 4      | 2    | format version   |
 *
 * The rest of the file is a flat run of keyed records (`u32 key_length`,
 * key, `u32 data_length`, data). Header keys come first; each frame then
 * starts with an empty `FRAMEDATA` record followed by its own records:
 *
 * - `FRAMEDATETIME`: SYSTEMTIME (eight u16: year, month, weekday, day,
 *   hour, minute, second, millisecond)
 * - `FRAMETIMESTAMP`: f64 milliseconds since the start of the scan
 * - `FRAMELINES`: u32 A-scans in this frame (defaults to `LINECOUNT`)
 * - `FRAMESAMPLES`: `lines x LINELENGTH` uint16 samples, one A-scan after
 *   the other
 */

namespace fastoct {
namespace formats {
namespace bioptigen {

inline constexpr uint16_t kMagic = 0xFFFF;
inline constexpr uint16_t kFormatId = 0x9205;

/// @brief Size of the signature; the keyed records start here
inline constexpr uint64_t kSignatureSize = 6;

/// @brief Known record keys
enum class BioptigenRecord : uint32_t {
  kUnknown = 0,
  kFrameCount,
  kLineCount,
  kLineLength,
  kSampleFormat,
  kDescription,
  kScanDepth,
  kScanLength,
  kFrameData,
  kFrameDateTime,
  kFrameTimestamp,
  kFrameLines,
  kFrameSamples,
};

constexpr std::string_view GetName(BioptigenRecord record) {
  switch (record) {
    case BioptigenRecord::kUnknown:
      return "";
    case BioptigenRecord::kFrameCount:
      return "FRAMECOUNT";
    case BioptigenRecord::kLineCount:
      return "LINECOUNT";
    case BioptigenRecord::kLineLength:
      return "LINELENGTH";
    case BioptigenRecord::kSampleFormat:
      return "SAMPLEFORMAT";
    case BioptigenRecord::kDescription:
      return "DESCRIPTION";
    case BioptigenRecord::kScanDepth:
      return "SCANDEPTH";
    case BioptigenRecord::kScanLength:
      return "SCANLENGTH";
    case BioptigenRecord::kFrameData:
      return "FRAMEDATA";
    case BioptigenRecord::kFrameDateTime:
      return "FRAMEDATETIME";
    case BioptigenRecord::kFrameTimestamp:
      return "FRAMETIMESTAMP";
    case BioptigenRecord::kFrameLines:
      return "FRAMELINES";
    case BioptigenRecord::kFrameSamples:
      return "FRAMESAMPLES";
  }
  return "";
}

constexpr uint32_t ToType(BioptigenRecord record) {
  return static_cast<uint32_t>(record);
}

/// @brief Directory type of a record key; unknown keys map to kUnknown
[[nodiscard]] uint32_t ClassifyBioptigenRecord(std::string_view key);

/// @brief Scan parameters from the header records
struct BioptigenHeader {
  uint16_t version = 0;
  std::optional<uint32_t> frame_count;
  std::optional<uint32_t> line_count;   ///< A-scans per frame
  std::optional<uint32_t> line_length;  ///< Samples per A-scan
  std::optional<uint32_t> sample_format;
  std::optional<std::string> description;
  std::optional<double> scan_depth;   ///< mm
  std::optional<double> scan_length;  ///< mm
};

/// @brief Check the signature and return the format version
/// @retval UnrecognizedFormat if the magic does not match
absl::StatusOr<uint16_t> ReadBioptigenSignature(ByteView data);

/// @brief Bioptigen .oct reader
class BioptigenReader : public FormatReader,
                        public ReaderFactory<BioptigenReader> {
 public:
  static constexpr const char* kManufacturer = "Bioptigen";

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "Bioptigen";
  }

  [[nodiscard]] absl::StatusOr<DecodeResult<OctVolume>> ReadOctVolumes()
      const override;

  /// @brief Always empty; Bioptigen files hold no fundus image
  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadFundusImages()
      const override;

  [[nodiscard]] const BioptigenHeader& GetHeader() const { return header_; }

  [[nodiscard]] const container::Directory& GetDirectory() const {
    return directory_;
  }

 private:
  friend class ReaderFactory<BioptigenReader>;

  BioptigenReader(RawBuffer buffer, const ReadOptions& options,
                  BioptigenHeader header, container::Directory directory,
                  std::vector<Warning> open_warnings);

  /// @brief Hook 1: 0xFFFF 0x9205 signature
  static absl::Status ValidateSignature(ByteView data);

  /// @brief Hook 2: walk the keyed records and decode the header keys
  static absl::StatusOr<std::unique_ptr<BioptigenReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);

  BioptigenHeader header_;
  container::Directory directory_;
  std::vector<Warning> open_warnings_;
};

/// @brief Registry descriptor for Bioptigen .oct files
FormatDescriptor CreateBioptigenFormatDescriptor();

}  // namespace bioptigen
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_BIOPTIGEN_BIOPTIGEN_H_
