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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_OPTOVUE_OPTOVUE_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_OPTOVUE_OPTOVUE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/civil_time.h"
#include "fastoct/container/directory.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/metadata.h"
#include "fastoct/core/volume.h"
#include "fastoct/format_reader.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file optovue.h
 * @brief Optovue .OCT reader
 *
 * The file opens with keyed records (`u32 key_length`, key,
 * `u32 value_length`, value) whose values are ASCII text. The first record
 * is the signature: key "OCT", value the format version. The header ends
 * with an empty "HeaderEnd" record; raw frames follow directly, each
 * `Width` A-scans of `Height` uint16 little-endian samples stored one A-scan
 * after the other.
 *
 * | Key          | Value                         |
 * |--------------|-------------------------------|
 * | Width        | A-scans per frame             |
 * | Height       | samples per A-scan            |
 * | Frames       | frame count (optional)        |
 * | PatientID    | text                          |
 * | FirstName    | text                          |
 * | LastName     | text                          |
 * | DOB          | YYYYMMDD                      |
 * | Sex          | text                          |
 * | Eye          | OD / OS                       |
 * | ScanDate     | YYYYMMDD                      |
 * | ScanTime     | HHMMSS                        |
 * | Device       | model name                    |
 * | SerialNumber | text                          |
 */

namespace fastoct {
namespace formats {
namespace optovue {

/// @brief Known header keys
enum class OptovueRecord : uint32_t {
  kUnknown = 0,
  kSignature,
  kWidth,
  kHeight,
  kFrames,
  kPatientId,
  kFirstName,
  kLastName,
  kBirthDate,
  kSex,
  kEye,
  kScanDate,
  kScanTime,
  kDevice,
  kSerialNumber,
  kHeaderEnd,
};

constexpr std::string_view GetName(OptovueRecord record) {
  switch (record) {
    case OptovueRecord::kUnknown:
      return "";
    case OptovueRecord::kSignature:
      return "OCT";
    case OptovueRecord::kWidth:
      return "Width";
    case OptovueRecord::kHeight:
      return "Height";
    case OptovueRecord::kFrames:
      return "Frames";
    case OptovueRecord::kPatientId:
      return "PatientID";
    case OptovueRecord::kFirstName:
      return "FirstName";
    case OptovueRecord::kLastName:
      return "LastName";
    case OptovueRecord::kBirthDate:
      return "DOB";
    case OptovueRecord::kSex:
      return "Sex";
    case OptovueRecord::kEye:
      return "Eye";
    case OptovueRecord::kScanDate:
      return "ScanDate";
    case OptovueRecord::kScanTime:
      return "ScanTime";
    case OptovueRecord::kDevice:
      return "Device";
    case OptovueRecord::kSerialNumber:
      return "SerialNumber";
    case OptovueRecord::kHeaderEnd:
      return "HeaderEnd";
  }
  return "";
}

constexpr uint32_t ToType(OptovueRecord record) {
  return static_cast<uint32_t>(record);
}

/// @brief Directory type of a header key; unknown keys map to kUnknown
[[nodiscard]] uint32_t ClassifyOptovueRecord(std::string_view key);

/// @brief Decoded header
struct OptovueHeader {
  std::string version;
  std::optional<uint32_t> width;   ///< A-scans per frame
  std::optional<uint32_t> height;  ///< Samples per A-scan
  std::optional<uint32_t> frames;
  PatientMetadata patient;
  DeviceMetadata device;
  Laterality laterality = Laterality::kUnknown;
  std::optional<std::string> scan_date;
  std::optional<std::string> scan_time;
  std::optional<absl::CivilSecond> acquisition_datetime;
};

/// @brief Check the "OCT" signature record and return the version text
/// @retval UnrecognizedFormat if the first record is not the signature
absl::StatusOr<std::string> ReadOptovueSignature(ByteView data);

/// @brief Optovue .OCT reader
class OptovueReader : public FormatReader,
                      public ReaderFactory<OptovueReader> {
 public:
  static constexpr const char* kManufacturer = "Optovue";

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "Optovue";
  }

  [[nodiscard]] absl::StatusOr<DecodeResult<OctVolume>> ReadOctVolumes()
      const override;

  /// @brief Always empty; Optovue .OCT files hold no fundus image
  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadFundusImages()
      const override;

  [[nodiscard]] const OptovueHeader& GetHeader() const { return header_; }

  /// @brief Absolute offset of the first frame
  [[nodiscard]] uint64_t GetFrameOffset() const { return frame_offset_; }

 private:
  friend class ReaderFactory<OptovueReader>;

  OptovueReader(RawBuffer buffer, const ReadOptions& options,
                OptovueHeader header, uint64_t frame_offset,
                std::vector<Warning> open_warnings);

  /// @brief Hook 1: "OCT" signature record
  static absl::Status ValidateSignature(ByteView data);

  /// @brief Hook 2: decode the header up to "HeaderEnd"
  static absl::StatusOr<std::unique_ptr<OptovueReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);

  OptovueHeader header_;
  uint64_t frame_offset_ = 0;
  std::vector<Warning> open_warnings_;
};

/// @brief Registry descriptor for Optovue .OCT files
FormatDescriptor CreateOptovueFormatDescriptor();

}  // namespace optovue
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_OPTOVUE_OPTOVUE_H_
