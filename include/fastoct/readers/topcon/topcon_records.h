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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_TOPCON_RECORDS_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_TOPCON_RECORDS_H_

#include <cstdint>
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
#include "fastoct/core/slice.h"
#include "fastoct/core/volume.h"
#include "fastoct/io/byte_cursor.h"

/**
 * @file topcon_records.h
 * @brief Record layouts shared by Topcon FDA and FDS files
 *
 * Both formats start with a 15-byte header:
 *
 * | Offset | Size | Field                        |
 * |--------|------|------------------------------|
 * | 0      | 4    | "FOCT"                       |
 * | 4      | 3    | "FDA" or "FDS"               |
 * | 7      | 4    | version 1 (u32 LE)           |
 * | 11     | 4    | version 2 (u32 LE)           |
 *
 * followed by named records (`u8 name_length`, name, `u32 length`,
 * payload) until a zero name length or the end of the file.
 */

namespace fastoct {
namespace formats {
namespace topcon {

/// @brief Size of the file header; the record directory starts here
inline constexpr uint64_t kHeaderSize = 15;

/// @brief Known record names
enum class TopconRecord : uint32_t {
  kUnknown = 0,
  kFdaFileInfoHeader,
  kFdsFileInfoHeader,
  kPatientInfo02,
  kCaptureInfo02,
  kHwInfo03,
  kParamScan04,
  kImgJpeg,
  kImgFundus,
  kImgTrc02,
  kImgScan03,
  kImgObs,
  kImgMotComp03,
  kImgProjection,
  kContourInfo,
  kRegistInfo,
  kAlignInfo,
};

/// @brief On-disk name of a record
constexpr std::string_view GetName(TopconRecord record) {
  switch (record) {
    case TopconRecord::kUnknown:
      return "";
    case TopconRecord::kFdaFileInfoHeader:
      return "@FDA_FILE_INFO_HEADER";
    case TopconRecord::kFdsFileInfoHeader:
      return "@FDS_FILE_INFO_HEADER";
    case TopconRecord::kPatientInfo02:
      return "@PATIENT_INFO_02";
    case TopconRecord::kCaptureInfo02:
      return "@CAPTURE_INFO_02";
    case TopconRecord::kHwInfo03:
      return "@HW_INFO_03";
    case TopconRecord::kParamScan04:
      return "@PARAM_SCAN_04";
    case TopconRecord::kImgJpeg:
      return "@IMG_JPEG";
    case TopconRecord::kImgFundus:
      return "@IMG_FUNDUS";
    case TopconRecord::kImgTrc02:
      return "@IMG_TRC_02";
    case TopconRecord::kImgScan03:
      return "@IMG_SCAN_03";
    case TopconRecord::kImgObs:
      return "@IMG_OBS";
    case TopconRecord::kImgMotComp03:
      return "@IMG_MOT_COMP_03";
    case TopconRecord::kImgProjection:
      return "@IMG_PROJECTION";
    case TopconRecord::kContourInfo:
      return "@CONTOUR_INFO";
    case TopconRecord::kRegistInfo:
      return "@REGIST_INFO";
    case TopconRecord::kAlignInfo:
      return "@ALIGN_INFO";
  }
  return "";
}

/// @brief Directory type of a record name; unknown names map to kUnknown
[[nodiscard]] uint32_t ClassifyTopconRecord(std::string_view name);

/// @brief Directory type of @p record
constexpr uint32_t ToType(TopconRecord record) {
  return static_cast<uint32_t>(record);
}

/// @brief Parsed file header
struct TopconHeader {
  std::string kind;  ///< "FDA" or "FDS"
  uint32_t version_1 = 0;
  uint32_t version_2 = 0;
};

/// @brief Check the "FOCT" magic and the format kind
/// @param kind Expected kind, "FDA" or "FDS"
/// @retval UnrecognizedFormat if the magic or kind does not match
absl::StatusOr<TopconHeader> ReadTopconHeader(ByteView data,
                                              std::string_view kind);

/// @brief Acquisition-wide metadata of one Topcon file
struct TopconMetadata {
  PatientMetadata patient;
  DeviceMetadata device;
  Laterality laterality = Laterality::kUnknown;
  std::optional<absl::CivilSecond> acquisition_datetime;
};

/// @brief Decode the patient, capture and hardware records
///
/// A missing record leaves its fields absent. A record too short for its
/// layout is reported once; a bad field inside a record is reported and left
/// absent.
TopconMetadata ExtractTopconMetadata(const container::Directory& directory,
                                     const ByteCursor& file,
                                     WarningSink& warnings);

/// @brief Decode every `@CONTOUR_INFO` record into per-slice contours
///
/// Each record names a layer and holds one row of uint16 depths per B-scan.
/// Depth 0xFFFF is unknown and becomes NaN.
std::vector<Contour> ExtractTopconContours(
    const container::Directory& directory, const ByteCursor& file,
    WarningSink& warnings);

/// @brief Decode an `@IMG_FUNDUS` payload (24-byte header + JPEG)
absl::StatusOr<Slice> DecodeFundusJpeg(ByteCursor payload);

/// @brief Decode an `@IMG_OBS` payload (24-byte header + planar BGR)
absl::StatusOr<Slice> DecodeFundusObs(ByteCursor payload);

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_TOPCON_RECORDS_H_
