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

#include "fastoct/readers/topcon/topcon_records.h"

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/metadata/dates.h"
#include "fastoct/metadata/field.h"
#include "fastoct/metadata/field_rule.h"
#include "fastoct/pixel/jpeg_decoder.h"
#include "fastoct/pixel/raw_plane.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace topcon {

namespace {

constexpr std::string_view kMagic = "FOCT";

constexpr std::array kKnownRecords = {
    TopconRecord::kFdaFileInfoHeader, TopconRecord::kFdsFileInfoHeader,
    TopconRecord::kPatientInfo02,     TopconRecord::kCaptureInfo02,
    TopconRecord::kHwInfo03,          TopconRecord::kParamScan04,
    TopconRecord::kImgJpeg,           TopconRecord::kImgFundus,
    TopconRecord::kImgTrc02,          TopconRecord::kImgScan03,
    TopconRecord::kImgObs,            TopconRecord::kImgMotComp03,
    TopconRecord::kImgProjection,     TopconRecord::kContourInfo,
    TopconRecord::kRegistInfo,        TopconRecord::kAlignInfo,
};

// Record layouts
constexpr uint64_t kPatientInfoSize = 32 * 3 + 8 + 1 + 3 * 2;
constexpr uint64_t kCaptureInfoSize = 2 + 52 + 6 * 2;
constexpr uint64_t kHwInfoSize = 16 * 5;
constexpr uint64_t kContourHeaderSize = 20 + 2 + 3 * 4;

/// Depth marking an A-scan without segmentation
constexpr uint16_t kUnknownDepth = 0xFFFF;

/// Eye codes of @CAPTURE_INFO_02
constexpr uint16_t kEyeRight = 0;
constexpr uint16_t kEyeLeft = 1;

absl::Status RequireSize(const ByteCursor& payload, uint64_t size) {
  if (payload.Size() < size) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, payload.BaseOffset(),
        absl::StrFormat("record holds %u bytes, layout needs %u",
                        payload.Size(), size));
  }
  return absl::OkStatus();
}

std::optional<std::string> JoinName(const std::optional<std::string>& first,
                                    const std::optional<std::string>& last) {
  if (first.has_value() && last.has_value()) {
    return absl::StrCat(*first, " ", *last);
  }
  return first.has_value() ? first : last;
}

absl::Status DecodePatientInfo(ByteCursor& payload, TopconMetadata& meta,
                               WarningSink& warnings) {
  RETURN_IF_ERROR(RequireSize(payload, kPatientInfoSize),
                  "Patient record is truncated");
  const uint64_t offset = payload.BaseOffset();
  PatientMetadata& patient = meta.patient;

  patient.patient_id = TextField(payload.ReadFixedString(32))
                           .Resolve("patient_id", warnings, offset);
  patient.first_name =
      TextField(payload.ReadFixedString(32, TextEncoding::kLatin1))
          .Resolve("first_name", warnings, offset);
  patient.surname =
      TextField(payload.ReadFixedString(32, TextEncoding::kLatin1))
          .Resolve("surname", warnings, offset);
  patient.name = JoinName(patient.first_name, patient.surname);

  RETURN_IF_ERROR(payload.Skip(8), "Failed to skip reserved bytes");
  DECLARE_ASSIGN_OR_RETURN(uint8_t, birthdate_valid, payload.ReadU8());
  DECLARE_ASSIGN_OR_RETURN(uint16_t, year, payload.ReadU16(Endian::kLittle));
  DECLARE_ASSIGN_OR_RETURN(uint16_t, month, payload.ReadU16(Endian::kLittle));
  DECLARE_ASSIGN_OR_RETURN(uint16_t, day, payload.ReadU16(Endian::kLittle));
  if (birthdate_valid != 0) {
    patient.birthdate = metadata::MakeCivilDay(year, month, day)
                            .Resolve("birthdate", warnings, offset);
  }
  return absl::OkStatus();
}

absl::Status DecodeCaptureInfo(ByteCursor& payload, TopconMetadata& meta,
                               WarningSink& warnings) {
  RETURN_IF_ERROR(RequireSize(payload, kCaptureInfoSize),
                  "Capture record is truncated");
  DECLARE_ASSIGN_OR_RETURN(uint16_t, eye, payload.ReadU16(Endian::kLittle));
  switch (eye) {
    case kEyeRight:
      meta.laterality = Laterality::kRight;
      break;
    case kEyeLeft:
      meta.laterality = Laterality::kLeft;
      break;
    default:
      warnings.Add(ErrorKind::kMetadataField,
                   absl::StrFormat("Field laterality: unknown eye code %u",
                                   eye),
                   payload.BaseOffset());
      break;
  }

  RETURN_IF_ERROR(payload.Skip(52), "Failed to skip reserved bytes");
  std::array<uint16_t, 6> parts{};
  for (auto& part : parts) {
    ASSIGN_OR_RETURN(part, payload.ReadU16(Endian::kLittle));
  }
  meta.acquisition_datetime =
      metadata::MakeCivilSecond(parts[0], parts[1], parts[2], parts[3],
                                parts[4], parts[5])
          .Resolve("acquisition_datetime", warnings, payload.BaseOffset());
  return absl::OkStatus();
}

absl::Status DecodeHwInfo(ByteCursor& payload, TopconMetadata& meta,
                          WarningSink& warnings) {
  RETURN_IF_ERROR(RequireSize(payload, kHwInfoSize),
                  "Hardware record is truncated");
  const uint64_t offset = payload.BaseOffset();
  DeviceMetadata& device = meta.device;

  device.model = TextField(payload.ReadFixedString(16))
                     .Resolve("model", warnings, offset);
  RETURN_IF_ERROR(payload.Skip(16), "Failed to skip reserved bytes");
  device.serial_number = TextField(payload.ReadFixedString(16))
                             .Resolve("serial_number", warnings, offset);
  RETURN_IF_ERROR(payload.Skip(16), "Failed to skip reserved bytes");
  device.software_version = TextField(payload.ReadFixedString(16))
                                .Resolve("software_version", warnings, offset);
  return absl::OkStatus();
}

constexpr metadata::FieldRule<TopconMetadata> kMetadataRules[] = {
    {ToType(TopconRecord::kPatientInfo02),
     GetName(TopconRecord::kPatientInfo02), DecodePatientInfo},
    {ToType(TopconRecord::kCaptureInfo02),
     GetName(TopconRecord::kCaptureInfo02), DecodeCaptureInfo},
    {ToType(TopconRecord::kHwInfo03), GetName(TopconRecord::kHwInfo03),
     DecodeHwInfo},
};

/// @brief Fundus header shared by @IMG_FUNDUS and @IMG_OBS
struct FundusHeader {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t bits_per_pixel = 0;
  uint32_t size = 0;
};

absl::StatusOr<FundusHeader> ReadFundusHeader(ByteCursor& payload) {
  FundusHeader header;
  ASSIGN_OR_RETURN(header.width, payload.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.height, payload.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.bits_per_pixel, payload.ReadU32(Endian::kLittle));
  RETURN_IF_ERROR(payload.Skip(8), "Failed to skip fundus header");
  ASSIGN_OR_RETURN(header.size, payload.ReadU32(Endian::kLittle));
  return header;
}

absl::Status CheckFundusSize(const Slice& image, const FundusHeader& header,
                             uint64_t offset) {
  if (image.GetWidth() != header.width ||
      image.GetHeight() != header.height) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kPixelDecode, offset,
        absl::StrFormat("Fundus image is %ux%u, header states %ux%u",
                        image.GetWidth(), image.GetHeight(), header.width,
                        header.height));
  }
  return absl::OkStatus();
}

}  // namespace

uint32_t ClassifyTopconRecord(std::string_view name) {
  for (TopconRecord record : kKnownRecords) {
    if (GetName(record) == name) {
      return ToType(record);
    }
  }
  return ToType(TopconRecord::kUnknown);
}

absl::StatusOr<TopconHeader> ReadTopconHeader(ByteView data,
                                              std::string_view kind) {
  ByteCursor cursor(data);
  auto magic = cursor.ReadFixedString(kMagic.size());
  auto found_kind = cursor.ReadFixedString(3);
  if (!magic.ok() || !found_kind.ok() || *magic != kMagic ||
      *found_kind != kind) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kUnrecognizedFormat, 0,
        absl::StrFormat("Not a Topcon %s file (missing FOCT%s magic)", kind,
                        kind));
  }

  TopconHeader header;
  header.kind = *std::move(found_kind);
  auto version_1 = cursor.ReadU32(Endian::kLittle);
  auto version_2 = cursor.ReadU32(Endian::kLittle);
  if (!version_1.ok() || !version_2.ok()) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, 0,
                                "Topcon header is truncated");
  }
  header.version_1 = *version_1;
  header.version_2 = *version_2;
  return header;
}

TopconMetadata ExtractTopconMetadata(const container::Directory& directory,
                                     const ByteCursor& file,
                                     WarningSink& warnings) {
  TopconMetadata meta;
  meta.device.manufacturer = "Topcon";
  metadata::ApplyFieldRules<TopconMetadata>(kMetadataRules, directory, file,
                                            meta, warnings);
  return meta;
}

std::vector<Contour> ExtractTopconContours(
    const container::Directory& directory, const ByteCursor& file,
    WarningSink& warnings) {
  std::vector<Contour> contours;
  for (const auto* entry :
       directory.FindAll(ToType(TopconRecord::kContourInfo))) {
    auto decoded = [&]() -> absl::Status {
      DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload,
                               file.Slice(entry->offset, entry->length));
      RETURN_IF_ERROR(RequireSize(payload, kContourHeaderSize),
                      "Contour record is truncated");
      DECLARE_ASSIGN_OR_RETURN(std::string, layer_name,
                               payload.ReadFixedString(20));
      DECLARE_ASSIGN_OR_RETURN(uint16_t, sample_type,
                               payload.ReadU16(Endian::kLittle));
      DECLARE_ASSIGN_OR_RETURN(uint32_t, width,
                               payload.ReadU32(Endian::kLittle));
      DECLARE_ASSIGN_OR_RETURN(uint32_t, rows,
                               payload.ReadU32(Endian::kLittle));
      RETURN_IF_ERROR(payload.Skip(4), "Failed to skip contour size");
      if (sample_type != 0) {
        return MAKE_DECODE_ERROR_AT(
            ErrorKind::kMetadataField, entry->offset,
            absl::StrFormat("Contour '%s' has unsupported sample type %u",
                            layer_name, sample_type));
      }

      if (width == 0) {
        return MAKE_DECODE_ERROR_AT(
            ErrorKind::kMetadataField, entry->offset,
            absl::StrFormat("Contour '%s' has zero width", layer_name));
      }
      // rows <= remaining / (2 * width) keeps the product from wrapping
      const uint64_t row_bytes = static_cast<uint64_t>(width) * 2;
      if (rows > payload.Remaining() / row_bytes) {
        return MAKE_DECODE_ERROR_AT(
            ErrorKind::kOutOfBounds, entry->offset,
            absl::StrFormat("Contour '%s': %u rows of %u depths exceed the "
                            "%u byte record",
                            layer_name, rows, width, payload.Remaining()));
      }
      DECLARE_ASSIGN_OR_RETURN(ByteView, samples,
                               payload.ReadBytes(row_bytes * rows),
                               "Contour samples exceed the record");
      ByteCursor reader(samples, entry->offset + kContourHeaderSize);
      contours.reserve(contours.size() + rows);
      for (uint32_t row = 0; row < rows; ++row) {
        Contour contour;
        contour.layer_name = layer_name;
        contour.slice_index = row;
        contour.depths.reserve(width);
        for (uint32_t x = 0; x < width; ++x) {
          DECLARE_ASSIGN_OR_RETURN(uint16_t, depth,
                                   reader.ReadU16(Endian::kLittle));
          contour.depths.push_back(
              depth == kUnknownDepth ? std::numeric_limits<float>::quiet_NaN()
                                     : static_cast<float>(depth));
        }
        contours.push_back(std::move(contour));
      }
      VLOG(1) << "Contour '" << layer_name << "': " << rows << " rows of "
              << width << " depths";
      return absl::OkStatus();
    }();
    if (!decoded.ok()) {
      Warning warning = Warning::FromStatus(decoded, ErrorKind::kMetadataField);
      warning.message =
          absl::StrFormat("Record %s: %s",
                          GetName(TopconRecord::kContourInfo), warning.message);
      if (!warning.offset.has_value()) {
        warning.offset = entry->offset;
      }
      warnings.Add(std::move(warning));
    }
  }
  return contours;
}

absl::StatusOr<Slice> DecodeFundusJpeg(ByteCursor payload) {
  const uint64_t offset = payload.BaseOffset();
  DECLARE_ASSIGN_OR_RETURN(FundusHeader, header, ReadFundusHeader(payload),
                           "Failed to read fundus header");
  DECLARE_ASSIGN_OR_RETURN(ByteView, data, payload.ReadBytes(header.size),
                           "Fundus JPEG exceeds the record");
  DECLARE_ASSIGN_OR_RETURN(Slice, image,
                           pixel::DecodeCompressedPlane(data),
                           "Failed to decode fundus JPEG");
  RETURN_IF_ERROR(CheckFundusSize(image, header, offset),
                  "Fundus geometry mismatch");
  return image;
}

absl::StatusOr<Slice> DecodeFundusObs(ByteCursor payload) {
  DECLARE_ASSIGN_OR_RETURN(FundusHeader, header, ReadFundusHeader(payload),
                           "Failed to read fundus header");
  DECLARE_ASSIGN_OR_RETURN(ByteView, data, payload.ReadBytes(header.size),
                           "Fundus planes exceed the record");
  return pixel::DecodePlanarBgr(data, header.width, header.height);
}

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct
