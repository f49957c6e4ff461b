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

#include "fastoct/readers/optovue/optovue.h"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "fastoct/container/directory_parser.h"
#include "fastoct/container/record_layout.h"
#include "fastoct/errors.h"
#include "fastoct/metadata/dates.h"
#include "fastoct/metadata/field.h"
#include "fastoct/metadata/field_rule.h"
#include "fastoct/pixel/raw_plane.h"
#include "fastoct/pixel/volume_assembler.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace optovue {

namespace {

constexpr const char* kVolumeId = "volume_0";

constexpr OptovueRecord kKnownRecords[] = {
    OptovueRecord::kSignature,   OptovueRecord::kWidth,
    OptovueRecord::kHeight,      OptovueRecord::kFrames,
    OptovueRecord::kPatientId,   OptovueRecord::kFirstName,
    OptovueRecord::kLastName,    OptovueRecord::kBirthDate,
    OptovueRecord::kSex,         OptovueRecord::kEye,
    OptovueRecord::kScanDate,    OptovueRecord::kScanTime,
    OptovueRecord::kDevice,      OptovueRecord::kSerialNumber,
    OptovueRecord::kHeaderEnd,
};

absl::StatusOr<std::string> ReadValue(ByteCursor& payload) {
  return payload.ReadFixedString(payload.Size());
}

Field<uint32_t> ParseCount(absl::StatusOr<std::string> text) {
  if (!text.ok()) {
    return Field<uint32_t>::Error(text.status());
  }
  if (text->empty()) {
    return Field<uint32_t>::Absent();
  }
  uint32_t value = 0;
  if (!absl::SimpleAtoi(*text, &value)) {
    return Field<uint32_t>::Error(MAKE_DECODE_ERROR(
        ErrorKind::kMetadataField,
        absl::StrFormat("'%s' is not a count", *text)));
  }
  return Field<uint32_t>::Value(value);
}

template <OptovueRecord Record, std::optional<uint32_t> OptovueHeader::*Member>
absl::Status DecodeCount(ByteCursor& payload, OptovueHeader& header,
                         WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.*Member =
      ParseCount(ReadValue(payload)).Resolve(GetName(Record), warnings, offset);
  return absl::OkStatus();
}

template <OptovueRecord Record,
          std::optional<std::string> OptovueHeader::*Member>
absl::Status DecodeText(ByteCursor& payload, OptovueHeader& header,
                        WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.*Member =
      TextField(ReadValue(payload)).Resolve(GetName(Record), warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodePatientId(ByteCursor& payload, OptovueHeader& header,
                             WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.patient.patient_id =
      TextField(ReadValue(payload)).Resolve("patient_id", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeFirstName(ByteCursor& payload, OptovueHeader& header,
                             WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.patient.first_name =
      TextField(ReadValue(payload)).Resolve("first_name", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeLastName(ByteCursor& payload, OptovueHeader& header,
                            WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.patient.surname =
      TextField(ReadValue(payload)).Resolve("surname", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeSex(ByteCursor& payload, OptovueHeader& header,
                       WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.patient.sex =
      TextField(ReadValue(payload)).Resolve("sex", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeBirthDate(ByteCursor& payload, OptovueHeader& header,
                             WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  DECLARE_ASSIGN_OR_RETURN(std::string, text, ReadValue(payload));
  header.patient.birthdate =
      metadata::ParseDicomDate(text).Resolve("birthdate", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeEye(ByteCursor& payload, OptovueHeader& header,
                       WarningSink& warnings) {
  DECLARE_ASSIGN_OR_RETURN(std::string, code, ReadValue(payload));
  header.laterality = metadata::ParseLateralityCode(code);
  if (header.laterality == Laterality::kUnknown && !code.empty()) {
    warnings.Add(ErrorKind::kMetadataField,
                 absl::StrFormat("Field laterality: unknown code '%s'", code),
                 payload.BaseOffset());
  }
  return absl::OkStatus();
}

absl::Status DecodeDevice(ByteCursor& payload, OptovueHeader& header,
                          WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.device.model =
      TextField(ReadValue(payload)).Resolve("model", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeSerialNumber(ByteCursor& payload, OptovueHeader& header,
                                WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  header.device.serial_number =
      TextField(ReadValue(payload)).Resolve("serial_number", warnings, offset);
  return absl::OkStatus();
}

constexpr metadata::FieldRule<OptovueHeader> kHeaderRules[] = {
    {ToType(OptovueRecord::kWidth), GetName(OptovueRecord::kWidth),
     DecodeCount<OptovueRecord::kWidth, &OptovueHeader::width>},
    {ToType(OptovueRecord::kHeight), GetName(OptovueRecord::kHeight),
     DecodeCount<OptovueRecord::kHeight, &OptovueHeader::height>},
    {ToType(OptovueRecord::kFrames), GetName(OptovueRecord::kFrames),
     DecodeCount<OptovueRecord::kFrames, &OptovueHeader::frames>},
    {ToType(OptovueRecord::kPatientId), GetName(OptovueRecord::kPatientId),
     DecodePatientId},
    {ToType(OptovueRecord::kFirstName), GetName(OptovueRecord::kFirstName),
     DecodeFirstName},
    {ToType(OptovueRecord::kLastName), GetName(OptovueRecord::kLastName),
     DecodeLastName},
    {ToType(OptovueRecord::kBirthDate), GetName(OptovueRecord::kBirthDate),
     DecodeBirthDate},
    {ToType(OptovueRecord::kSex), GetName(OptovueRecord::kSex), DecodeSex},
    {ToType(OptovueRecord::kEye), GetName(OptovueRecord::kEye), DecodeEye},
    {ToType(OptovueRecord::kScanDate), GetName(OptovueRecord::kScanDate),
     DecodeText<OptovueRecord::kScanDate, &OptovueHeader::scan_date>},
    {ToType(OptovueRecord::kScanTime), GetName(OptovueRecord::kScanTime),
     DecodeText<OptovueRecord::kScanTime, &OptovueHeader::scan_time>},
    {ToType(OptovueRecord::kDevice), GetName(OptovueRecord::kDevice),
     DecodeDevice},
    {ToType(OptovueRecord::kSerialNumber),
     GetName(OptovueRecord::kSerialNumber), DecodeSerialNumber},
};

/// @brief Fields that combine several records
void FinishHeader(const container::Directory& directory, OptovueHeader& header,
                  WarningSink& warnings) {
  auto& patient = header.patient;
  if (patient.first_name.has_value() && patient.surname.has_value()) {
    patient.name = absl::StrCat(*patient.first_name, " ", *patient.surname);
  } else {
    patient.name =
        patient.first_name.has_value() ? patient.first_name : patient.surname;
  }

  if (header.scan_date.has_value()) {
    const auto* record =
        directory.FindFirst(ToType(OptovueRecord::kScanDate));
    header.acquisition_datetime =
        metadata::ParseDicomDateTime(*header.scan_date,
                                     header.scan_time.value_or(""))
            .Resolve("acquisition_datetime", warnings,
                     record != nullptr ? std::optional<uint64_t>(record->offset)
                                       : std::nullopt);
  }
  header.device.manufacturer = OptovueReader::kManufacturer;
}

}  // namespace

uint32_t ClassifyOptovueRecord(std::string_view key) {
  for (OptovueRecord record : kKnownRecords) {
    if (GetName(record) == key) {
      return ToType(record);
    }
  }
  return ToType(OptovueRecord::kUnknown);
}

absl::StatusOr<std::string> ReadOptovueSignature(ByteView data) {
  ByteCursor cursor(data);
  const std::string_view signature = GetName(OptovueRecord::kSignature);
  auto key_length = cursor.ReadU32(Endian::kLittle);
  if (!key_length.ok() || *key_length != signature.size()) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, 0,
                                "Not an Optovue file (missing OCT record)");
  }
  auto key = cursor.ReadFixedString(signature.size());
  auto value_length = cursor.ReadU32(Endian::kLittle);
  if (!key.ok() || *key != signature || !value_length.ok()) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, 0,
                                "Not an Optovue file (missing OCT record)");
  }
  auto version = cursor.ReadFixedString(*value_length);
  if (!version.ok()) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, 0,
                                "Optovue signature record is truncated");
  }
  return *std::move(version);
}

OptovueReader::OptovueReader(RawBuffer buffer, const ReadOptions& options,
                             OptovueHeader header, uint64_t frame_offset,
                             std::vector<Warning> open_warnings)
    : FormatReader(std::move(buffer), options),
      header_(std::move(header)),
      frame_offset_(frame_offset),
      open_warnings_(std::move(open_warnings)) {}

absl::Status OptovueReader::ValidateSignature(ByteView data) {
  RETURN_IF_ERROR(ReadOptovueSignature(data).status(),
                  "Invalid Optovue header");
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<OptovueReader>> OptovueReader::CreateReaderImpl(
    RawBuffer buffer, const ReadOptions& options) {
  OptovueHeader header;
  ASSIGN_OR_RETURN(header.version, ReadOptovueSignature(buffer.View()));

  WarningSink warnings("Optovue");
  container::KeyedRecordLayout layout(
      ClassifyOptovueRecord, std::string(GetName(OptovueRecord::kHeaderEnd)));
  DECLARE_ASSIGN_OR_RETURN(
      container::Directory, directory,
      DirectoryParser::Parse(buffer.Cursor(), 0, layout, warnings),
      "Failed to parse Optovue header");
  if (directory.FindFirst(ToType(OptovueRecord::kHeaderEnd)) == nullptr) {
    warnings.Add(ErrorKind::kOutOfBounds,
                 "Header has no HeaderEnd record; frames are assumed to "
                 "follow the last readable record",
                 directory.GetEndOffset());
  }

  metadata::ApplyFieldRules<OptovueHeader>(kHeaderRules, directory,
                                           buffer.Cursor(), header, warnings);
  FinishHeader(directory, header, warnings);

  const uint64_t frame_offset = directory.GetEndOffset();
  VLOG(1) << "Optovue version " << header.version << ": " << directory.size()
          << " header records, frames at " << frame_offset;
  return std::unique_ptr<OptovueReader>(
      new OptovueReader(std::move(buffer), options, std::move(header),
                        frame_offset, warnings.Take()));
}

absl::StatusOr<DecodeResult<OctVolume>> OptovueReader::ReadOctVolumes() const {
  ResultBuilder<OctVolume> builder;
  builder.FileWarnings().Absorb(open_warnings_);

  const pixel::RawPlaneSpec spec{header_.width.value_or(0),
                                 header_.height.value_or(0), DataType::kUInt16,
                                 Endian::kLittle,
                                 pixel::SampleOrder::kAScanMajor};
  const uint64_t frame_size = spec.ByteSize();
  if (frame_size == 0) {
    builder.AddFailure(
        MAKE_DECODE_ERROR(ErrorKind::kMetadataField,
                          "Header gives no Width and Height for the frames"),
        ErrorKind::kMetadataField);
    return std::move(builder).Finish();
  }

  const ByteCursor file = Cursor();
  const uint64_t available = file.Size() - frame_offset_;
  const uint64_t complete = available / frame_size;
  const uint64_t declared = header_.frames.value_or(complete);
  const uint64_t count = std::min(declared, complete);

  WarningSink warnings(kVolumeId);
  const uint64_t used = count * frame_size;
  if (declared > complete) {
    // Frames past the end have no bytes; report them once
    warnings.Add(ErrorKind::kOutOfBounds,
                 absl::StrFormat("Frames declares %u frames but the %u bytes "
                                 "after the header hold %u",
                                 declared, available, complete),
                 frame_offset_ + used);
  } else if (available > used) {
    warnings.Add(ErrorKind::kOutOfBounds,
                 absl::StrFormat("Ignoring %u trailing bytes after %u frames",
                                 available - used, count),
                 frame_offset_ + used);
  }

  pixel::VolumeAssembler assembler(kVolumeId);
  for (uint64_t i = 0; i < count; ++i) {
    const uint64_t offset = frame_offset_ + i * frame_size;
    auto view = file.ViewAt(offset, frame_size);
    if (!view.ok()) {
      assembler.Add(static_cast<int64_t>(i), view.status(), offset);
      continue;
    }
    assembler.Add(static_cast<int64_t>(i), pixel::DecodeRawPlane(*view, spec),
                  offset);
  }
  if (count == 0) {
    builder.FileWarnings().Absorb(warnings.Take());
    return std::move(builder).Finish();
  }

  auto slices = std::move(assembler).Assemble(warnings);
  if (!slices.ok()) {
    builder.FileWarnings().Absorb(warnings.Take());
    builder.AddFailure(slices.status(),
                       ErrorKind::kInconsistentVolumeGeometry);
    return std::move(builder).Finish();
  }

  OctVolume volume;
  volume.volume_id = kVolumeId;
  volume.slices = *std::move(slices);
  volume.laterality = header_.laterality;
  volume.acquisition_datetime = header_.acquisition_datetime;
  volume.patient = header_.patient;
  volume.device = header_.device;
  builder.Add(std::move(volume), warnings.Take());
  return std::move(builder).Finish();
}

absl::StatusOr<DecodeResult<FundusImage>> OptovueReader::ReadFundusImages()
    const {
  ResultBuilder<FundusImage> builder;
  builder.FileWarnings().Absorb(open_warnings_);
  return std::move(builder).Finish();
}

FormatDescriptor CreateOptovueFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".oct";
  desc.format_name = "Optovue";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kPatientMetadata);

  desc.signature_check = [](ByteView data) {
    return ReadOptovueSignature(data).ok();
  };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(
        std::unique_ptr<OptovueReader>, reader,
        OptovueReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace optovue
}  // namespace formats
}  // namespace fastoct
