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

#include "fastoct/readers/bioptigen/bioptigen.h"

#include <array>
#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
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
namespace bioptigen {

namespace {

using container::DirectoryEntry;

constexpr const char* kVolumeId = "volume_0";

constexpr BioptigenRecord kKnownRecords[] = {
    BioptigenRecord::kFrameCount,     BioptigenRecord::kLineCount,
    BioptigenRecord::kLineLength,     BioptigenRecord::kSampleFormat,
    BioptigenRecord::kDescription,    BioptigenRecord::kScanDepth,
    BioptigenRecord::kScanLength,     BioptigenRecord::kFrameData,
    BioptigenRecord::kFrameDateTime,  BioptigenRecord::kFrameTimestamp,
    BioptigenRecord::kFrameLines,     BioptigenRecord::kFrameSamples,
};

template <std::optional<uint32_t> BioptigenHeader::*Member>
absl::Status DecodeCount(ByteCursor& payload, BioptigenHeader& header,
                         WarningSink& /*warnings*/) {
  DECLARE_ASSIGN_OR_RETURN(uint32_t, value, payload.ReadU32(Endian::kLittle));
  header.*Member = value;
  return absl::OkStatus();
}

template <std::optional<double> BioptigenHeader::*Member>
absl::Status DecodeLength(ByteCursor& payload, BioptigenHeader& header,
                          WarningSink& /*warnings*/) {
  DECLARE_ASSIGN_OR_RETURN(double, value, payload.ReadF64(Endian::kLittle));
  header.*Member = value;
  return absl::OkStatus();
}

absl::Status DecodeDescription(ByteCursor& payload, BioptigenHeader& header,
                               WarningSink& warnings) {
  header.description = TextField(payload.ReadFixedString(payload.Size()))
                           .Resolve("description", warnings,
                                    payload.BaseOffset());
  return absl::OkStatus();
}

constexpr metadata::FieldRule<BioptigenHeader> kHeaderRules[] = {
    {ToType(BioptigenRecord::kFrameCount),
     GetName(BioptigenRecord::kFrameCount),
     DecodeCount<&BioptigenHeader::frame_count>},
    {ToType(BioptigenRecord::kLineCount), GetName(BioptigenRecord::kLineCount),
     DecodeCount<&BioptigenHeader::line_count>},
    {ToType(BioptigenRecord::kLineLength),
     GetName(BioptigenRecord::kLineLength),
     DecodeCount<&BioptigenHeader::line_length>},
    {ToType(BioptigenRecord::kSampleFormat),
     GetName(BioptigenRecord::kSampleFormat),
     DecodeCount<&BioptigenHeader::sample_format>},
    {ToType(BioptigenRecord::kDescription),
     GetName(BioptigenRecord::kDescription), DecodeDescription},
    {ToType(BioptigenRecord::kScanDepth), GetName(BioptigenRecord::kScanDepth),
     DecodeLength<&BioptigenHeader::scan_depth>},
    {ToType(BioptigenRecord::kScanLength),
     GetName(BioptigenRecord::kScanLength),
     DecodeLength<&BioptigenHeader::scan_length>},
};

/// @brief Records belonging to one frame
struct FrameRecords {
  uint64_t offset = 0;  ///< Payload offset of the FRAMEDATA record
  const DirectoryEntry* date_time = nullptr;
  const DirectoryEntry* lines = nullptr;
  const DirectoryEntry* samples = nullptr;
};

std::vector<FrameRecords> GroupFrames(const container::Directory& directory,
                                      WarningSink& warnings) {
  std::vector<FrameRecords> frames;
  for (const DirectoryEntry& entry : directory.Entries()) {
    const auto record = static_cast<BioptigenRecord>(entry.type);
    if (record == BioptigenRecord::kFrameData) {
      frames.push_back(FrameRecords{entry.offset});
      continue;
    }

    const DirectoryEntry** slot = nullptr;
    switch (record) {
      case BioptigenRecord::kFrameDateTime:
        slot = frames.empty() ? nullptr : &frames.back().date_time;
        break;
      case BioptigenRecord::kFrameLines:
        slot = frames.empty() ? nullptr : &frames.back().lines;
        break;
      case BioptigenRecord::kFrameSamples:
        slot = frames.empty() ? nullptr : &frames.back().samples;
        break;
      default:
        continue;
    }
    if (slot == nullptr) {
      warnings.Add(ErrorKind::kMetadataField,
                   absl::StrFormat("Record %s precedes the first FRAMEDATA "
                                   "and was ignored",
                                   entry.name),
                   entry.offset);
      continue;
    }
    *slot = &entry;
  }
  return frames;
}

absl::StatusOr<ByteCursor> Payload(const DirectoryEntry& entry,
                                   const ByteCursor& file) {
  return file.Slice(entry.offset - file.BaseOffset(), entry.length);
}

absl::StatusOr<Slice> DecodeFrame(const FrameRecords& frame,
                                  const BioptigenHeader& header,
                                  const ByteCursor& file, size_t index) {
  if (frame.samples == nullptr) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kPixelDecode, frame.offset,
        absl::StrFormat("Frame %u has no FRAMESAMPLES record", index));
  }

  uint32_t lines = header.line_count.value_or(0);
  if (frame.lines != nullptr) {
    DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, Payload(*frame.lines, file));
    ASSIGN_OR_RETURN(lines, payload.ReadU32(Endian::kLittle),
                     "Unreadable FRAMELINES record");
  }

  const pixel::RawPlaneSpec spec{lines, header.line_length.value_or(0),
                                 DataType::kUInt16, Endian::kLittle,
                                 pixel::SampleOrder::kAScanMajor};
  DECLARE_ASSIGN_OR_RETURN(
      ByteView, samples,
      file.ViewAt(frame.samples->offset - file.BaseOffset(),
                  frame.samples->length));
  return pixel::DecodeRawPlane(samples, spec);
}

/// @brief SYSTEMTIME payload of a FRAMEDATETIME record
Field<absl::CivilSecond> DecodeSystemTime(const DirectoryEntry& entry,
                                          const ByteCursor& file) {
  auto payload = Payload(entry, file);
  if (!payload.ok()) {
    return Field<absl::CivilSecond>::Error(payload.status());
  }
  // year, month, weekday, day, hour, minute, second, millisecond
  std::array<uint16_t, 8> parts{};
  for (uint16_t& part : parts) {
    auto value = payload->ReadU16(Endian::kLittle);
    if (!value.ok()) {
      return Field<absl::CivilSecond>::Error(value.status());
    }
    part = *value;
  }
  return metadata::MakeCivilSecond(parts[0], parts[1], parts[3], parts[4],
                                   parts[5], parts[6]);
}

}  // namespace

uint32_t ClassifyBioptigenRecord(std::string_view key) {
  for (BioptigenRecord record : kKnownRecords) {
    if (GetName(record) == key) {
      return ToType(record);
    }
  }
  return ToType(BioptigenRecord::kUnknown);
}

absl::StatusOr<uint16_t> ReadBioptigenSignature(ByteView data) {
  ByteCursor cursor(data);
  auto magic = cursor.ReadU16(Endian::kLittle);
  auto format_id = cursor.ReadU16(Endian::kLittle);
  auto version = cursor.ReadU16(Endian::kLittle);
  if (!magic.ok() || !format_id.ok() || !version.ok() || *magic != kMagic ||
      *format_id != kFormatId) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kUnrecognizedFormat, 0,
        "Not a Bioptigen file (missing 0xFFFF 0x9205 signature)");
  }
  return *version;
}

BioptigenReader::BioptigenReader(RawBuffer buffer, const ReadOptions& options,
                                 BioptigenHeader header,
                                 container::Directory directory,
                                 std::vector<Warning> open_warnings)
    : FormatReader(std::move(buffer), options),
      header_(std::move(header)),
      directory_(std::move(directory)),
      open_warnings_(std::move(open_warnings)) {}

absl::Status BioptigenReader::ValidateSignature(ByteView data) {
  RETURN_IF_ERROR(ReadBioptigenSignature(data).status(),
                  "Invalid Bioptigen header");
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<BioptigenReader>>
BioptigenReader::CreateReaderImpl(RawBuffer buffer,
                                  const ReadOptions& options) {
  BioptigenHeader header;
  ASSIGN_OR_RETURN(header.version, ReadBioptigenSignature(buffer.View()));

  WarningSink warnings("Bioptigen");
  container::KeyedRecordLayout layout(ClassifyBioptigenRecord);
  DECLARE_ASSIGN_OR_RETURN(
      container::Directory, directory,
      DirectoryParser::Parse(buffer.Cursor(), kSignatureSize, layout,
                             warnings),
      "Failed to parse Bioptigen records");
  metadata::ApplyFieldRules<BioptigenHeader>(kHeaderRules, directory,
                                             buffer.Cursor(), header,
                                             warnings);

  VLOG(1) << "Bioptigen version " << header.version << ": "
          << directory.size() << " records, "
          << header.frame_count.value_or(0) << " frames declared";
  return std::unique_ptr<BioptigenReader>(
      new BioptigenReader(std::move(buffer), options, std::move(header),
                          std::move(directory), warnings.Take()));
}

absl::StatusOr<DecodeResult<OctVolume>> BioptigenReader::ReadOctVolumes()
    const {
  ResultBuilder<OctVolume> builder;
  builder.FileWarnings().Absorb(open_warnings_);

  WarningSink warnings(kVolumeId);
  const ByteCursor file = Cursor();
  const std::vector<FrameRecords> frames = GroupFrames(directory_, warnings);
  const size_t declared = header_.frame_count.value_or(0);
  if (frames.empty()) {
    if (declared > 0) {
      warnings.Add(ErrorKind::kOutOfBounds,
                   absl::StrFormat("FRAMECOUNT declares %u frames but the "
                                   "file holds none",
                                   declared),
                   directory_.GetEndOffset());
    }
    builder.FileWarnings().Absorb(warnings.Take());
    return std::move(builder).Finish();
  }

  pixel::VolumeAssembler assembler(kVolumeId);
  for (size_t i = 0; i < frames.size(); ++i) {
    assembler.Add(static_cast<int64_t>(i),
                  DecodeFrame(frames[i], header_, file, i), frames[i].offset);
  }
  // Absent frames have no bytes behind them, so they are reported once
  // rather than padded with placeholders
  if (declared > frames.size()) {
    warnings.Add(ErrorKind::kOutOfBounds,
                 absl::StrFormat("FRAMECOUNT declares %u frames but the file "
                                 "holds %u",
                                 declared, frames.size()),
                 directory_.GetEndOffset());
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
  volume.device.manufacturer = kManufacturer;
  for (const FrameRecords& frame : frames) {
    if (frame.date_time != nullptr) {
      volume.acquisition_datetime =
          DecodeSystemTime(*frame.date_time, file)
              .Resolve("acquisition_datetime", warnings,
                       frame.date_time->offset);
      break;
    }
  }

  builder.Add(std::move(volume), warnings.Take());
  return std::move(builder).Finish();
}

absl::StatusOr<DecodeResult<FundusImage>> BioptigenReader::ReadFundusImages()
    const {
  ResultBuilder<FundusImage> builder;
  builder.FileWarnings().Absorb(open_warnings_);
  return std::move(builder).Finish();
}

FormatDescriptor CreateBioptigenFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".oct";
  desc.format_name = "Bioptigen";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);

  desc.signature_check = [](ByteView data) {
    return ReadBioptigenSignature(data).ok();
  };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(
        std::unique_ptr<BioptigenReader>, reader,
        BioptigenReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace bioptigen
}  // namespace formats
}  // namespace fastoct
