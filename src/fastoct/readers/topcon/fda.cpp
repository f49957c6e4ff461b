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

#include "fastoct/readers/topcon/fda.h"

#include <array>
#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "fastoct/container/directory_parser.h"
#include "fastoct/container/record_layout.h"
#include "fastoct/errors.h"
#include "fastoct/pixel/jpeg_decoder.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace topcon {

namespace {

/// @brief Every slice of a JPEG run starts with SOI and a marker prefix
constexpr std::array<uint8_t, 3> kJpegSyncMarker = {0xFF, 0xD8, 0xFF};

/// @brief Offset of `number_slices` inside the @IMG_JPEG header
constexpr uint64_t kImgJpegCountField = 17;

/// @brief Offset of `number_slices` inside the @IMG_TRC_02 header
constexpr uint64_t kImgTrcCountField = 12;

/// @brief Resolve the size-prefixed JPEG run that follows an image header
absl::StatusOr<container::Directory> ParseJpegRun(const ByteCursor& payload,
                                                  TopconRecord record,
                                                  uint64_t count_field,
                                                  uint64_t header_size,
                                                  WarningSink& warnings) {
  DECLARE_ASSIGN_OR_RETURN(ByteCursor, header, payload.Slice(0, header_size),
                           "Image header is truncated");
  RETURN_IF_ERROR(header.Seek(count_field), "Failed to seek to slice count");
  DECLARE_ASSIGN_OR_RETURN(uint32_t, count, header.ReadU32(Endian::kLittle));

  container::SizePrefixedLayout layout(
      ToType(record), count,
      std::vector<uint8_t>(kJpegSyncMarker.begin(), kJpegSyncMarker.end()));
  container::DirectoryParseOptions options;
  options.require_entries = false;
  return container::DirectoryParser::Parse(payload, header_size, layout,
                                           warnings, options);
}

}  // namespace

absl::Status FdaReader::ValidateSignature(ByteView data) {
  RETURN_IF_ERROR(ReadTopconHeader(data, "FDA").status(),
                  "Invalid FDA header");
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<FdaReader>> FdaReader::CreateReaderImpl(
    RawBuffer buffer, const ReadOptions& options) {
  DECLARE_ASSIGN_OR_RETURN(TopconHeader, header,
                           ReadTopconHeader(buffer.View(), "FDA"));
  WarningSink warnings("FDA");
  DECLARE_ASSIGN_OR_RETURN(container::Directory, directory,
                           ParseDirectory(buffer, warnings),
                           "Failed to parse FDA record directory");
  VLOG(1) << "FDA version " << header.version_1 << "." << header.version_2
          << ": " << directory.size() << " records";
  return std::unique_ptr<FdaReader>(
      new FdaReader(std::move(buffer), options, std::move(header),
                    std::move(directory), warnings.Take()));
}

bool FdaReader::CollectSlices(pixel::VolumeAssembler& assembler,
                              WarningSink& warnings) const {
  const auto* record =
      GetDirectory().FindFirst(ToType(TopconRecord::kImgJpeg));
  if (record == nullptr) {
    return false;
  }

  auto run = [&]() -> absl::StatusOr<container::Directory> {
    DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, Payload(*record));
    return ParseJpegRun(payload, TopconRecord::kImgJpeg, kImgJpegCountField,
                        kImgJpegHeaderSize, warnings);
  }();
  if (!run.ok()) {
    warnings.AddStatus(run.status(), ErrorKind::kOutOfBounds);
    return true;
  }

  const ByteCursor file = Cursor();
  for (const auto& entry : run->Entries()) {
    auto view = file.ViewAt(entry.offset, entry.length);
    if (!view.ok()) {
      assembler.Add(entry.index, view.status(), entry.offset);
      continue;
    }
    assembler.Add(entry.index,
                  pixel::DecodeCompressedPlane(*view, pixel::JpegOutput::kGray),
                  entry.offset);
  }
  return true;
}

const container::DirectoryEntry* FdaReader::FindFundusRecord() const {
  return GetDirectory().FindFirst(ToType(TopconRecord::kImgFundus));
}

absl::StatusOr<Slice> FdaReader::DecodeFundusRecord(
    const container::DirectoryEntry& entry) const {
  DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, Payload(entry));
  return DecodeFundusJpeg(payload);
}

absl::StatusOr<DecodeResult<FundusImage>> FdaReader::ReadTrackingImages()
    const {
  ResultBuilder<FundusImage> builder;

  const auto* record =
      GetDirectory().FindFirst(ToType(TopconRecord::kImgTrc02));
  if (record == nullptr) {
    return std::move(builder).Finish();
  }

  auto run = [&]() -> absl::StatusOr<container::Directory> {
    DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, Payload(*record));
    return ParseJpegRun(payload, TopconRecord::kImgTrc02, kImgTrcCountField,
                        kImgTrcHeaderSize, builder.FileWarnings());
  }();
  if (!run.ok()) {
    builder.AddFailure(run.status(), ErrorKind::kOutOfBounds);
    return std::move(builder).Finish();
  }

  WarningSink meta_warnings("FDA tracking");
  const TopconMetadata meta =
      ExtractTopconMetadata(GetDirectory(), Cursor(), meta_warnings);

  const ByteCursor file = Cursor();
  for (const auto& entry : run->Entries()) {
    auto image = [&]() -> absl::StatusOr<Slice> {
      DECLARE_ASSIGN_OR_RETURN(ByteView, view,
                               file.ViewAt(entry.offset, entry.length));
      return pixel::DecodeCompressedPlane(view, pixel::JpegOutput::kGray);
    }();
    if (!image.ok()) {
      absl::Status status = image.status();
      if (!GetErrorOffset(status).has_value()) {
        status = AttachErrorKind(
            status, GetErrorKind(status).value_or(ErrorKind::kPixelDecode),
            entry.offset);
      }
      builder.AddFailure(status, ErrorKind::kPixelDecode);
      continue;
    }

    FundusImage tracking;
    tracking.image_id = absl::StrCat("tracking_", entry.index.value_or(0));
    tracking.image = *std::move(image);
    tracking.laterality = meta.laterality;
    tracking.acquisition_datetime = meta.acquisition_datetime;
    tracking.patient = meta.patient;
    tracking.device = meta.device;
    builder.Add(std::move(tracking), meta_warnings.Get());
  }
  return std::move(builder).Finish();
}

FormatDescriptor CreateFdaFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".fda";
  desc.format_name = "FDA";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kFundusImages);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kContours);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kCompressed);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kPatientMetadata);

  desc.signature_check = [](ByteView data) {
    return ReadTopconHeader(data, "FDA").ok();
  };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<FdaReader>, reader,
                             FdaReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct
