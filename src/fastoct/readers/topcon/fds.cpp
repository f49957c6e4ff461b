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

#include "fastoct/readers/topcon/fds.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/pixel/raw_plane.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace topcon {

namespace {

/// @brief Geometry fields of the @IMG_SCAN_03 header
struct ScanHeader {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t number_slices = 0;
};

absl::StatusOr<ScanHeader> ReadScanHeader(ByteCursor& payload) {
  ScanHeader header;
  RETURN_IF_ERROR(payload.Skip(9), "Failed to skip scan header");
  ASSIGN_OR_RETURN(header.width, payload.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.height, payload.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.number_slices, payload.ReadU32(Endian::kLittle));
  RETURN_IF_ERROR(payload.Skip(4), "Failed to skip scan header");
  return header;
}

}  // namespace

absl::Status FdsReader::ValidateSignature(ByteView data) {
  RETURN_IF_ERROR(ReadTopconHeader(data, "FDS").status(),
                  "Invalid FDS header");
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<FdsReader>> FdsReader::CreateReaderImpl(
    RawBuffer buffer, const ReadOptions& options) {
  DECLARE_ASSIGN_OR_RETURN(TopconHeader, header,
                           ReadTopconHeader(buffer.View(), "FDS"));
  WarningSink warnings("FDS");
  DECLARE_ASSIGN_OR_RETURN(container::Directory, directory,
                           ParseDirectory(buffer, warnings),
                           "Failed to parse FDS record directory");
  VLOG(1) << "FDS version " << header.version_1 << "." << header.version_2
          << ": " << directory.size() << " records";
  return std::unique_ptr<FdsReader>(
      new FdsReader(std::move(buffer), options, std::move(header),
                    std::move(directory), warnings.Take()));
}

bool FdsReader::CollectSlices(pixel::VolumeAssembler& assembler,
                              WarningSink& warnings) const {
  const auto* record =
      GetDirectory().FindFirst(ToType(TopconRecord::kImgScan03));
  if (record == nullptr) {
    return false;
  }

  auto payload = Payload(*record);
  if (!payload.ok()) {
    warnings.AddStatus(payload.status(), ErrorKind::kOutOfBounds);
    return true;
  }
  auto header = ReadScanHeader(*payload);
  if (!header.ok()) {
    warnings.AddStatus(header.status(), ErrorKind::kOutOfBounds);
    return true;
  }

  const pixel::RawPlaneSpec spec{header->width, header->height,
                                 DataType::kUInt16, Endian::kLittle,
                                 pixel::SampleOrder::kRowMajor};
  const uint64_t plane_size = spec.ByteSize();
  for (uint32_t i = 0; i < header->number_slices; ++i) {
    const uint64_t offset = kImgScanHeaderSize + plane_size * i;
    const uint64_t absolute = payload->BaseOffset() + offset;
    auto view = payload->ViewAt(offset, plane_size);
    if (!view.ok()) {
      assembler.Add(
          i,
          MAKE_DECODE_ERROR_AT(
              ErrorKind::kOutOfBounds, absolute,
              absl::StrFormat("B-scan %u of @IMG_SCAN_03 is truncated", i)),
          absolute);
      continue;
    }
    assembler.Add(i, pixel::DecodeRawPlane(*view, spec), absolute);
  }
  return true;
}

const container::DirectoryEntry* FdsReader::FindFundusRecord() const {
  const auto* obs = GetDirectory().FindFirst(ToType(TopconRecord::kImgObs));
  if (obs != nullptr) {
    return obs;
  }
  return GetDirectory().FindFirst(ToType(TopconRecord::kImgFundus));
}

absl::StatusOr<Slice> FdsReader::DecodeFundusRecord(
    const container::DirectoryEntry& entry) const {
  DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, Payload(entry));
  if (entry.type == ToType(TopconRecord::kImgObs)) {
    return DecodeFundusObs(payload);
  }
  return DecodeFundusJpeg(payload);
}

FormatDescriptor CreateFdsFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".fds";
  desc.format_name = "FDS";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kFundusImages);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kContours);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kPatientMetadata);

  desc.signature_check = [](ByteView data) {
    return ReadTopconHeader(data, "FDS").ok();
  };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<FdsReader>, reader,
                             FdsReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct
