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

#include "fastoct/readers/topcon/topcon_reader.h"

#include <utility>
#include <vector>

#include "fastoct/container/directory_parser.h"
#include "fastoct/container/record_layout.h"
#include "fastoct/errors.h"
#include "fastoct/metadata/contours.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace topcon {

TopconReader::TopconReader(RawBuffer buffer, const ReadOptions& options,
                           TopconHeader header,
                           container::Directory directory,
                           std::vector<Warning> directory_warnings)
    : FormatReader(std::move(buffer), options),
      header_(std::move(header)),
      directory_(std::move(directory)),
      directory_warnings_(std::move(directory_warnings)) {}

absl::StatusOr<container::Directory> TopconReader::ParseDirectory(
    const RawBuffer& buffer, WarningSink& warnings) {
  container::TopconRecordLayout layout(ClassifyTopconRecord);
  return container::DirectoryParser::Parse(buffer.Cursor(), kHeaderSize,
                                           layout, warnings);
}

absl::StatusOr<ByteCursor> TopconReader::Payload(
    const container::DirectoryEntry& entry) const {
  return Cursor().Slice(entry.offset, entry.length);
}

absl::StatusOr<DecodeResult<OctVolume>> TopconReader::ReadOctVolumes() const {
  ResultBuilder<OctVolume> builder;
  builder.FileWarnings().Absorb(directory_warnings_);

  WarningSink warnings(kVolumeId);
  pixel::VolumeAssembler assembler(kVolumeId);
  if (!CollectSlices(assembler, warnings)) {
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

  TopconMetadata meta = ExtractTopconMetadata(directory_, Cursor(), warnings);
  volume.laterality = meta.laterality;
  volume.acquisition_datetime = meta.acquisition_datetime;
  volume.patient = std::move(meta.patient);
  volume.device = std::move(meta.device);

  metadata::AttachContours(
      ExtractTopconContours(directory_, Cursor(), warnings), volume, warnings);

  builder.Add(std::move(volume), warnings.Take());
  return std::move(builder).Finish();
}

absl::StatusOr<DecodeResult<FundusImage>> TopconReader::ReadFundusImages()
    const {
  ResultBuilder<FundusImage> builder;
  builder.FileWarnings().Absorb(directory_warnings_);

  const container::DirectoryEntry* entry = FindFundusRecord();
  if (entry == nullptr) {
    return std::move(builder).Finish();
  }

  auto image = DecodeFundusRecord(*entry);
  if (!image.ok()) {
    builder.AddFailure(
        AttachErrorKind(image.status(),
                        GetErrorKind(image.status())
                            .value_or(ErrorKind::kPixelDecode),
                        GetErrorOffset(image.status()).value_or(entry->offset)),
        ErrorKind::kPixelDecode);
    return std::move(builder).Finish();
  }

  WarningSink warnings(kFundusId);
  TopconMetadata meta = ExtractTopconMetadata(directory_, Cursor(), warnings);

  FundusImage fundus;
  fundus.image_id = kFundusId;
  fundus.image = *std::move(image);
  fundus.laterality = meta.laterality;
  fundus.acquisition_datetime = meta.acquisition_datetime;
  fundus.patient = std::move(meta.patient);
  fundus.device = std::move(meta.device);

  builder.Add(std::move(fundus), warnings.Take());
  return std::move(builder).Finish();
}

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct
