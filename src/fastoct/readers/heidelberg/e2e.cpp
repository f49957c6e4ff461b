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

#include "fastoct/readers/heidelberg/e2e.h"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/metadata/contours.h"
#include "fastoct/pixel/volume_assembler.h"
#include "fastoct/readers/heidelberg/e2e_chunks.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace heidelberg {

namespace {

using container::ChunkKey;

/// @brief Metadata of one series and the warnings raised decoding it
struct SeriesInfo {
  E2eSeriesMetadata metadata;
  std::vector<Warning> warnings;
};

/// @brief Slices of one series waiting to be assembled
struct PendingVolume {
  explicit PendingVolume(const std::string& volume_id)
      : assembler(volume_id), warnings(volume_id) {}

  pixel::VolumeAssembler assembler;
  WarningSink warnings;
};

std::map<int32_t, PatientMetadata> CollectPatients(const ChunkStream& chunks,
                                                   const ByteCursor& file,
                                                   WarningSink& warnings) {
  std::map<int32_t, PatientMetadata> patients;
  for (const E2eChunk* chunk : chunks.Find(ToType(E2eChunkType::kPatient))) {
    auto [it, inserted] = patients.try_emplace(chunk->GetKey().patient_id);
    if (!inserted) {
      continue;  // first record of a patient wins
    }
    ApplyPatientChunk(*chunk, file, it->second, warnings);
  }
  return patients;
}

std::map<ChunkKey, SeriesInfo> CollectSeries(const ChunkStream& chunks,
                                             const ByteCursor& file) {
  std::map<ChunkKey, SeriesInfo> series;
  for (E2eChunkType type :
       {E2eChunkType::kLaterality, E2eChunkType::kBscanMetadata}) {
    for (const E2eChunk* chunk : chunks.Find(ToType(type))) {
      SeriesInfo& info = series[chunk->GetKey().SeriesKey()];
      WarningSink warnings(chunk->GetKey().SeriesId());
      ApplySeriesChunk(*chunk, file, info.metadata, warnings);
      for (Warning& warning : warnings.Take()) {
        info.warnings.push_back(std::move(warning));
      }
    }
  }
  return series;
}

/// @brief Copy patient, device and series metadata onto an entity
template <typename Entity>
void ApplyMetadata(const ChunkKey& series_key,
                   const std::map<int32_t, PatientMetadata>& patients,
                   const std::map<ChunkKey, SeriesInfo>& series,
                   Entity& entity, WarningSink& warnings) {
  entity.device.manufacturer = E2eReader::kManufacturer;
  if (auto it = patients.find(series_key.patient_id); it != patients.end()) {
    entity.patient = it->second;
  }
  if (auto it = series.find(series_key); it != series.end()) {
    entity.laterality = it->second.metadata.laterality;
    entity.acquisition_datetime = it->second.metadata.acquisition_datetime;
    warnings.Absorb(it->second.warnings);
  }
}

Warning ChunkWarning(const absl::Status& status, ErrorKind fallback,
                     const E2eChunk& chunk) {
  Warning warning = Warning::FromStatus(status, fallback);
  if (!warning.offset.has_value()) {
    warning.offset = chunk.entry.offset;
  }
  return warning;
}

}  // namespace

E2eReader::E2eReader(RawBuffer buffer, const ReadOptions& options,
                     ChunkStream chunks, std::vector<Warning> chain_warnings)
    : FormatReader(std::move(buffer), options),
      chunks_(std::move(chunks)),
      chain_warnings_(std::move(chain_warnings)) {}

absl::Status E2eReader::ValidateSignature(ByteView data) {
  if (!ChunkStream::CheckSignature(data)) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, 0,
                                "Not a Heidelberg E2E file (missing CMDb)");
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<E2eReader>> E2eReader::CreateReaderImpl(
    RawBuffer buffer, const ReadOptions& options) {
  WarningSink warnings("E2E");
  auto chunks = ChunkStream::Open(buffer.Cursor(), warnings);
  RETURN_IF_ERROR(chunks.status(), "Failed to walk E2E directory chain");

  size_t unknown = 0;
  for (const E2eChunk& chunk : chunks->Chunks()) {
    unknown += ClassifyE2eChunk(chunk.GetType()) == E2eChunkType::kUnknown;
  }
  VLOG(1) << "E2E: " << chunks->size() << " chunks in "
          << chunks->NumBlocks() << " directory blocks, " << unknown
          << " of unknown type";

  return std::unique_ptr<E2eReader>(new E2eReader(
      std::move(buffer), options, *std::move(chunks), warnings.Take()));
}

absl::StatusOr<DecodeResult<OctVolume>> E2eReader::ReadOctVolumes() const {
  ResultBuilder<OctVolume> builder;
  builder.FileWarnings().Absorb(chain_warnings_);

  const ByteCursor file = Cursor();
  const auto patients = CollectPatients(chunks_, file, builder.FileWarnings());
  const auto series = CollectSeries(chunks_, file);

  std::map<ChunkKey, PendingVolume> pending;
  for (const E2eChunk* chunk : chunks_.Find(ToType(E2eChunkType::kImage))) {
    if (chunk->GetSubIndex() != static_cast<int64_t>(E2eImageKind::kOct)) {
      continue;
    }
    const ChunkKey key = chunk->GetKey().SeriesKey();
    PendingVolume& volume =
        pending.try_emplace(key, key.SeriesId()).first->second;
    volume.assembler.Add(E2eSliceIndex(chunk->GetKey()),
                         DecodeE2eBscan(*chunk, file), chunk->entry.offset);
  }

  std::map<ChunkKey, std::vector<Contour>> contours;
  for (const E2eChunk* chunk : chunks_.Find(ToType(E2eChunkType::kContour))) {
    const ChunkKey key = chunk->GetKey().SeriesKey();
    auto it = pending.find(key);
    WarningSink& warnings =
        it != pending.end() ? it->second.warnings : builder.FileWarnings();

    auto contour = DecodeE2eContour(*chunk, file);
    if (!contour.ok()) {
      warnings.Add(
          ChunkWarning(contour.status(), ErrorKind::kMetadataField, *chunk));
      continue;
    }
    if (it == pending.end()) {
      warnings.Add(ErrorKind::kMetadataField,
                   absl::StrFormat("Contour '%s' of series %s has no OCT "
                                   "volume and was discarded",
                                   contour->layer_name, key.SeriesId()),
                   chunk->entry.offset);
      continue;
    }
    contours[key].push_back(*std::move(contour));
  }

  for (auto& [key, entry] : pending) {
    auto slices = std::move(entry.assembler).Assemble(entry.warnings);
    if (!slices.ok()) {
      builder.FileWarnings().Absorb(entry.warnings.Take());
      builder.AddFailure(slices.status(),
                         ErrorKind::kInconsistentVolumeGeometry);
      continue;
    }

    OctVolume volume;
    volume.volume_id = key.SeriesId();
    volume.slices = *std::move(slices);
    ApplyMetadata(key, patients, series, volume, entry.warnings);
    if (auto it = contours.find(key); it != contours.end()) {
      metadata::AttachContours(std::move(it->second), volume, entry.warnings);
    }

    VLOG(1) << "E2E volume " << volume.volume_id << ": "
            << volume.GetNumSlices() << " slices, "
            << volume.GetGeometry().ToString();
    builder.Add(std::move(volume), entry.warnings.Take());
  }
  return std::move(builder).Finish();
}

absl::StatusOr<DecodeResult<FundusImage>> E2eReader::ReadFundusImages()
    const {
  ResultBuilder<FundusImage> builder;
  builder.FileWarnings().Absorb(chain_warnings_);

  const ByteCursor file = Cursor();
  const auto patients = CollectPatients(chunks_, file, builder.FileWarnings());
  const auto series = CollectSeries(chunks_, file);

  std::map<ChunkKey, int> seen;
  for (const E2eChunk* chunk : chunks_.Find(ToType(E2eChunkType::kImage))) {
    if (chunk->GetSubIndex() != static_cast<int64_t>(E2eImageKind::kFundus)) {
      continue;
    }
    const ChunkKey key = chunk->GetKey().SeriesKey();
    const int ordinal = seen[key]++;

    auto image = DecodeE2eFundus(*chunk, file);
    if (!image.ok()) {
      builder.AddFailure(
          AttachErrorKind(image.status(),
                          GetErrorKind(image.status())
                              .value_or(ErrorKind::kPixelDecode),
                          GetErrorOffset(image.status())
                              .value_or(chunk->entry.offset)),
          ErrorKind::kPixelDecode);
      continue;
    }

    FundusImage fundus;
    fundus.image_id = ordinal == 0 ? key.SeriesId()
                                   : absl::StrCat(key.SeriesId(), "_", ordinal);
    fundus.image = *std::move(image);
    WarningSink warnings(fundus.image_id);
    ApplyMetadata(key, patients, series, fundus, warnings);
    builder.Add(std::move(fundus), warnings.Take());
  }
  return std::move(builder).Finish();
}

FormatDescriptor CreateE2eFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".e2e";
  desc.aliases = {".sdb"};
  desc.format_name = "E2E";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kFundusImages);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kMultipleVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kContours);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kPatientMetadata);

  desc.signature_check = [](ByteView data) {
    return ChunkStream::CheckSignature(data);
  };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<E2eReader>, reader,
                             E2eReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace heidelberg
}  // namespace formats
}  // namespace fastoct
