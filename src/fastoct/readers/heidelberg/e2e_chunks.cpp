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

#include "fastoct/readers/heidelberg/e2e_chunks.h"

#include <cmath>
#include <limits>
#include <span>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/metadata/dates.h"
#include "fastoct/metadata/field.h"
#include "fastoct/metadata/field_rule.h"
#include "fastoct/pixel/heidelberg_float.h"
#include "fastoct/pixel/raw_plane.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace heidelberg {

namespace {

constexpr uint64_t kPatientSize = 31 + 66 + 4 + 1 + 25;
constexpr uint64_t kLateralityField = 14;
constexpr uint64_t kAcquisitionTimeField = 88;
constexpr uint64_t kContourHeaderSize = 4 * 4;

constexpr uint8_t kRightEye = 'R';
constexpr uint8_t kLeftEye = 'L';

/// Depths below this are unset
constexpr float kMinDepth = 1e-9f;

absl::Status RequireSize(const ByteCursor& payload, uint64_t size) {
  if (payload.Size() < size) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, payload.BaseOffset(),
        absl::StrFormat("chunk holds %u bytes, layout needs %u",
                        payload.Size(), size));
  }
  return absl::OkStatus();
}

absl::Status DecodePatient(ByteCursor& payload, PatientMetadata& patient,
                           WarningSink& warnings) {
  RETURN_IF_ERROR(RequireSize(payload, kPatientSize),
                  "Patient chunk is truncated");
  const uint64_t offset = payload.BaseOffset();

  patient.first_name =
      TextField(payload.ReadFixedString(31, TextEncoding::kLatin1))
          .Resolve("first_name", warnings, offset);
  patient.surname =
      TextField(payload.ReadFixedString(66, TextEncoding::kLatin1))
          .Resolve("surname", warnings, offset);
  if (patient.first_name.has_value() && patient.surname.has_value()) {
    patient.name = absl::StrCat(*patient.first_name, " ", *patient.surname);
  } else {
    patient.name = patient.first_name.has_value() ? patient.first_name
                                                  : patient.surname;
  }

  DECLARE_ASSIGN_OR_RETURN(uint32_t, birthdate,
                           payload.ReadU32(Endian::kLittle));
  patient.birthdate = metadata::HeidelbergBirthdate(birthdate)
                          .Resolve("birthdate", warnings, offset);
  patient.sex =
      TextField(payload.ReadFixedString(1)).Resolve("sex", warnings, offset);
  patient.patient_id = TextField(payload.ReadFixedString(25))
                           .Resolve("patient_id", warnings, offset);
  return absl::OkStatus();
}

absl::Status DecodeLaterality(ByteCursor& payload, E2eSeriesMetadata& series,
                              WarningSink& warnings) {
  RETURN_IF_ERROR(payload.Seek(kLateralityField),
                  "Laterality chunk is truncated");
  DECLARE_ASSIGN_OR_RETURN(uint8_t, code, payload.ReadU8());

  Laterality laterality = Laterality::kUnknown;
  if (code == kRightEye) {
    laterality = Laterality::kRight;
  } else if (code == kLeftEye) {
    laterality = Laterality::kLeft;
  } else {
    warnings.Add(ErrorKind::kMetadataField,
                 absl::StrFormat("Field laterality: unknown code %u", code),
                 payload.BaseOffset() + kLateralityField);
    return absl::OkStatus();
  }

  if (series.laterality == Laterality::kUnknown) {
    series.laterality = laterality;
  }
  return absl::OkStatus();
}

absl::Status DecodeBscanMetadata(ByteCursor& payload,
                                 E2eSeriesMetadata& series,
                                 WarningSink& warnings) {
  RETURN_IF_ERROR(payload.Seek(kAcquisitionTimeField),
                  "B-scan metadata chunk is truncated");
  DECLARE_ASSIGN_OR_RETURN(uint64_t, ticks, payload.ReadU64(Endian::kLittle));
  auto acquired =
      metadata::HeidelbergAcquisitionTime(ticks).Resolve(
          "acquisition_datetime", warnings,
          payload.BaseOffset() + kAcquisitionTimeField);
  if (acquired.has_value() && (!series.acquisition_datetime.has_value() ||
                               *acquired < *series.acquisition_datetime)) {
    series.acquisition_datetime = acquired;
  }
  return absl::OkStatus();
}

constexpr metadata::FieldRule<PatientMetadata> kPatientRules[] = {
    {ToType(E2eChunkType::kPatient), GetName(E2eChunkType::kPatient),
     DecodePatient},
};

constexpr metadata::FieldRule<E2eSeriesMetadata> kSeriesRules[] = {
    {ToType(E2eChunkType::kLaterality), GetName(E2eChunkType::kLaterality),
     DecodeLaterality},
    {ToType(E2eChunkType::kBscanMetadata),
     GetName(E2eChunkType::kBscanMetadata), DecodeBscanMetadata},
};

template <typename Target>
void ApplyChunkRules(std::span<const metadata::FieldRule<Target>> rules,
                     const E2eChunk& chunk, const ByteCursor& file,
                     Target& target, WarningSink& warnings) {
  const auto* rule = metadata::FindFieldRule(rules, chunk.GetType());
  if (rule == nullptr) {
    return;
  }
  auto payload = ChunkPayload(chunk, file);
  if (!payload.ok()) {
    warnings.AddStatus(payload.status(), ErrorKind::kOutOfBounds);
    return;
  }
  metadata::ApplyFieldRule(*rule, *std::move(payload), target, warnings);
}

absl::StatusOr<E2eImageHeader> ReadImageHeader(ByteCursor& payload) {
  E2eImageHeader header;
  ASSIGN_OR_RETURN(header.size, payload.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.type, payload.ReadU32(Endian::kLittle));
  RETURN_IF_ERROR(payload.Skip(4), "Failed to skip image header field");
  ASSIGN_OR_RETURN(header.width, payload.ReadU32(Endian::kLittle));
  ASSIGN_OR_RETURN(header.height, payload.ReadU32(Endian::kLittle));
  return header;
}

}  // namespace

E2eChunkType ClassifyE2eChunk(uint32_t type) {
  switch (static_cast<E2eChunkType>(type)) {
    case E2eChunkType::kPatient:
    case E2eChunkType::kLaterality:
    case E2eChunkType::kBscanMetadata:
    case E2eChunkType::kContour:
    case E2eChunkType::kImage:
      return static_cast<E2eChunkType>(type);
    case E2eChunkType::kUnknown:
      break;
  }
  return E2eChunkType::kUnknown;
}

absl::StatusOr<ByteCursor> ChunkPayload(const E2eChunk& chunk,
                                        const ByteCursor& file) {
  return file.Slice(chunk.payload_offset - file.BaseOffset(),
                    chunk.payload_length);
}

int64_t E2eSliceIndex(const container::ChunkKey& key) {
  return key.slice_id / 2 - 1;
}

void ApplyPatientChunk(const E2eChunk& chunk, const ByteCursor& file,
                       PatientMetadata& patient, WarningSink& warnings) {
  ApplyChunkRules<PatientMetadata>(kPatientRules, chunk, file, patient,
                                   warnings);
}

void ApplySeriesChunk(const E2eChunk& chunk, const ByteCursor& file,
                      E2eSeriesMetadata& series, WarningSink& warnings) {
  ApplyChunkRules<E2eSeriesMetadata>(kSeriesRules, chunk, file, series,
                                     warnings);
}

absl::StatusOr<Contour> DecodeE2eContour(const E2eChunk& chunk,
                                         const ByteCursor& file) {
  DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, ChunkPayload(chunk, file));
  RETURN_IF_ERROR(RequireSize(payload, kContourHeaderSize),
                  "Contour chunk is truncated");
  RETURN_IF_ERROR(payload.Skip(4), "Failed to skip contour field");
  DECLARE_ASSIGN_OR_RETURN(uint32_t, layer_id,
                           payload.ReadU32(Endian::kLittle));
  RETURN_IF_ERROR(payload.Skip(4), "Failed to skip contour field");
  DECLARE_ASSIGN_OR_RETURN(uint32_t, width, payload.ReadU32(Endian::kLittle));

  const int64_t slice_index = E2eSliceIndex(chunk.GetKey());
  if (slice_index < 0) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kMetadataField, chunk.entry.offset,
        absl::StrFormat("Contour %u has slice id %d, which names no B-scan",
                        layer_id, chunk.GetKey().slice_id));
  }

  if (width > payload.Remaining() / sizeof(float)) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, chunk.entry.offset,
        absl::StrFormat("Contour %u: %u depths exceed the %u byte chunk",
                        layer_id, width, payload.Remaining()));
  }

  Contour contour;
  contour.layer_name = absl::StrCat("contour", layer_id);
  contour.slice_index = static_cast<uint32_t>(slice_index);
  contour.depths.reserve(width);
  for (uint32_t x = 0; x < width; ++x) {
    DECLARE_ASSIGN_OR_RETURN(float, depth, payload.ReadF32(Endian::kLittle),
                             "Contour depths exceed the chunk");
    if (depth < kMinDepth || depth == std::numeric_limits<float>::max()) {
      depth = std::numeric_limits<float>::quiet_NaN();
    }
    contour.depths.push_back(depth);
  }
  return contour;
}

absl::StatusOr<Slice> DecodeE2eBscan(const E2eChunk& chunk,
                                     const ByteCursor& file) {
  DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, ChunkPayload(chunk, file));
  DECLARE_ASSIGN_OR_RETURN(E2eImageHeader, header, ReadImageHeader(payload),
                           "B-scan image header is truncated");
  DECLARE_ASSIGN_OR_RETURN(ByteView, samples,
                           payload.ReadBytes(payload.Remaining()));
  return pixel::DecodeHeidelbergPlane(samples, header.width, header.height);
}

absl::StatusOr<Slice> DecodeE2eFundus(const E2eChunk& chunk,
                                      const ByteCursor& file) {
  DECLARE_ASSIGN_OR_RETURN(ByteCursor, payload, ChunkPayload(chunk, file));
  DECLARE_ASSIGN_OR_RETURN(E2eImageHeader, header, ReadImageHeader(payload),
                           "Fundus image header is truncated");
  DECLARE_ASSIGN_OR_RETURN(ByteView, samples,
                           payload.ReadBytes(payload.Remaining()));
  const pixel::RawPlaneSpec spec{header.width, header.height,
                                 DataType::kUInt8, Endian::kLittle,
                                 pixel::SampleOrder::kRowMajor};
  return pixel::DecodeRawPlane(samples, spec);
}

}  // namespace heidelberg
}  // namespace formats
}  // namespace fastoct
