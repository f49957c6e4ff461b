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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_DICOM_DICOM_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_DICOM_DICOM_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/civil_time.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/metadata.h"
#include "fastoct/core/volume.h"
#include "fastoct/format_reader.h"
#include "fastoct/io/byte_cursor.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/runtime/format_descriptor.h"

namespace gdcm {
class Reader;
}  // namespace gdcm

/**
 * @file dicom.h
 * @brief DICOM Part 10 reader for ophthalmic modalities
 *
 * The data set is parsed by GDCM, which handles every transfer syntax
 * (implicit and explicit VR, big endian, deflated) and decodes the pixel
 * codecs it was built with. This reader maps the standard attributes onto
 * the fastoct data model.
 *
 * Modality `OPT` yields one OCT volume with a slice per frame; `OP` and
 * `XC` yield one fundus image per frame. Frames are decoded one at a time,
 * so a frame GDCM cannot decode becomes a missing slice and its siblings
 * survive.
 */

namespace fastoct {
namespace formats {
namespace dicom {

/// @brief Check the preamble and magic
/// @return Offset of the file meta group
/// @retval UnrecognizedFormat if "DICM" is not at offset 128
absl::StatusOr<uint64_t> ReadDicomPreamble(ByteView data);

/// @brief Decoded header fields
struct DicomHeader {
  std::string transfer_syntax_uid;

  std::optional<std::string> modality;
  std::optional<uint32_t> rows;
  std::optional<uint32_t> columns;

  /// @brief NumberOfFrames as declared, 1 when absent
  uint32_t number_of_frames = 1;
  uint32_t samples_per_pixel = 1;
  uint32_t bits_allocated = 8;
  std::optional<uint32_t> bits_stored;
  std::optional<uint32_t> high_bit;
  uint32_t pixel_representation = 0;
  uint32_t planar_configuration = 0;
  std::optional<std::string> photometric_interpretation;

  PatientMetadata patient;
  DeviceMetadata device;
  Laterality laterality = Laterality::kUnknown;
  std::optional<absl::CivilSecond> acquisition_datetime;

  // Raw values combined into acquisition_datetime
  std::optional<std::string> acquisition_dt;
  std::optional<std::string> acquisition_date;
  std::optional<std::string> acquisition_time;
  std::optional<std::string> study_date;
  std::optional<std::string> study_time;
};

/// @brief DICOM Part 10 reader
class DicomReader : public FormatReader, public ReaderFactory<DicomReader> {
 public:
  ~DicomReader() override;

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "DICOM";
  }

  /// @brief One volume for modality OPT; empty for other modalities
  [[nodiscard]] absl::StatusOr<DecodeResult<OctVolume>> ReadOctVolumes()
      const override;

  /// @brief One image per frame for modalities OP and XC
  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadFundusImages()
      const override;

  [[nodiscard]] const DicomHeader& GetHeader() const { return header_; }

  /// @brief True if PixelData holds compressed fragments
  [[nodiscard]] bool IsEncapsulated() const;

 private:
  friend class ReaderFactory<DicomReader>;

  /// @brief Decoded frames, bounded by the pixel data actually present
  struct Frames {
    std::vector<absl::StatusOr<Slice>> slices;

    /// @brief Set when NumberOfFrames promised more than PixelData holds
    std::optional<Warning> shortfall;
  };

  DicomReader(RawBuffer buffer, const ReadOptions& options,
              std::unique_ptr<gdcm::Reader> parsed, DicomHeader header,
              std::vector<Warning> open_warnings);

  static absl::Status ValidateSignature(ByteView data);

  static absl::StatusOr<std::unique_ptr<DicomReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);

  /// @brief Decode every frame of PixelData
  /// @retval error if the image as a whole cannot be decoded
  [[nodiscard]] absl::StatusOr<Frames> DecodeFrames() const;

  [[nodiscard]] absl::StatusOr<Frames> DecodeNativeFrames() const;
  [[nodiscard]] absl::StatusOr<Frames> DecodeEncapsulatedFrames() const;

  [[nodiscard]] bool IsOctModality() const;
  [[nodiscard]] bool IsFundusModality() const;

  std::unique_ptr<gdcm::Reader> parsed_;
  DicomHeader header_;
  std::vector<Warning> open_warnings_;
};

/// @brief Registry descriptor for DICOM files
FormatDescriptor CreateDicomFormatDescriptor();

}  // namespace dicom
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_DICOM_DICOM_H_
