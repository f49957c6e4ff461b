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

#include "fastoct/readers/dicom/dicom.h"

#include <gdcmAttribute.h>
#include <gdcmByteValue.h>
#include <gdcmDataElement.h>
#include <gdcmDataSet.h>
#include <gdcmFile.h>
#include <gdcmFileMetaInformation.h>
#include <gdcmFragment.h>
#include <gdcmImage.h>
#include <gdcmPhotometricInterpretation.h>
#include <gdcmPixelFormat.h>
#include <gdcmReader.h>
#include <gdcmSequenceOfFragments.h>
#include <gdcmSmartPointer.h>
#include <gdcmTag.h>
#include <gdcmTransferSyntax.h>

#include <algorithm>
#include <exception>
#include <istream>
#include <memory>
#include <streambuf>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "fastoct/errors.h"
#include "fastoct/metadata/dates.h"
#include "fastoct/metadata/field.h"
#include "fastoct/metadata/field_rule.h"
#include "fastoct/pixel/volume_assembler.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace dicom {

namespace {

constexpr uint64_t kPreambleSize = 128;
constexpr std::string_view kMagic = "DICM";
constexpr uint64_t kFragmentItemHeaderSize = 8;

constexpr const char* kVolumeId = "volume_0";

/// @brief Attributes mapped onto the data model, as (group << 16) | element
enum class DicomTag : uint32_t {
  kTransferSyntaxUid = 0x00020010,
  kStudyDate = 0x00080020,
  kAcquisitionDate = 0x00080022,
  kAcquisitionDateTime = 0x0008002A,
  kStudyTime = 0x00080030,
  kAcquisitionTime = 0x00080032,
  kModality = 0x00080060,
  kManufacturer = 0x00080070,
  kManufacturerModelName = 0x00081090,
  kPatientName = 0x00100010,
  kPatientId = 0x00100020,
  kPatientBirthDate = 0x00100030,
  kPatientSex = 0x00100040,
  kDeviceSerialNumber = 0x00181000,
  kSoftwareVersions = 0x00181020,
  kLaterality = 0x00200060,
  kImageLaterality = 0x00200062,
  kPhotometricInterpretation = 0x00280004,
  kNumberOfFrames = 0x00280008,
  kPixelData = 0x7FE00010,
};

constexpr uint32_t ToType(DicomTag tag) { return static_cast<uint32_t>(tag); }

gdcm::Tag ToGdcmTag(uint32_t tag) {
  return gdcm::Tag(static_cast<uint16_t>(tag >> 16),
                   static_cast<uint16_t>(tag & 0xFFFF));
}

gdcm::Tag ToGdcmTag(DicomTag tag) { return ToGdcmTag(ToType(tag)); }

std::string_view GetName(DicomTag tag) {
  switch (tag) {
    case DicomTag::kTransferSyntaxUid:
      return "TransferSyntaxUID";
    case DicomTag::kStudyDate:
      return "StudyDate";
    case DicomTag::kAcquisitionDate:
      return "AcquisitionDate";
    case DicomTag::kAcquisitionDateTime:
      return "AcquisitionDateTime";
    case DicomTag::kStudyTime:
      return "StudyTime";
    case DicomTag::kAcquisitionTime:
      return "AcquisitionTime";
    case DicomTag::kModality:
      return "Modality";
    case DicomTag::kManufacturer:
      return "Manufacturer";
    case DicomTag::kManufacturerModelName:
      return "ManufacturerModelName";
    case DicomTag::kPatientName:
      return "PatientName";
    case DicomTag::kPatientId:
      return "PatientID";
    case DicomTag::kPatientBirthDate:
      return "PatientBirthDate";
    case DicomTag::kPatientSex:
      return "PatientSex";
    case DicomTag::kDeviceSerialNumber:
      return "DeviceSerialNumber";
    case DicomTag::kSoftwareVersions:
      return "SoftwareVersions";
    case DicomTag::kLaterality:
      return "Laterality";
    case DicomTag::kImageLaterality:
      return "ImageLaterality";
    case DicomTag::kPhotometricInterpretation:
      return "PhotometricInterpretation";
    case DicomTag::kNumberOfFrames:
      return "NumberOfFrames";
    case DicomTag::kPixelData:
      return "PixelData";
  }
  return "";
}

/// @brief Read-only stream over borrowed bytes, so GDCM parses in place
class ViewStreamBuf : public std::streambuf {
 public:
  explicit ViewStreamBuf(ByteView data) {
    char* begin =
        const_cast<char*>(reinterpret_cast<const char*>(data.data()));
    setg(begin, begin, begin + data.size());
  }

 protected:
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which) override {
    if ((which & std::ios_base::in) == 0) {
      return pos_type(off_type(-1));
    }
    off_type target = off;
    if (dir == std::ios_base::cur) {
      target += gptr() - eback();
    } else if (dir == std::ios_base::end) {
      target += egptr() - eback();
    }
    if (target < 0 || target > egptr() - eback()) {
      return pos_type(off_type(-1));
    }
    setg(eback(), eback() + target, egptr());
    return pos_type(target);
  }

  pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
    return seekoff(off_type(pos), std::ios_base::beg, which);
  }
};

/// @brief Value bytes of @p tag, or nullopt when absent or empty
std::optional<ByteView> ValueOf(const gdcm::DataSet& dataset,
                                const gdcm::Tag& tag) {
  if (!dataset.FindDataElement(tag)) {
    return std::nullopt;
  }
  const gdcm::DataElement& element = dataset.GetDataElement(tag);
  const gdcm::ByteValue* value = element.GetByteValue();
  if (element.IsEmpty() || value == nullptr) {
    return std::nullopt;
  }
  return ByteView(reinterpret_cast<const uint8_t*>(value->GetPointer()),
                  value->GetLength());
}

/// @brief US attribute through gdcm::Attribute, which knows the byte order
template <uint16_t Group, uint16_t Element>
std::optional<uint32_t> GetUnsignedShort(const gdcm::DataSet& dataset) {
  const gdcm::Tag tag(Group, Element);
  if (!dataset.FindDataElement(tag) ||
      dataset.GetDataElement(tag).IsEmpty()) {
    return std::nullopt;
  }
  gdcm::Attribute<Group, Element> attribute;
  attribute.SetFromDataSet(dataset);
  return static_cast<uint32_t>(attribute.GetValue());
}

// ---------------------------------------------------------------------------
// Header fields
// ---------------------------------------------------------------------------

absl::StatusOr<std::string> ReadText(ByteCursor& payload) {
  DECLARE_ASSIGN_OR_RETURN(
      std::string, text,
      payload.ReadFixedString(payload.Size(), TextEncoding::kLatin1));
  return std::string(absl::StripLeadingAsciiWhitespace(text));
}

template <DicomTag Tag, std::optional<std::string> DicomHeader::*Member>
absl::Status DecodeText(ByteCursor& payload, DicomHeader& header,
                        WarningSink& warnings) {
  header.*Member = TextField(ReadText(payload)).Resolve(GetName(Tag), warnings);
  return absl::OkStatus();
}

template <DicomTag Tag, std::optional<std::string> PatientMetadata::*Member>
absl::Status DecodePatientText(ByteCursor& payload, DicomHeader& header,
                               WarningSink& warnings) {
  header.patient.*Member =
      TextField(ReadText(payload)).Resolve(GetName(Tag), warnings);
  return absl::OkStatus();
}

template <DicomTag Tag, std::optional<std::string> DeviceMetadata::*Member>
absl::Status DecodeDeviceText(ByteCursor& payload, DicomHeader& header,
                              WarningSink& warnings) {
  header.device.*Member =
      TextField(ReadText(payload)).Resolve(GetName(Tag), warnings);
  return absl::OkStatus();
}

absl::Status DecodeNumberOfFrames(ByteCursor& payload, DicomHeader& header,
                                  WarningSink& warnings) {
  DECLARE_ASSIGN_OR_RETURN(std::string, text, ReadText(payload));
  uint32_t frames = 0;
  if (!absl::SimpleAtoi(text, &frames) || frames == 0) {
    warnings.Add(ErrorKind::kMetadataField,
                 absl::StrFormat("Field NumberOfFrames: '%s' is not a frame "
                                 "count, assuming 1",
                                 text));
    return absl::OkStatus();
  }
  header.number_of_frames = frames;
  return absl::OkStatus();
}

/// @brief "Family^Given^Middle^Prefix^Suffix"
absl::Status DecodePatientName(ByteCursor& payload, DicomHeader& header,
                               WarningSink& warnings) {
  DECLARE_ASSIGN_OR_RETURN(std::string, text, ReadText(payload));
  if (text.empty()) {
    return absl::OkStatus();
  }
  // Only the alphabetic representation; ideographic and phonetic groups
  // follow '='
  const std::string_view alphabetic =
      std::string_view(text).substr(0, text.find('='));
  std::vector<std::string_view> parts = absl::StrSplit(alphabetic, '^');
  auto& patient = header.patient;
  if (!parts.empty() && !parts[0].empty()) {
    patient.surname = std::string(absl::StripAsciiWhitespace(parts[0]));
  }
  if (parts.size() > 1 && !parts[1].empty()) {
    patient.first_name = std::string(absl::StripAsciiWhitespace(parts[1]));
  }
  if (patient.first_name.has_value() && patient.surname.has_value()) {
    patient.name = absl::StrCat(*patient.first_name, " ", *patient.surname);
  } else if (patient.surname.has_value() || patient.first_name.has_value()) {
    patient.name = patient.surname.has_value() ? patient.surname
                                               : patient.first_name;
  } else {
    patient.name = text;
  }
  return absl::OkStatus();
}

absl::Status DecodeBirthDate(ByteCursor& payload, DicomHeader& header,
                             WarningSink& warnings) {
  DECLARE_ASSIGN_OR_RETURN(std::string, text, ReadText(payload));
  header.patient.birthdate =
      metadata::ParseDicomDate(text).Resolve("PatientBirthDate", warnings);
  return absl::OkStatus();
}

constexpr metadata::FieldRule<DicomHeader> kHeaderRules[] = {
    {ToType(DicomTag::kModality), "Modality",
     DecodeText<DicomTag::kModality, &DicomHeader::modality>},
    {ToType(DicomTag::kPhotometricInterpretation),
     "PhotometricInterpretation",
     DecodeText<DicomTag::kPhotometricInterpretation,
                &DicomHeader::photometric_interpretation>},
    {ToType(DicomTag::kNumberOfFrames), "NumberOfFrames",
     DecodeNumberOfFrames},
    {ToType(DicomTag::kPatientName), "PatientName", DecodePatientName},
    {ToType(DicomTag::kPatientId), "PatientID",
     DecodePatientText<DicomTag::kPatientId, &PatientMetadata::patient_id>},
    {ToType(DicomTag::kPatientBirthDate), "PatientBirthDate",
     DecodeBirthDate},
    {ToType(DicomTag::kPatientSex), "PatientSex",
     DecodePatientText<DicomTag::kPatientSex, &PatientMetadata::sex>},
    {ToType(DicomTag::kManufacturer), "Manufacturer",
     DecodeDeviceText<DicomTag::kManufacturer,
                      &DeviceMetadata::manufacturer>},
    {ToType(DicomTag::kManufacturerModelName), "ManufacturerModelName",
     DecodeDeviceText<DicomTag::kManufacturerModelName,
                      &DeviceMetadata::model>},
    {ToType(DicomTag::kDeviceSerialNumber), "DeviceSerialNumber",
     DecodeDeviceText<DicomTag::kDeviceSerialNumber,
                      &DeviceMetadata::serial_number>},
    {ToType(DicomTag::kSoftwareVersions), "SoftwareVersions",
     DecodeDeviceText<DicomTag::kSoftwareVersions,
                      &DeviceMetadata::software_version>},
    {ToType(DicomTag::kAcquisitionDateTime), "AcquisitionDateTime",
     DecodeText<DicomTag::kAcquisitionDateTime, &DicomHeader::acquisition_dt>},
    {ToType(DicomTag::kAcquisitionDate), "AcquisitionDate",
     DecodeText<DicomTag::kAcquisitionDate, &DicomHeader::acquisition_date>},
    {ToType(DicomTag::kAcquisitionTime), "AcquisitionTime",
     DecodeText<DicomTag::kAcquisitionTime, &DicomHeader::acquisition_time>},
    {ToType(DicomTag::kStudyDate), "StudyDate",
     DecodeText<DicomTag::kStudyDate, &DicomHeader::study_date>},
    {ToType(DicomTag::kStudyTime), "StudyTime",
     DecodeText<DicomTag::kStudyTime, &DicomHeader::study_time>},
};

/// @brief Image Pixel module attributes (all US)
void ReadPixelModule(const gdcm::DataSet& dataset, DicomHeader& header) {
  header.rows = GetUnsignedShort<0x0028, 0x0010>(dataset);
  header.columns = GetUnsignedShort<0x0028, 0x0011>(dataset);
  header.samples_per_pixel =
      GetUnsignedShort<0x0028, 0x0002>(dataset).value_or(1);
  header.bits_allocated = GetUnsignedShort<0x0028, 0x0100>(dataset).value_or(8);
  header.bits_stored = GetUnsignedShort<0x0028, 0x0101>(dataset);
  header.high_bit = GetUnsignedShort<0x0028, 0x0102>(dataset);
  header.pixel_representation =
      GetUnsignedShort<0x0028, 0x0103>(dataset).value_or(0);
  header.planar_configuration =
      GetUnsignedShort<0x0028, 0x0006>(dataset).value_or(0);
}

/// @brief Laterality and acquisition time, which combine several elements
void FinishHeader(const gdcm::DataSet& dataset, DicomHeader& header,
                  WarningSink& warnings) {
  // Series-level Laterality wins over ImageLaterality; "B" (both eyes) is a
  // valid code that maps to unknown
  for (DicomTag tag : {DicomTag::kLaterality, DicomTag::kImageLaterality}) {
    auto value = ValueOf(dataset, ToGdcmTag(tag));
    if (!value.has_value()) {
      continue;
    }
    ByteCursor payload(*value);
    auto code = ReadText(payload);
    if (!code.ok() || code->empty()) {
      continue;
    }
    header.laterality = metadata::ParseLateralityCode(*code);
    if (header.laterality != Laterality::kUnknown) {
      break;
    }
    if (*code != "B") {
      warnings.Add(ErrorKind::kMetadataField,
                   absl::StrFormat("Field %s: unknown code '%s'",
                                   GetName(tag), *code));
    }
  }

  if (header.acquisition_dt.has_value()) {
    header.acquisition_datetime =
        metadata::ParseDicomDt(*header.acquisition_dt)
            .Resolve("AcquisitionDateTime", warnings);
  }
  if (!header.acquisition_datetime.has_value() &&
      header.acquisition_date.has_value()) {
    header.acquisition_datetime =
        metadata::ParseDicomDateTime(*header.acquisition_date,
                                     header.acquisition_time.value_or(""))
            .Resolve("AcquisitionDate", warnings);
  }
  if (!header.acquisition_datetime.has_value() &&
      header.study_date.has_value()) {
    header.acquisition_datetime =
        metadata::ParseDicomDateTime(*header.study_date,
                                     header.study_time.value_or(""))
            .Resolve("StudyDate", warnings);
  }
}

// ---------------------------------------------------------------------------
// Pixel data
// ---------------------------------------------------------------------------

/// @brief Single-frame image with the pixel description of the data set
gdcm::Image FrameTemplate(const DicomHeader& header,
                          const gdcm::TransferSyntax& syntax) {
  const auto bits_stored =
      static_cast<unsigned short>(header.bits_stored.value_or(
          header.bits_allocated));
  const auto high_bit = static_cast<unsigned short>(
      header.high_bit.value_or(bits_stored > 0 ? bits_stored - 1 : 0));

  gdcm::PhotometricInterpretation::PIType photometric =
      header.samples_per_pixel == 3
          ? gdcm::PhotometricInterpretation::RGB
          : gdcm::PhotometricInterpretation::MONOCHROME2;
  if (header.photometric_interpretation.has_value()) {
    const auto declared = gdcm::PhotometricInterpretation::GetPIType(
        header.photometric_interpretation->c_str());
    if (declared != gdcm::PhotometricInterpretation::UNKNOWN &&
        declared != gdcm::PhotometricInterpretation::PI_END) {
      photometric = declared;
    }
  }

  gdcm::Image image;
  image.SetNumberOfDimensions(2);
  image.SetDimension(0, *header.columns);
  image.SetDimension(1, *header.rows);
  image.SetPixelFormat(gdcm::PixelFormat(
      static_cast<unsigned short>(header.samples_per_pixel),
      static_cast<unsigned short>(header.bits_allocated), bits_stored,
      high_bit, static_cast<unsigned short>(header.pixel_representation)));
  image.SetPhotometricInterpretation(
      gdcm::PhotometricInterpretation(photometric));
  image.SetPlanarConfiguration(header.planar_configuration);
  image.SetTransferSyntax(syntax);
  return image;
}

/// @brief Decode one frame's pixel element through GDCM's codecs
absl::StatusOr<Slice> DecodeFrame(gdcm::Image image,
                                  const gdcm::DataElement& pixels,
                                  const DicomHeader& header) {
  const uint32_t width = *header.columns;
  const uint32_t height = *header.rows;
  const bool color = header.samples_per_pixel == 3;
  const SliceGeometry geometry{
      width, height, color ? PixelFormat::kRGB : PixelFormat::kGray,
      header.bits_allocated == 16 ? DataType::kUInt16 : DataType::kUInt8};

  image.SetDataElement(pixels);
  std::vector<uint8_t> buffer(image.GetBufferLength());
  bool decoded = false;
  try {
    decoded = image.GetBuffer(reinterpret_cast<char*>(buffer.data()));
  } catch (const std::exception& e) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             absl::StrCat("GDCM failed on the frame: ",
                                          e.what()));
  }
  if (!decoded) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("GDCM cannot decode the frame (transfer syntax %s)",
                        header.transfer_syntax_uid));
  }
  // GDCM leaves native planar data as stored: R plane, G plane, B plane
  if (!color || image.GetPlanarConfiguration() != 1) {
    return Slice::FromPixels(geometry, std::move(buffer));
  }

  const size_t plane = static_cast<size_t>(width) * height;
  if (buffer.size() < plane * 3) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             "Planar frame is shorter than three planes");
  }
  std::vector<uint8_t> pixels_rgb(plane * 3);
  for (size_t i = 0; i < plane; ++i) {
    for (size_t c = 0; c < 3; ++c) {
      pixels_rgb[i * 3 + c] = buffer[c * plane + i];
    }
  }
  return Slice::FromPixels(geometry, std::move(pixels_rgb));
}

/// @brief Pixel element holding @p fragments, for a one-frame image
gdcm::DataElement FragmentsElement(
    const gdcm::DataElement& source,
    const std::vector<const gdcm::Fragment*>& fragments) {
  gdcm::SmartPointer<gdcm::SequenceOfFragments> sequence =
      new gdcm::SequenceOfFragments;
  for (const gdcm::Fragment* fragment : fragments) {
    sequence->AddFragment(*fragment);
  }
  gdcm::DataElement pixels(source.GetTag());
  pixels.SetVR(source.GetVR());
  pixels.SetValue(*sequence);
  pixels.SetVLToUndefined();
  return pixels;
}

uint64_t FragmentLength(const gdcm::Fragment& fragment) {
  const gdcm::ByteValue* value = fragment.GetByteValue();
  return value != nullptr ? value->GetLength() : 0;
}

/// @brief Fragments of each frame, at most @p frames of them
///
/// With a basic offset table each entry is the offset of a frame's first
/// fragment item, relative to the first fragment item. Without one, frames
/// map to fragments one to one, or a single frame takes every fragment.
absl::StatusOr<std::vector<std::vector<const gdcm::Fragment*>>> GroupFragments(
    const gdcm::SequenceOfFragments& sequence, uint32_t frames) {
  const size_t count = sequence.GetNumberOfFragments();
  if (count == 0) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             "Encapsulated pixel data has no fragments");
  }

  std::vector<std::vector<const gdcm::Fragment*>> grouped;
  const gdcm::ByteValue* table = sequence.GetTable().GetByteValue();
  if (table != nullptr && table->GetLength() >= 4) {
    ByteCursor entries(ByteView(
        reinterpret_cast<const uint8_t*>(table->GetPointer()),
        table->GetLength()));
    const uint64_t listed = std::min<uint64_t>(frames, entries.Size() / 4);
    std::vector<uint64_t> starts;
    for (uint64_t i = 0; i < listed; ++i) {
      DECLARE_ASSIGN_OR_RETURN(uint32_t, start,
                               entries.ReadU32(Endian::kLittle));
      starts.push_back(start);
    }
    grouped.resize(starts.size());
    uint64_t position = 0;
    for (size_t i = 0; i < count; ++i) {
      const gdcm::Fragment& fragment = sequence.GetFragment(i);
      auto next = std::upper_bound(starts.begin(), starts.end(), position);
      if (next != starts.begin()) {
        grouped[std::distance(starts.begin(), next) - 1].push_back(&fragment);
      }
      position += kFragmentItemHeaderSize + FragmentLength(fragment);
    }
    return grouped;
  }

  if (frames == 1) {
    grouped.emplace_back();
    for (size_t i = 0; i < count; ++i) {
      grouped[0].push_back(&sequence.GetFragment(i));
    }
    return grouped;
  }
  if (count > frames) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Cannot map %u fragments to %u frames without an "
                        "offset table",
                        count, frames));
  }
  // One fragment per frame; a shortfall is reported by the caller
  for (size_t i = 0; i < count; ++i) {
    grouped.push_back({&sequence.GetFragment(i)});
  }
  return grouped;
}

Warning FrameShortfall(uint32_t declared, uint64_t present,
                       std::string_view holder) {
  return Warning{ErrorKind::kOutOfBounds,
                 absl::StrFormat("NumberOfFrames declares %u frames but %s "
                                 "holds %u",
                                 declared, holder, present),
                 std::nullopt};
}

}  // namespace

absl::StatusOr<uint64_t> ReadDicomPreamble(ByteView data) {
  const ByteCursor cursor(data);
  auto magic = cursor.ViewAt(kPreambleSize, kMagic.size());
  if (!magic.ok() ||
      !std::equal(magic->begin(), magic->end(), kMagic.begin())) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, kPreambleSize,
                                "Not a DICOM file (missing DICM magic)");
  }
  return kPreambleSize + kMagic.size();
}

DicomReader::DicomReader(RawBuffer buffer, const ReadOptions& options,
                         std::unique_ptr<gdcm::Reader> parsed,
                         DicomHeader header,
                         std::vector<Warning> open_warnings)
    : FormatReader(std::move(buffer), options),
      parsed_(std::move(parsed)),
      header_(std::move(header)),
      open_warnings_(std::move(open_warnings)) {}

DicomReader::~DicomReader() = default;

absl::Status DicomReader::ValidateSignature(ByteView data) {
  RETURN_IF_ERROR(ReadDicomPreamble(data).status(), "Invalid DICOM header");
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<DicomReader>> DicomReader::CreateReaderImpl(
    RawBuffer buffer, const ReadOptions& options) {
  WarningSink warnings("DICOM");

  auto parsed = std::make_unique<gdcm::Reader>();
  ViewStreamBuf stream_buffer(buffer.View());
  std::istream stream(&stream_buffer);
  parsed->SetStream(stream);
  bool complete = false;
  try {
    complete = parsed->Read();
  } catch (const std::exception& e) {
    return MAKE_DECODE_ERROR(ErrorKind::kUnrecognizedFormat,
                             absl::StrCat("GDCM cannot parse the file: ",
                                          e.what()));
  }

  const gdcm::File& file = parsed->GetFile();
  const gdcm::DataSet& dataset = file.GetDataSet();
  if (dataset.IsEmpty()) {
    return MAKE_DECODE_ERROR(ErrorKind::kUnrecognizedFormat,
                             "GDCM found no data set in the file");
  }
  if (!complete) {
    warnings.Add(ErrorKind::kOutOfBounds,
                 "Data set ends early; the elements read before the cut are "
                 "kept");
  }

  DicomHeader header;
  const auto uid =
      ValueOf(file.GetHeader(), ToGdcmTag(DicomTag::kTransferSyntaxUid));
  if (!uid.has_value()) {
    return MAKE_DECODE_ERROR(ErrorKind::kUnrecognizedFormat,
                             "File meta has no TransferSyntaxUID");
  }
  ByteCursor uid_payload(*uid);
  ASSIGN_OR_RETURN(header.transfer_syntax_uid, ReadText(uid_payload));
  if (gdcm::TransferSyntax::GetTSType(header.transfer_syntax_uid.c_str()) ==
      gdcm::TransferSyntax::TS_END) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kUnrecognizedFormat,
        absl::StrFormat("Unknown transfer syntax '%s'",
                        header.transfer_syntax_uid));
  }

  for (const auto& rule : kHeaderRules) {
    auto value = ValueOf(dataset, ToGdcmTag(rule.type));
    if (value.has_value()) {
      metadata::ApplyFieldRule(rule, ByteCursor(*value), header, warnings);
    }
  }
  ReadPixelModule(dataset, header);
  FinishHeader(dataset, header, warnings);
  if (!header.modality.has_value()) {
    warnings.Add(ErrorKind::kMetadataField,
                 "No Modality; multi-frame images are read as OCT, single "
                 "frames as fundus");
  }

  VLOG(1) << "DICOM " << header.transfer_syntax_uid << ": "
          << header.number_of_frames << " declared frames, modality "
          << header.modality.value_or("?");
  return std::unique_ptr<DicomReader>(
      new DicomReader(std::move(buffer), options, std::move(parsed),
                      std::move(header), warnings.Take()));
}

bool DicomReader::IsEncapsulated() const {
  const gdcm::DataSet& dataset = parsed_->GetFile().GetDataSet();
  const gdcm::Tag tag = ToGdcmTag(DicomTag::kPixelData);
  return dataset.FindDataElement(tag) &&
         dataset.GetDataElement(tag).GetSequenceOfFragments() != nullptr;
}

bool DicomReader::IsOctModality() const {
  if (!header_.modality.has_value()) {
    return header_.number_of_frames > 1;
  }
  return *header_.modality == "OPT";
}

bool DicomReader::IsFundusModality() const {
  if (!header_.modality.has_value()) {
    return header_.number_of_frames <= 1;
  }
  return *header_.modality == "OP" || *header_.modality == "XC";
}

absl::StatusOr<DicomReader::Frames> DicomReader::DecodeFrames() const {
  const gdcm::DataSet& dataset = parsed_->GetFile().GetDataSet();
  if (!dataset.FindDataElement(ToGdcmTag(DicomTag::kPixelData)) ||
      dataset.GetDataElement(ToGdcmTag(DicomTag::kPixelData)).IsEmpty()) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             "Data set has no PixelData");
  }
  if (!header_.rows.has_value() || !header_.columns.has_value() ||
      *header_.rows == 0 || *header_.columns == 0) {
    return MAKE_DECODE_ERROR(ErrorKind::kMetadataField,
                             "Image has no Rows and Columns");
  }
  const uint32_t samples = header_.samples_per_pixel;
  const uint32_t bits = header_.bits_allocated;
  const bool gray = samples == 1 && (bits == 8 || bits == 16);
  const bool color = samples == 3 && bits == 8;
  if (!gray && !color) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kPixelDecode,
        absl::StrFormat("Unsupported pixel layout: %u samples of %u bits",
                        samples, bits));
  }
  if (IsEncapsulated()) {
    return DecodeEncapsulatedFrames();
  }
  return DecodeNativeFrames();
}

absl::StatusOr<DicomReader::Frames> DicomReader::DecodeNativeFrames() const {
  const gdcm::File& file = parsed_->GetFile();
  const gdcm::DataElement& pixel_data =
      file.GetDataSet().GetDataElement(ToGdcmTag(DicomTag::kPixelData));
  const gdcm::ByteValue* value = pixel_data.GetByteValue();
  if (value == nullptr) {
    return MAKE_DECODE_ERROR(ErrorKind::kPixelDecode,
                             "PixelData has no value");
  }

  const uint64_t frame_size = static_cast<uint64_t>(*header_.columns) *
                              *header_.rows * header_.samples_per_pixel *
                              (header_.bits_allocated / 8);
  const uint64_t length = value->GetLength();
  const uint64_t present =
      std::min<uint64_t>(header_.number_of_frames, length / frame_size);
  if (present == 0) {
    return MAKE_DECODE_ERROR(
        ErrorKind::kOutOfBounds,
        absl::StrFormat("PixelData of %u bytes holds no complete %u byte "
                        "frame",
                        length, frame_size));
  }

  Frames frames;
  if (present < header_.number_of_frames) {
    frames.shortfall =
        FrameShortfall(header_.number_of_frames, present, "PixelData");
  }

  const gdcm::Image image = FrameTemplate(
      header_, file.GetHeader().GetDataSetTransferSyntax());
  frames.slices.reserve(present);
  for (uint64_t i = 0; i < present; ++i) {
    gdcm::DataElement frame(pixel_data.GetTag());
    frame.SetVR(pixel_data.GetVR());
    frame.SetByteValue(value->GetPointer() + i * frame_size,
                       static_cast<uint32_t>(frame_size));
    frames.slices.push_back(DecodeFrame(image, frame, header_));
  }
  return frames;
}

absl::StatusOr<DicomReader::Frames> DicomReader::DecodeEncapsulatedFrames()
    const {
  const gdcm::File& file = parsed_->GetFile();
  const gdcm::DataElement& pixel_data =
      file.GetDataSet().GetDataElement(ToGdcmTag(DicomTag::kPixelData));
  const gdcm::SequenceOfFragments* sequence =
      pixel_data.GetSequenceOfFragments();

  DECLARE_ASSIGN_OR_RETURN(
      std::vector<std::vector<const gdcm::Fragment*>>, grouped,
      GroupFragments(*sequence, header_.number_of_frames));

  Frames frames;
  if (grouped.size() < header_.number_of_frames) {
    frames.shortfall = FrameShortfall(header_.number_of_frames,
                                      grouped.size(), "the fragment list");
  }

  const gdcm::Image image = FrameTemplate(
      header_, file.GetHeader().GetDataSetTransferSyntax());
  frames.slices.reserve(grouped.size());
  for (size_t i = 0; i < grouped.size(); ++i) {
    if (grouped[i].empty()) {
      frames.slices.push_back(MAKE_DECODE_ERROR(
          ErrorKind::kPixelDecode,
          absl::StrFormat("Frame %u has no fragments", i)));
      continue;
    }
    frames.slices.push_back(DecodeFrame(
        image, FragmentsElement(pixel_data, grouped[i]), header_));
  }
  return frames;
}

absl::StatusOr<DecodeResult<OctVolume>> DicomReader::ReadOctVolumes() const {
  ResultBuilder<OctVolume> builder;
  builder.FileWarnings().Absorb(open_warnings_);
  if (!IsOctModality()) {
    return std::move(builder).Finish();
  }

  auto frames = DecodeFrames();
  if (!frames.ok()) {
    builder.AddFailure(frames.status(), ErrorKind::kPixelDecode);
    return std::move(builder).Finish();
  }

  pixel::VolumeAssembler assembler(kVolumeId);
  for (size_t i = 0; i < frames->slices.size(); ++i) {
    assembler.Add(static_cast<int64_t>(i), std::move(frames->slices[i]));
  }

  WarningSink warnings(kVolumeId);
  if (frames->shortfall.has_value()) {
    warnings.Add(*std::move(frames->shortfall));
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

absl::StatusOr<DecodeResult<FundusImage>> DicomReader::ReadFundusImages()
    const {
  ResultBuilder<FundusImage> builder;
  builder.FileWarnings().Absorb(open_warnings_);
  if (!IsFundusModality()) {
    return std::move(builder).Finish();
  }

  auto frames = DecodeFrames();
  if (!frames.ok()) {
    builder.AddFailure(frames.status(), ErrorKind::kPixelDecode);
    return std::move(builder).Finish();
  }
  if (frames->shortfall.has_value()) {
    builder.FileWarnings().Add(*std::move(frames->shortfall));
  }

  for (size_t i = 0; i < frames->slices.size(); ++i) {
    auto& slice = frames->slices[i];
    if (!slice.ok()) {
      builder.AddFailure(slice.status(), ErrorKind::kPixelDecode);
      continue;
    }
    FundusImage image;
    image.image_id = absl::StrCat("fundus_", i);
    image.image = *std::move(slice);
    image.laterality = header_.laterality;
    image.acquisition_datetime = header_.acquisition_datetime;
    image.patient = header_.patient;
    image.device = header_.device;
    builder.Add(std::move(image));
  }
  return std::move(builder).Finish();
}

FormatDescriptor CreateDicomFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".dcm";
  desc.aliases = {".dicom"};
  desc.format_name = "DICOM";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kFundusImages);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kCompressed);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kPatientMetadata);

  desc.signature_check = [](ByteView data) {
    return ReadDicomPreamble(data).ok();
  };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(
        std::unique_ptr<DicomReader>, reader,
        DicomReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace dicom
}  // namespace formats
}  // namespace fastoct
