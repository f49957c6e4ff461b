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

#include <zlib.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fastoct/errors.h"
#include "fastoct/testing/byte_writer.h"
#include "fastoct/testing/jpeg_fixture.h"
#include "gtest/gtest.h"

namespace fastoct {
namespace formats {
namespace dicom {
namespace {

using fastoct::testing::ByteWriter;
using fastoct::testing::EncodeUniformGrayJpeg;
using fastoct::testing::EncodeUniformRgbJpeg;

constexpr std::string_view kImplicitLittle = "1.2.840.10008.1.2";
constexpr std::string_view kExplicitLittle = "1.2.840.10008.1.2.1";
constexpr std::string_view kDeflated = "1.2.840.10008.1.2.1.99";
constexpr std::string_view kExplicitBig = "1.2.840.10008.1.2.2";
constexpr std::string_view kJpegBaselineUid = "1.2.840.10008.1.2.4.50";

constexpr uint16_t kColumns = 4;
constexpr uint16_t kRows = 3;

// (group << 16) | element
constexpr uint32_t kTransferSyntaxUid = 0x00020010;
constexpr uint32_t kAcquisitionDateTime = 0x0008002A;
constexpr uint32_t kModality = 0x00080060;
constexpr uint32_t kManufacturer = 0x00080070;
constexpr uint32_t kProcedureCodeSequence = 0x00081032;
constexpr uint32_t kManufacturerModelName = 0x00081090;
constexpr uint32_t kPatientName = 0x00100010;
constexpr uint32_t kPatientId = 0x00100020;
constexpr uint32_t kPatientBirthDate = 0x00100030;
constexpr uint32_t kPatientSex = 0x00100040;
constexpr uint32_t kDeviceSerialNumber = 0x00181000;
constexpr uint32_t kSoftwareVersions = 0x00181020;
constexpr uint32_t kLaterality = 0x00200060;
constexpr uint32_t kImageLaterality = 0x00200062;
constexpr uint32_t kSamplesPerPixel = 0x00280002;
constexpr uint32_t kPhotometricInterpretation = 0x00280004;
constexpr uint32_t kPlanarConfiguration = 0x00280006;
constexpr uint32_t kNumberOfFrames = 0x00280008;
constexpr uint32_t kRowsTag = 0x00280010;
constexpr uint32_t kColumnsTag = 0x00280011;
constexpr uint32_t kBitsAllocated = 0x00280100;
constexpr uint32_t kBitsStored = 0x00280101;
constexpr uint32_t kHighBit = 0x00280102;
constexpr uint32_t kPixelRepresentation = 0x00280103;
constexpr uint32_t kPixelData = 0x7FE00010;

uint16_t Sample(uint32_t frame, uint32_t x, uint32_t y) {
  return static_cast<uint16_t>(1000 * frame + 10 * y + x);
}

/// Writes data set elements in one transfer syntax
class DatasetWriter {
 public:
  DatasetWriter(bool explicit_vr, bool big_endian)
      : explicit_vr_(explicit_vr), big_(big_endian) {}

  DatasetWriter& Text(uint32_t tag, std::string_view vr,
                      std::string_view text) {
    std::string padded(text);
    if (padded.size() % 2 != 0) {
      padded.push_back(vr == "UI" ? '\0' : ' ');
    }
    Header(tag, vr, static_cast<uint32_t>(padded.size()));
    w_.PutString(padded);
    return *this;
  }

  DatasetWriter& Us(uint32_t tag, uint16_t value) {
    Header(tag, "US", 2);
    w_.PutU16(value, big_);
    return *this;
  }

  DatasetWriter& Raw(uint32_t tag, std::string_view vr,
                     const std::vector<uint8_t>& bytes) {
    Header(tag, vr, static_cast<uint32_t>(bytes.size()));
    w_.PutBytes(bytes);
    return *this;
  }

  /// Undefined-length sequence holding one undefined-length item
  DatasetWriter& Sequence(uint32_t tag, std::string_view nested_modality) {
    Header(tag, "SQ", 0xFFFFFFFF);
    Item(0xE000, 0xFFFFFFFF);
    Text(kModality, "CS", nested_modality);
    Item(0xE00D, 0);
    Item(0xE0DD, 0);
    return *this;
  }

  /// Encapsulated PixelData: offset table, fragments, delimiter
  DatasetWriter& Encapsulated(const std::vector<uint32_t>& offset_table,
                              const std::vector<std::vector<uint8_t>>& frags) {
    Header(kPixelData, "OB", 0xFFFFFFFF);
    Item(0xE000, static_cast<uint32_t>(offset_table.size() * 4));
    for (uint32_t offset : offset_table) {
      w_.PutU32(offset, big_);
    }
    for (const auto& fragment : frags) {
      Item(0xE000, static_cast<uint32_t>(fragment.size()));
      w_.PutBytes(fragment);
    }
    Item(0xE0DD, 0);
    return *this;
  }

  std::vector<uint8_t> Take() { return w_.Take(); }

 private:
  void Header(uint32_t tag, std::string_view vr, uint32_t length) {
    w_.PutU16(static_cast<uint16_t>(tag >> 16), big_)
        .PutU16(static_cast<uint16_t>(tag & 0xFFFF), big_);
    if (!explicit_vr_) {
      w_.PutU32(length, big_);
      return;
    }
    w_.PutString(vr);
    if (vr == "OB" || vr == "OW" || vr == "SQ" || vr == "UN" || vr == "UT") {
      w_.PutZeros(2).PutU32(length, big_);
    } else {
      w_.PutU16(static_cast<uint16_t>(length), big_);
    }
  }

  void Item(uint16_t element, uint32_t length) {
    w_.PutU16(0xFFFE, big_).PutU16(element, big_).PutU32(length, big_);
  }

  ByteWriter w_;
  bool explicit_vr_;
  bool big_;
};

/// Preamble, magic and a file meta group naming @p uid
std::vector<uint8_t> Part10(std::string_view uid,
                            const std::vector<uint8_t>& dataset) {
  ByteWriter w;
  w.PutZeros(128).PutString("DICM");
  DatasetWriter meta(true, false);
  meta.Text(kTransferSyntaxUid, "UI", uid);
  w.PutBytes(meta.Take()).PutBytes(dataset);
  return w.Take();
}

std::vector<uint8_t> Deflate(const std::vector<uint8_t>& input) {
  z_stream strm{};
  EXPECT_EQ(deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8,
                         Z_DEFAULT_STRATEGY),
            Z_OK);
  std::vector<uint8_t> out(deflateBound(&strm, input.size()));
  strm.next_in = const_cast<uint8_t*>(input.data());
  strm.avail_in = static_cast<uInt>(input.size());
  strm.next_out = out.data();
  strm.avail_out = static_cast<uInt>(out.size());
  EXPECT_EQ(deflate(&strm, Z_FINISH), Z_STREAM_END);
  out.resize(out.size() - strm.avail_out);
  deflateEnd(&strm);
  return out;
}

std::vector<uint8_t> NativeFrames(uint32_t frames, bool big_endian) {
  ByteWriter w;
  for (uint32_t k = 0; k < frames; ++k) {
    for (uint32_t y = 0; y < kRows; ++y) {
      for (uint32_t x = 0; x < kColumns; ++x) {
        w.PutU16(Sample(k, x, y), big_endian);
      }
    }
  }
  return w.Take();
}

void PutPatientAndDevice(DatasetWriter& d) {
  d.Text(kAcquisitionDateTime, "DT", "20200102030405.123")
      .Text(kManufacturer, "LO", "Acme Ophthalmics")
      .Text(kPatientName, "PN", "Doe^Jane")
      .Text(kPatientId, "LO", "PID-9")
      .Text(kPatientBirthDate, "DA", "19700101")
      .Text(kPatientSex, "CS", "F")
      .Text(kManufacturerModelName, "LO", "Scanner 3000")
      .Text(kDeviceSerialNumber, "LO", "SN-1")
      .Text(kSoftwareVersions, "LO", "4.2");
}

/// Native uint16 OPT file with @p frames frames, elements in tag order
std::vector<uint8_t> NativeOctFile(std::string_view uid, bool explicit_vr,
                                   bool big_endian,
                                   std::string_view frames = "2",
                                   uint32_t pixel_frames = 2) {
  DatasetWriter d(explicit_vr, big_endian);
  d.Sequence(kProcedureCodeSequence, "XX");
  d.Text(kModality, "CS", "OPT");
  PutPatientAndDevice(d);
  d.Text(kLaterality, "CS", "R");
  d.Us(kSamplesPerPixel, 1)
      .Text(kPhotometricInterpretation, "CS", "MONOCHROME2")
      .Text(kNumberOfFrames, "IS", frames)
      .Us(kRowsTag, kRows)
      .Us(kColumnsTag, kColumns)
      .Us(kBitsAllocated, 16)
      .Us(kBitsStored, 16)
      .Us(kHighBit, 15)
      .Us(kPixelRepresentation, 0)
      .Raw(kPixelData, "OW",
           NativeFrames(pixel_frames, big_endian));
  return Part10(uid, d.Take());
}

void ExpectNativeVolume(const DicomReader& reader) {
  auto volumes = reader.ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->size(), 1u);
  EXPECT_EQ(volumes->CountWarnings(), 0u);

  const OctVolume& volume = volumes->items[0].value;
  ASSERT_EQ(volume.GetNumSlices(), 2u);
  EXPECT_EQ(volume.GetGeometry().width, kColumns);
  EXPECT_EQ(volume.GetGeometry().height, kRows);
  EXPECT_EQ(volume.GetGeometry().dtype, DataType::kUInt16);
  EXPECT_EQ(volume.slices[0].At<uint16_t>(3, 2), Sample(0, 3, 2));
  EXPECT_EQ(volume.slices[1].At<uint16_t>(1, 0), Sample(1, 1, 0));
  EXPECT_EQ(volume.laterality, Laterality::kRight);
}

TEST(DicomReaderTest, MissingMagicIsUnrecognizedFormat) {
  std::vector<uint8_t> bytes = NativeOctFile(kExplicitLittle, true, false);
  bytes[128] = 'X';
  auto reader = DicomReader::FromBuffer(bytes);
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kUnrecognizedFormat));

  auto short_file = DicomReader::FromBuffer(std::vector<uint8_t>(100, 0));
  EXPECT_TRUE(
      IsErrorKind(short_file.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(DicomReaderTest, UnknownTransferSyntaxIsUnrecognizedFormat) {
  auto reader =
      DicomReader::FromBuffer(NativeOctFile("1.2.3.4", true, false));
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(DicomReaderTest, ExplicitLittleEndianOctVolume) {
  auto reader =
      DicomReader::FromBuffer(NativeOctFile(kExplicitLittle, true, false));
  ASSERT_TRUE(reader.ok()) << reader.status();

  const DicomHeader& header = (*reader)->GetHeader();
  EXPECT_EQ(header.transfer_syntax_uid, kExplicitLittle);
  EXPECT_EQ(header.modality, "OPT");
  EXPECT_EQ(header.number_of_frames, 2u);
  EXPECT_EQ(header.patient.name, "Jane Doe");
  EXPECT_EQ(header.patient.surname, "Doe");
  EXPECT_EQ(header.patient.first_name, "Jane");
  EXPECT_EQ(header.patient.patient_id, "PID-9");
  EXPECT_EQ(header.patient.sex, "F");
  EXPECT_EQ(header.patient.birthdate, absl::CivilDay(1970, 1, 1));
  EXPECT_EQ(header.acquisition_datetime,
            absl::CivilSecond(2020, 1, 2, 3, 4, 5));
  EXPECT_EQ(header.device.manufacturer, "Acme Ophthalmics");
  EXPECT_EQ(header.device.model, "Scanner 3000");
  EXPECT_EQ(header.device.serial_number, "SN-1");
  EXPECT_EQ(header.device.software_version, "4.2");

  ExpectNativeVolume(**reader);

  auto fundus = (*reader)->ReadFundusImages();
  ASSERT_TRUE(fundus.ok()) << fundus.status();
  EXPECT_TRUE(fundus->empty());
}

TEST(DicomReaderTest, ImplicitLittleEndianKeepsNestedElementsOut) {
  auto reader =
      DicomReader::FromBuffer(NativeOctFile(kImplicitLittle, false, false));
  ASSERT_TRUE(reader.ok()) << reader.status();

  // The Modality nested in the sequence is not a data set element
  EXPECT_EQ((*reader)->GetHeader().modality, "OPT");
  ExpectNativeVolume(**reader);
}

TEST(DicomReaderTest, ExplicitBigEndian) {
  auto reader =
      DicomReader::FromBuffer(NativeOctFile(kExplicitBig, true, true));
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetHeader().rows, kRows);
  EXPECT_EQ((*reader)->GetHeader().columns, kColumns);
  ExpectNativeVolume(**reader);
}

TEST(DicomReaderTest, DeflatedDataSetIsInflated) {
  // Same elements as the explicit little endian file, deflated after the
  // file meta group
  const std::vector<uint8_t> plain =
      NativeOctFile(kExplicitLittle, true, false);
  const std::vector<uint8_t> meta_only = Part10(kDeflated, {});
  const size_t dataset_offset = Part10(kExplicitLittle, {}).size();
  const std::vector<uint8_t> dataset(plain.begin() + dataset_offset,
                                     plain.end());

  std::vector<uint8_t> bytes = meta_only;
  const std::vector<uint8_t> compressed = Deflate(dataset);
  bytes.insert(bytes.end(), compressed.begin(), compressed.end());

  auto reader = DicomReader::FromBuffer(bytes);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetHeader().transfer_syntax_uid, kDeflated);
  EXPECT_EQ((*reader)->GetHeader().patient.patient_id, "PID-9");
  ExpectNativeVolume(**reader);
}

TEST(DicomReaderTest, JpegBaselineFundus) {
  DatasetWriter d(true, false);
  d.Text(kModality, "CS", "OP");
  PutPatientAndDevice(d);
  d.Text(kImageLaterality, "CS", "L");
  d.Us(kSamplesPerPixel, 3)
      .Text(kPhotometricInterpretation, "CS", "RGB")
      .Us(kPlanarConfiguration, 0)
      .Us(kRowsTag, 8)
      .Us(kColumnsTag, 16)
      .Us(kBitsAllocated, 8)
      .Us(kBitsStored, 8)
      .Us(kHighBit, 7)
      .Us(kPixelRepresentation, 0)
      .Encapsulated({}, {EncodeUniformRgbJpeg(16, 8, 200, 100, 50)});

  auto reader = DicomReader::FromBuffer(Part10(kJpegBaselineUid, d.Take()));
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE((*reader)->IsEncapsulated());

  auto images = (*reader)->ReadFundusImages();
  ASSERT_TRUE(images.ok()) << images.status();
  ASSERT_EQ(images->size(), 1u);
  const FundusImage& image = images->items[0].value;
  EXPECT_EQ(image.image_id, "fundus_0");
  EXPECT_EQ(image.image.GetFormat(), PixelFormat::kRGB);
  EXPECT_EQ(image.image.GetWidth(), 16u);
  EXPECT_EQ(image.image.GetHeight(), 8u);
  EXPECT_NEAR(image.image.At<uint8_t>(5, 5, 0), 200, 4);
  EXPECT_NEAR(image.image.At<uint8_t>(5, 5, 1), 100, 4);
  EXPECT_NEAR(image.image.At<uint8_t>(5, 5, 2), 50, 4);
  EXPECT_EQ(image.laterality, Laterality::kLeft);
  EXPECT_EQ(image.patient.patient_id, "PID-9");

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  EXPECT_TRUE(volumes->empty());
}

TEST(DicomReaderTest, OffsetTableGroupsFragmentsIntoFrames) {
  const std::vector<uint8_t> first = EncodeUniformGrayJpeg(kColumns, kRows, 40);
  const std::vector<uint8_t> second =
      EncodeUniformGrayJpeg(kColumns, kRows, 200);

  // Every frame split over two fragments
  const size_t half = first.size() / 2;
  std::vector<std::vector<uint8_t>> fragments = {
      {first.begin(), first.begin() + half},
      {first.begin() + half, first.end()},
      {second.begin(), second.begin() + 10},
      {second.begin() + 10, second.end()},
  };
  const uint32_t second_frame =
      static_cast<uint32_t>(8 + fragments[0].size() + 8 + fragments[1].size());

  DatasetWriter d(true, false);
  d.Text(kModality, "CS", "OPT")
      .Us(kSamplesPerPixel, 1)
      .Text(kPhotometricInterpretation, "CS", "MONOCHROME2")
      .Text(kNumberOfFrames, "IS", "2")
      .Us(kRowsTag, kRows)
      .Us(kColumnsTag, kColumns)
      .Us(kBitsAllocated, 8)
      .Encapsulated({0, second_frame}, fragments);

  auto reader = DicomReader::FromBuffer(Part10(kJpegBaselineUid, d.Take()));
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE((*reader)->IsEncapsulated());

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const OctVolume& volume = volumes->items[0].value;
  ASSERT_EQ(volume.GetNumSlices(), 2u);
  EXPECT_EQ(volume.GetGeometry().dtype, DataType::kUInt8);
  EXPECT_NEAR(volume.slices[0].At<uint8_t>(1, 1), 40, 3);
  EXPECT_NEAR(volume.slices[1].At<uint8_t>(1, 1), 200, 3);
}

TEST(DicomReaderTest, CorruptFragmentIsMissingFrame) {
  const std::vector<uint8_t> garbage = {0xFF, 0xD8, 0xFF, 0xC0, 0x00, 0x02,
                                        0x12, 0x34, 0x56, 0x78};

  DatasetWriter d(true, false);
  d.Text(kModality, "CS", "OPT")
      .Us(kSamplesPerPixel, 1)
      .Text(kPhotometricInterpretation, "CS", "MONOCHROME2")
      .Text(kNumberOfFrames, "IS", "2")
      .Us(kRowsTag, kRows)
      .Us(kColumnsTag, kColumns)
      .Us(kBitsAllocated, 8)
      .Encapsulated({}, {EncodeUniformGrayJpeg(kColumns, kRows, 90), garbage});

  auto reader = DicomReader::FromBuffer(Part10(kJpegBaselineUid, d.Take()));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 2u);
  EXPECT_FALSE(decoded.value.slices[0].IsMissing());
  EXPECT_NEAR(decoded.value.slices[0].At<uint8_t>(1, 1), 90, 3);
  EXPECT_TRUE(decoded.value.slices[1].IsMissing());
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kPixelDecode);
}

TEST(DicomReaderTest, DeclaredFramesBeyondPixelDataAreOneWarning) {
  auto reader = DicomReader::FromBuffer(
      NativeOctFile(kExplicitLittle, true, false, /*frames=*/"3",
                    /*pixel_frames=*/2));
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetHeader().number_of_frames, 3u);

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 2u);
  EXPECT_EQ(decoded.value.CountMissing(), 0u);
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kOutOfBounds);
}

TEST(DicomReaderTest, HugeNumberOfFramesIsBoundedByPixelData) {
  auto reader = DicomReader::FromBuffer(
      NativeOctFile(kExplicitLittle, true, false, /*frames=*/"4294967295",
                    /*pixel_frames=*/2));
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetHeader().number_of_frames, 4294967295u);

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 2u);
  EXPECT_EQ(decoded.value.slices[1].At<uint16_t>(1, 0), Sample(1, 1, 0));
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kOutOfBounds);
  EXPECT_NE(decoded.warnings[0].message.find("4294967295"),
            std::string::npos);
}

TEST(DicomReaderTest, TruncatedPixelDataKeepsMetadata) {
  // Cut inside the PixelData element header: 12 header and 48 value bytes
  std::vector<uint8_t> bytes = NativeOctFile(kExplicitLittle, true, false);
  bytes.resize(bytes.size() - 48 - 6);

  auto reader = DicomReader::FromBuffer(bytes);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetHeader().patient.patient_id, "PID-9");
  EXPECT_EQ((*reader)->GetHeader().rows, kRows);

  // The OCT volume has nothing to decode
  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_FALSE(volumes.ok());
  EXPECT_TRUE(IsErrorKind(volumes.status(), ErrorKind::kPixelDecode));
}

TEST(DicomReaderTest, LateralityCodes) {
  auto read = [](std::string_view code) {
    DatasetWriter d(true, false);
    d.Text(kModality, "CS", "XC")
        .Text(kLaterality, "CS", code);
    auto reader = DicomReader::FromBuffer(Part10(kExplicitLittle, d.Take()));
    EXPECT_TRUE(reader.ok()) << reader.status();
    return std::move(reader).value();
  };

  EXPECT_EQ(read("L")->GetHeader().laterality, Laterality::kLeft);

  // Both eyes is valid and unknown; anything else is a field warning
  auto both = read("B");
  EXPECT_EQ(both->GetHeader().laterality, Laterality::kUnknown);
  auto other = read("Q");
  EXPECT_EQ(other->GetHeader().laterality, Laterality::kUnknown);

  auto both_images = both->ReadOctVolumes();
  ASSERT_TRUE(both_images.ok());
  EXPECT_TRUE(both_images->warnings.empty());
  auto other_images = other->ReadOctVolumes();
  ASSERT_TRUE(other_images.ok());
  ASSERT_EQ(other_images->warnings.size(), 1u);
  EXPECT_EQ(other_images->warnings[0].kind, ErrorKind::kMetadataField);
}

TEST(DicomReaderTest, MissingRowsFailsTheImage) {
  DatasetWriter d(true, false);
  d.Text(kModality, "CS", "OP")
      .Us(kColumnsTag, kColumns)
      .Raw(kPixelData, "OB", std::vector<uint8_t>(12, 7));

  auto reader = DicomReader::FromBuffer(Part10(kExplicitLittle, d.Take()));
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto images = (*reader)->ReadFundusImages();
  ASSERT_FALSE(images.ok());
  EXPECT_TRUE(IsErrorKind(images.status(), ErrorKind::kMetadataField));
}

TEST(DicomReaderTest, SingleFrameWithoutModalityIsFundus) {
  DatasetWriter d(true, false);
  d.Us(kRowsTag, kRows)
      .Us(kColumnsTag, kColumns)
      .Raw(kPixelData, "OB", std::vector<uint8_t>(12, 7));

  auto reader = DicomReader::FromBuffer(Part10(kExplicitLittle, d.Take()));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto images = (*reader)->ReadFundusImages();
  ASSERT_TRUE(images.ok()) << images.status();
  ASSERT_EQ(images->size(), 1u);
  EXPECT_EQ(images->items[0].value.image.At<uint8_t>(3, 2), 7);
  ASSERT_EQ(images->warnings.size(), 1u);
  EXPECT_EQ(images->warnings[0].kind, ErrorKind::kMetadataField);
}

TEST(DicomReaderTest, DescriptorAcceptsMagic) {
  const FormatDescriptor desc = CreateDicomFormatDescriptor();
  EXPECT_TRUE(desc.HandlesExtension(".dcm"));
  EXPECT_TRUE(desc.HandlesExtension(".dicom"));
  EXPECT_TRUE(desc.Accepts(NativeOctFile(kExplicitLittle, true, false)));
  EXPECT_FALSE(desc.Accepts(std::vector<uint8_t>(200, 0)));
}

}  // namespace
}  // namespace dicom
}  // namespace formats
}  // namespace fastoct
