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

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fastoct/errors.h"
#include "fastoct/readers/bioptigen/bioptigen.h"
#include "fastoct/testing/byte_writer.h"
#include "gtest/gtest.h"

namespace fastoct {
namespace formats {
namespace optovue {
namespace {

using fastoct::testing::ByteWriter;

constexpr uint32_t kWidth = 3;
constexpr uint32_t kHeight = 4;

using Record = std::pair<std::string_view, std::string_view>;

uint16_t Sample(uint32_t frame, uint32_t a, uint32_t z) {
  return static_cast<uint16_t>(500 * frame + 10 * a + z);
}

void PutRecord(ByteWriter& w, std::string_view key, std::string_view value) {
  w.PutU32(static_cast<uint32_t>(key.size())).PutString(key);
  w.PutU32(static_cast<uint32_t>(value.size())).PutString(value);
}

std::vector<Record> DefaultHeader() {
  return {
      {"Width", "3"},          {"Height", "4"},
      {"PatientID", "OV-17"},  {"FirstName", "Carla"},
      {"LastName", "Mendes"},  {"DOB", "19640229"},
      {"Sex", "F"},            {"Eye", "OS"},
      {"ScanDate", "20210611"}, {"ScanTime", "143005"},
      {"Device", "RTVue XR"},  {"SerialNumber", "XR-0042"},
      {"Operator", "tech1"},
  };
}

/// Signature, @p header records, HeaderEnd, @p frames frames and
/// @p trailing extra bytes
std::vector<uint8_t> OptovueFile(const std::vector<Record>& header,
                                 uint32_t frames, uint32_t trailing = 0) {
  ByteWriter w;
  PutRecord(w, "OCT", "2.1");
  for (const auto& [key, value] : header) {
    PutRecord(w, key, value);
  }
  PutRecord(w, "HeaderEnd", "");
  for (uint32_t k = 0; k < frames; ++k) {
    for (uint32_t a = 0; a < kWidth; ++a) {
      for (uint32_t z = 0; z < kHeight; ++z) {
        w.PutU16(Sample(k, a, z));
      }
    }
  }
  w.PutZeros(trailing);
  return w.Take();
}

TEST(OptovueReaderTest, MissingSignatureIsUnrecognizedFormat) {
  ByteWriter w;
  PutRecord(w, "XYZ", "2.1");
  auto reader = OptovueReader::FromBuffer(w.Take());
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kUnrecognizedFormat));

  auto truncated = OptovueReader::FromBuffer({3, 0, 0, 0, 'O', 'C'});
  EXPECT_TRUE(IsErrorKind(truncated.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(OptovueReaderTest, DecodesHeaderMetadata) {
  auto reader = OptovueReader::FromBuffer(OptovueFile(DefaultHeader(), 2));
  ASSERT_TRUE(reader.ok()) << reader.status();

  const OptovueHeader& header = (*reader)->GetHeader();
  EXPECT_EQ(header.version, "2.1");
  EXPECT_EQ(header.width, kWidth);
  EXPECT_EQ(header.height, kHeight);
  EXPECT_FALSE(header.frames.has_value());
  EXPECT_EQ(header.patient.patient_id, "OV-17");
  EXPECT_EQ(header.patient.name, "Carla Mendes");
  EXPECT_EQ(header.patient.birthdate, absl::CivilDay(1964, 2, 29));
  EXPECT_EQ(header.laterality, Laterality::kLeft);
  EXPECT_EQ(header.acquisition_datetime,
            absl::CivilSecond(2021, 6, 11, 14, 30, 5));
  EXPECT_EQ(header.device.manufacturer, OptovueReader::kManufacturer);
  EXPECT_EQ(header.device.model, "RTVue XR");
  EXPECT_EQ(header.device.serial_number, "XR-0042");
}

TEST(OptovueReaderTest, FramesFollowHeaderEnd) {
  const std::vector<uint8_t> bytes = OptovueFile(DefaultHeader(), 2);
  auto reader = OptovueReader::FromBuffer(bytes);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetFrameOffset(),
            bytes.size() - 2 * kWidth * kHeight * 2);

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->size(), 1u);
  EXPECT_EQ(volumes->CountWarnings(), 0u);

  const OctVolume& volume = volumes->items[0].value;
  EXPECT_EQ(volume.volume_id, "volume_0");
  ASSERT_EQ(volume.GetNumSlices(), 2u);
  EXPECT_EQ(volume.GetGeometry().width, kWidth);
  EXPECT_EQ(volume.GetGeometry().height, kHeight);
  EXPECT_EQ(volume.slices[1].At<uint16_t>(2, 3), Sample(1, 2, 3));
  EXPECT_EQ(volume.laterality, Laterality::kLeft);
  EXPECT_EQ(volume.patient.surname, "Mendes");
}

TEST(OptovueReaderTest, TrailingBytesAreAWarning) {
  auto reader = OptovueReader::FromBuffer(OptovueFile(DefaultHeader(), 2, 5));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const auto& decoded = volumes->items[0];
  EXPECT_EQ(decoded.value.GetNumSlices(), 2u);
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kOutOfBounds);
}

TEST(OptovueReaderTest, DeclaredFramesBeyondTheFileAreOneWarning) {
  std::vector<Record> header = DefaultHeader();
  header.emplace_back("Frames", "3");
  auto reader = OptovueReader::FromBuffer(OptovueFile(header, 2, 5));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 2u);
  EXPECT_EQ(decoded.value.CountMissing(), 0u);
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kOutOfBounds);
}

TEST(OptovueReaderTest, HugeDeclaredFrameCountIsBoundedByTheFile) {
  std::vector<Record> header = DefaultHeader();
  header.emplace_back("Frames", "4294967295");
  auto reader = OptovueReader::FromBuffer(OptovueFile(header, 1));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->size(), 1u);
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 1u);
  EXPECT_EQ(decoded.value.slices[0].At<uint16_t>(1, 2), Sample(0, 1, 2));
  EXPECT_EQ(volumes->CountWarnings(), 1u);
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kOutOfBounds);
}

TEST(OptovueReaderTest, HugeDeclaredGeometryFailsWithoutAllocating) {
  std::vector<Record> header = {{"Width", "4294967295"},
                                {"Height", "4294967295"}};
  auto reader = OptovueReader::FromBuffer(OptovueFile(header, 0, 64));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  EXPECT_EQ(volumes->size(), 0u);
  EXPECT_EQ(volumes->CountWarnings(), 1u);
}

TEST(OptovueReaderTest, BadFieldsAreWarningsNotErrors) {
  std::vector<Record> header = DefaultHeader();
  header[5].second = "19641340";  // DOB
  header[7].second = "both";      // Eye
  auto reader = OptovueReader::FromBuffer(OptovueFile(header, 1));
  ASSERT_TRUE(reader.ok()) << reader.status();

  const OptovueHeader& decoded = (*reader)->GetHeader();
  EXPECT_FALSE(decoded.patient.birthdate.has_value());
  EXPECT_EQ(decoded.laterality, Laterality::kUnknown);
  EXPECT_EQ(decoded.patient.patient_id, "OV-17");

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->warnings.size(), 2u);
  for (const Warning& warning : volumes->warnings) {
    EXPECT_EQ(warning.kind, ErrorKind::kMetadataField);
  }
}

TEST(OptovueReaderTest, MissingGeometryFailsTheVolume) {
  std::vector<Record> header = DefaultHeader();
  header.erase(header.begin());  // Width
  auto reader = OptovueReader::FromBuffer(OptovueFile(header, 1));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_FALSE(volumes.ok());
  EXPECT_TRUE(IsErrorKind(volumes.status(), ErrorKind::kMetadataField));
}

TEST(OptovueReaderTest, SignatureTellsOptovueFromBioptigen) {
  const std::vector<uint8_t> optovue = OptovueFile(DefaultHeader(), 1);
  const std::vector<uint8_t> bioptigen = {0xFF, 0xFF, 0x05, 0x92, 0x01, 0x00};

  const FormatDescriptor mine = CreateOptovueFormatDescriptor();
  const FormatDescriptor other = bioptigen::CreateBioptigenFormatDescriptor();
  EXPECT_TRUE(mine.HandlesExtension(".oct"));
  EXPECT_TRUE(other.HandlesExtension(".oct"));
  EXPECT_TRUE(mine.Accepts(optovue));
  EXPECT_FALSE(mine.Accepts(bioptigen));
  EXPECT_TRUE(other.Accepts(bioptigen));
  EXPECT_FALSE(other.Accepts(optovue));
}

}  // namespace
}  // namespace optovue
}  // namespace formats
}  // namespace fastoct
