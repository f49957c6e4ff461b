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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "fastoct/errors.h"
#include "fastoct/testing/byte_writer.h"
#include "gtest/gtest.h"

namespace fastoct {
namespace formats {
namespace bioptigen {
namespace {

using fastoct::testing::ByteWriter;

constexpr uint32_t kLines = 4;
constexpr uint32_t kLineLength = 5;

uint16_t Sample(uint32_t frame, uint32_t line, uint32_t z) {
  return static_cast<uint16_t>(1000 * frame + 10 * line + z);
}

void PutRecord(ByteWriter& w, std::string_view key,
               const std::vector<uint8_t>& data) {
  w.PutU32(static_cast<uint32_t>(key.size())).PutString(key);
  w.PutU32(static_cast<uint32_t>(data.size())).PutBytes(data);
}

std::vector<uint8_t> U32(uint32_t v) { return ByteWriter().PutU32(v).Take(); }

/// 2019-05-17 (a Friday) 10:30:15.250
std::vector<uint8_t> SystemTime() {
  ByteWriter w;
  w.PutU16(2019).PutU16(5).PutU16(5).PutU16(17);
  w.PutU16(10).PutU16(30).PutU16(15).PutU16(250);
  return w.Take();
}

std::vector<uint8_t> FrameSamples(uint32_t frame, uint32_t lines) {
  ByteWriter w;
  for (uint32_t line = 0; line < lines; ++line) {
    for (uint32_t z = 0; z < kLineLength; ++z) {
      w.PutU16(Sample(frame, line, z));
    }
  }
  return w.Take();
}

struct FileSpec {
  uint32_t declared_frames = 3;
  uint32_t frames = 3;
  uint32_t odd_frame_lines = kLines;  ///< FRAMELINES of the last frame
};

std::vector<uint8_t> BioptigenFile(const FileSpec& spec = FileSpec()) {
  ByteWriter w;
  w.PutU16(0xFFFF).PutU16(0x9205).PutU16(3);
  PutRecord(w, "FRAMECOUNT", U32(spec.declared_frames));
  PutRecord(w, "LINECOUNT", U32(kLines));
  PutRecord(w, "LINELENGTH", U32(kLineLength));
  PutRecord(w, "DESCRIPTION", ByteWriter().PutString("Rect volume").Take());
  PutRecord(w, "SCANDEPTH", ByteWriter().PutF64(2.5).Take());
  PutRecord(w, "XCAPTION", ByteWriter().PutString("mm").Take());

  for (uint32_t k = 0; k < spec.frames; ++k) {
    const uint32_t lines = k + 1 == spec.frames ? spec.odd_frame_lines : kLines;
    PutRecord(w, "FRAMEDATA", {});
    PutRecord(w, "FRAMEDATETIME", SystemTime());
    PutRecord(w, "FRAMETIMESTAMP", ByteWriter().PutF64(12.5 * k).Take());
    PutRecord(w, "FRAMELINES", U32(lines));
    PutRecord(w, "FRAMESAMPLES", FrameSamples(k, lines));
  }
  return w.Take();
}

TEST(BioptigenReaderTest, BadMagicIsUnrecognizedFormat) {
  std::vector<uint8_t> bytes = BioptigenFile();
  bytes[2] = 0x00;

  auto reader = BioptigenReader::FromBuffer(bytes);
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kUnrecognizedFormat));

  auto empty = BioptigenReader::FromBuffer({});
  EXPECT_TRUE(IsErrorKind(empty.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(BioptigenReaderTest, DecodesHeaderRecords) {
  auto reader = BioptigenReader::FromBuffer(BioptigenFile());
  ASSERT_TRUE(reader.ok()) << reader.status();

  const BioptigenHeader& header = (*reader)->GetHeader();
  EXPECT_EQ(header.version, 3);
  EXPECT_EQ(header.frame_count, 3u);
  EXPECT_EQ(header.line_count, kLines);
  EXPECT_EQ(header.line_length, kLineLength);
  EXPECT_FALSE(header.sample_format.has_value());
  EXPECT_EQ(header.description, "Rect volume");
  ASSERT_TRUE(header.scan_depth.has_value());
  EXPECT_DOUBLE_EQ(*header.scan_depth, 2.5);

  // Unknown keys stay in the directory as opaque entries
  const auto* caption = (*reader)->GetDirectory().FindByName("XCAPTION");
  ASSERT_NE(caption, nullptr);
  EXPECT_EQ(caption->type, ToType(BioptigenRecord::kUnknown));
}

TEST(BioptigenReaderTest, FramesAreAScanMajor) {
  auto reader = BioptigenReader::FromBuffer(BioptigenFile());
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->size(), 1u);
  EXPECT_EQ(volumes->CountWarnings(), 0u);

  const OctVolume& volume = volumes->items[0].value;
  ASSERT_EQ(volume.GetNumSlices(), 3u);
  EXPECT_EQ(volume.GetGeometry().width, kLines);
  EXPECT_EQ(volume.GetGeometry().height, kLineLength);
  EXPECT_EQ(volume.GetGeometry().dtype, DataType::kUInt16);
  EXPECT_EQ(volume.slices[1].At<uint16_t>(3, 4), Sample(1, 3, 4));
  EXPECT_EQ(volume.slices[2].At<uint16_t>(0, 2), Sample(2, 0, 2));
  EXPECT_EQ(volume.acquisition_datetime,
            absl::CivilSecond(2019, 5, 17, 10, 30, 15));
  EXPECT_EQ(volume.device.manufacturer, BioptigenReader::kManufacturer);
  EXPECT_EQ(volume.laterality, Laterality::kUnknown);
}

TEST(BioptigenReaderTest, TruncatedLastFrameIsMissing) {
  std::vector<uint8_t> bytes = BioptigenFile();
  bytes.resize(bytes.size() - 6);

  auto reader = BioptigenReader::FromBuffer(bytes);
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->size(), 1u);

  // The directory walk reports the cut record
  ASSERT_EQ(volumes->warnings.size(), 1u);
  EXPECT_EQ(volumes->warnings[0].kind, ErrorKind::kOutOfBounds);
  EXPECT_NE(volumes->warnings[0].message.find("FRAMESAMPLES"),
            std::string::npos);

  // and the volume marks the frame that lost its samples
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 3u);
  EXPECT_FALSE(decoded.value.slices[1].IsMissing());
  EXPECT_TRUE(decoded.value.slices[2].IsMissing());
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kPixelDecode);
}

TEST(BioptigenReaderTest, UndeliveredDeclaredFramesAreOneWarning) {
  FileSpec spec;
  spec.declared_frames = 4;
  auto reader = BioptigenReader::FromBuffer(BioptigenFile(spec));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  const auto& decoded = volumes->items[0];
  ASSERT_EQ(decoded.value.GetNumSlices(), 3u);
  EXPECT_EQ(decoded.value.CountMissing(), 0u);
  ASSERT_EQ(decoded.warnings.size(), 1u);
  EXPECT_EQ(decoded.warnings[0].kind, ErrorKind::kOutOfBounds);
  EXPECT_NE(decoded.warnings[0].message.find("4 frames"), std::string::npos);
}

TEST(BioptigenReaderTest, HugeDeclaredFrameCountIsBoundedByTheFile) {
  FileSpec spec;
  spec.declared_frames = 0xFFFFFFFF;
  spec.frames = 1;
  const std::vector<uint8_t> bytes = BioptigenFile(spec);
  ASSERT_LT(bytes.size(), 400u);

  auto reader = BioptigenReader::FromBuffer(bytes);
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

TEST(BioptigenReaderTest, DeclaredFramesWithoutAnyFrameIsOneFileWarning) {
  FileSpec spec;
  spec.declared_frames = 0xFFFFFFFF;
  spec.frames = 0;
  auto reader = BioptigenReader::FromBuffer(BioptigenFile(spec));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  EXPECT_EQ(volumes->size(), 0u);
  ASSERT_EQ(volumes->warnings.size(), 1u);
  EXPECT_EQ(volumes->warnings[0].kind, ErrorKind::kOutOfBounds);
}

TEST(BioptigenReaderTest, FrameOfOtherWidthDropsTheVolume) {
  FileSpec spec;
  spec.odd_frame_lines = kLines + 2;
  auto reader = BioptigenReader::FromBuffer(BioptigenFile(spec));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto volumes = (*reader)->ReadOctVolumes();
  ASSERT_FALSE(volumes.ok());
  EXPECT_TRUE(IsErrorKind(volumes.status(),
                          ErrorKind::kInconsistentVolumeGeometry));
}

TEST(BioptigenReaderTest, DescriptorChecksSignature) {
  const FormatDescriptor desc = CreateBioptigenFormatDescriptor();
  EXPECT_TRUE(desc.HandlesExtension(".oct"));
  EXPECT_TRUE(desc.Accepts(BioptigenFile()));

  const std::vector<uint8_t> other = {'O', 'C', 'T', 0, 0, 0};
  EXPECT_FALSE(desc.Accepts(other));
}

}  // namespace
}  // namespace bioptigen
}  // namespace formats
}  // namespace fastoct
