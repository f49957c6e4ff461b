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

#include "fastoct/container/directory_parser.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "fastoct/container/record_layout.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/errors.h"
#include "fastoct/testing/byte_writer.h"
#include "gtest/gtest.h"

namespace fastoct {
namespace container {
namespace {

constexpr uint32_t kTypeUnknown = 0;
constexpr uint32_t kTypeAlpha = 1;
constexpr uint32_t kTypeBeta = 2;

uint32_t Classify(std::string_view name) {
  if (name == "@ALPHA") {
    return kTypeAlpha;
  }
  if (name == "@BETA") {
    return kTypeBeta;
  }
  return kTypeUnknown;
}

void PutNamedRecord(testing::ByteWriter& w, std::string_view name,
                    uint32_t length) {
  w.PutU8(static_cast<uint8_t>(name.size())).PutString(name).PutU32(length);
  w.PutZeros(length);
}

TEST(DirectoryParserTest, WalksNamedRecordsInFileOrder) {
  testing::ByteWriter w;
  w.PutString("HEAD");
  PutNamedRecord(w, "@ALPHA", 3);
  PutNamedRecord(w, "@MYSTERY", 5);
  PutNamedRecord(w, "@BETA", 2);
  PutNamedRecord(w, "@ALPHA", 1);
  w.PutU8(0);
  const std::vector<uint8_t> data = w.Take();

  TopconRecordLayout layout(Classify);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 4, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  EXPECT_TRUE(warnings.Empty());

  ASSERT_EQ(directory->size(), 4u);
  const auto& entries = directory->Entries();
  EXPECT_EQ(entries[0].name, "@ALPHA");
  EXPECT_EQ(entries[0].offset, 4u + 1 + 6 + 4);
  EXPECT_EQ(entries[0].length, 3u);

  // Unknown names stay as opaque entries
  EXPECT_EQ(entries[1].type, kTypeUnknown);
  EXPECT_EQ(entries[1].name, "@MYSTERY");

  auto alphas = directory->FindAll(kTypeAlpha);
  ASSERT_EQ(alphas.size(), 2u);
  EXPECT_EQ(alphas[0]->length, 3u);
  EXPECT_EQ(alphas[1]->length, 1u);

  ASSERT_NE(directory->FindFirst(kTypeBeta), nullptr);
  EXPECT_EQ(directory->FindByName("@BETA")->length, 2u);
  EXPECT_EQ(directory->FindByName("@GAMMA"), nullptr);
}

TEST(DirectoryParserTest, TruncatedInlineRecordStopsWalkWithOneWarning) {
  testing::ByteWriter w;
  PutNamedRecord(w, "@ALPHA", 4);
  w.PutU8(5).PutString("@BETA").PutU32(1000).PutZeros(10);
  const std::vector<uint8_t> data = w.Take();

  TopconRecordLayout layout(Classify);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  ASSERT_EQ(directory->size(), 1u);
  EXPECT_EQ(directory->Entries()[0].name, "@ALPHA");

  ASSERT_EQ(warnings.Size(), 1u);
  const Warning& warning = warnings.Get()[0];
  EXPECT_EQ(warning.kind, ErrorKind::kOutOfBounds);
  EXPECT_NE(warning.message.find("@BETA"), std::string::npos);
  ASSERT_TRUE(warning.offset.has_value());
  EXPECT_EQ(*warning.offset, 1u + 6 + 4 + 4);
}

TEST(DirectoryParserTest, EmptyDirectoryIsUnrecognizedFormat) {
  const std::vector<uint8_t> data = {0x00, 0x00, 0x00};

  TopconRecordLayout layout(Classify);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_FALSE(directory.ok());
  EXPECT_TRUE(
      IsErrorKind(directory.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(DirectoryParserTest, EmptyDirectoryAllowedWhenNotRequired) {
  const std::vector<uint8_t> data = {0x00};

  TopconRecordLayout layout(Classify);
  WarningSink warnings;
  DirectoryParseOptions options;
  options.require_entries = false;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings, options);
  ASSERT_TRUE(directory.ok());
  EXPECT_TRUE(directory->empty());
}

TEST(DirectoryParserTest, SizePrefixedRunAssignsOrdinals) {
  testing::ByteWriter w;
  for (uint32_t i = 0; i < 3; ++i) {
    w.PutU32(i + 1).PutZeros(i + 1);
  }
  w.PutU32(0xDEADBEEF);  // trailing bytes past the run are not read
  const std::vector<uint8_t> data = w.Take();

  SizePrefixedLayout layout(7, 3);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  EXPECT_TRUE(warnings.Empty());

  auto records = directory->FindAll(7);
  ASSERT_EQ(records.size(), 3u);
  for (int64_t i = 0; i < 3; ++i) {
    ASSERT_TRUE(records[i]->index.has_value());
    EXPECT_EQ(*records[i]->index, i);
    EXPECT_EQ(records[i]->length, static_cast<uint64_t>(i + 1));
  }
  EXPECT_EQ(directory->GetEndOffset(), 4u * 3 + 1 + 2 + 3);
}

TEST(DirectoryParserTest, SyncMarkerSkipsPastAShortLengthField) {
  const std::vector<uint8_t> marker = {0xAB, 0xCD};
  testing::ByteWriter w;
  w.PutU32(6).PutBytes(marker).PutZeros(4);
  w.PutU32(4).PutBytes(marker).PutZeros(4);  // true length is 6
  w.PutU32(6).PutBytes(marker).PutZeros(4);
  const std::vector<uint8_t> data = w.Take();

  SizePrefixedLayout layout(7, 3, marker);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  EXPECT_TRUE(warnings.Empty());

  auto records = directory->FindAll(7);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[1]->length, 4u);
  EXPECT_EQ(*records[2]->index, 2);
  EXPECT_EQ(records[2]->offset, 24u);
  EXPECT_EQ(records[2]->length, 6u);
}

TEST(DirectoryParserTest, SyncMarkerWithoutFurtherBoundaryStopsOnce) {
  const std::vector<uint8_t> marker = {0xAB, 0xCD};
  testing::ByteWriter w;
  w.PutU32(6).PutBytes(marker).PutZeros(4);
  w.PutU32(500).PutBytes(marker).PutZeros(4);  // overruns the buffer
  const std::vector<uint8_t> data = w.Take();

  SizePrefixedLayout layout(7, 3, marker);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  EXPECT_EQ(directory->FindAll(7).size(), 1u);
  ASSERT_EQ(warnings.Size(), 1u);
  EXPECT_EQ(warnings.Get()[0].kind, ErrorKind::kOutOfBounds);
}

TEST(DirectoryParserTest, KeyedRecordsStopAtTerminator) {
  testing::ByteWriter w;
  auto put = [&w](std::string_view key, std::string_view value) {
    w.PutU32(static_cast<uint32_t>(key.size())).PutString(key);
    w.PutU32(static_cast<uint32_t>(value.size())).PutString(value);
  };
  put("FileType", "OCT");
  put("Width", "640");
  put("HeaderEnd", "");
  const size_t frames = w.Size();
  w.PutZeros(16);
  const std::vector<uint8_t> data = w.Take();

  KeyedRecordLayout layout([](std::string_view) { return 0u; }, "HeaderEnd");
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  EXPECT_EQ(directory->size(), 3u);
  EXPECT_EQ(directory->GetEndOffset(), frames);
  EXPECT_TRUE(warnings.Empty());
}

TEST(DirectoryParserTest, ImplausibleKeyLengthEndsWalkWithWarning) {
  testing::ByteWriter w;
  w.PutU32(3).PutString("KEY").PutU32(1).PutU8('x');
  w.PutU32(0x7FFFFFFF);
  const std::vector<uint8_t> data = w.Take();

  KeyedRecordLayout layout([](std::string_view) { return 0u; });
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(ByteCursor(data), 0, layout,
                                          warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  EXPECT_EQ(directory->size(), 1u);
  ASSERT_EQ(warnings.Size(), 1u);
  ASSERT_TRUE(warnings.Get()[0].offset.has_value());
  EXPECT_EQ(*warnings.Get()[0].offset, 12u);
}

TEST(DirectoryParserTest, OffsetsAreAbsoluteForSlicedCursors) {
  testing::ByteWriter w;
  w.PutZeros(100);
  PutNamedRecord(w, "@ALPHA", 2);
  w.PutU8(0);
  const std::vector<uint8_t> data = w.Take();

  auto sliced = ByteCursor(data).Slice(100, data.size() - 100);
  ASSERT_TRUE(sliced.ok());

  TopconRecordLayout layout(Classify);
  WarningSink warnings;
  auto directory = DirectoryParser::Parse(*sliced, 0, layout, warnings);
  ASSERT_TRUE(directory.ok()) << directory.status();
  ASSERT_EQ(directory->size(), 1u);
  EXPECT_EQ(directory->Entries()[0].offset, 100u + 1 + 6 + 4);
}

}  // namespace
}  // namespace container
}  // namespace fastoct
