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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/civil_time.h"
#include "fastoct/container/directory.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/errors.h"
#include "fastoct/io/byte_cursor.h"
#include "fastoct/metadata/dates.h"
#include "fastoct/metadata/field.h"
#include "fastoct/metadata/field_rule.h"
#include "fastoct/testing/byte_writer.h"
#include "gtest/gtest.h"

namespace fastoct {
namespace metadata {
namespace {

using fastoct::testing::ByteWriter;

// ============================================================================
// Field
// ============================================================================

TEST(FieldTest, ResolveValue) {
  WarningSink warnings;
  auto value = Field<int>::Value(42).Resolve("answer", warnings);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_TRUE(warnings.Empty());
}

TEST(FieldTest, AbsentIsNotAWarning) {
  WarningSink warnings;
  EXPECT_FALSE(Field<int>::Absent().Resolve("answer", warnings).has_value());
  EXPECT_TRUE(warnings.Empty());
}

TEST(FieldTest, ErrorBecomesMetadataFieldWarning) {
  WarningSink warnings;
  auto field = Field<int>::Error(absl::InvalidArgumentError("garbled"));
  EXPECT_FALSE(std::move(field).Resolve("answer", warnings, 77).has_value());

  ASSERT_EQ(warnings.Size(), 1u);
  const Warning& warning = warnings.Get()[0];
  EXPECT_EQ(warning.kind, ErrorKind::kMetadataField);
  EXPECT_NE(warning.message.find("answer"), std::string::npos);
  EXPECT_NE(warning.message.find("garbled"), std::string::npos);
  ASSERT_TRUE(warning.offset.has_value());
  EXPECT_EQ(*warning.offset, 77u);
}

TEST(FieldTest, TextFieldTreatsEmptyAsAbsent) {
  EXPECT_TRUE(TextField(std::string()).IsAbsent());
  EXPECT_TRUE(TextField(std::string("Doe")).HasValue());
  EXPECT_TRUE(TextField(absl::OutOfRangeError("short")).IsError());
}

// ============================================================================
// FieldRule
// ============================================================================

struct Record {
  std::optional<std::string> name;
  std::optional<uint32_t> count;
};

constexpr uint32_t kNameRecord = 1;
constexpr uint32_t kCountRecord = 2;
constexpr uint32_t kBrokenRecord = 3;

absl::Status DecodeName(ByteCursor& payload, Record& record,
                        WarningSink& warnings) {
  record.name = TextField(payload.ReadFixedString(8))
                    .Resolve("name", warnings, payload.BaseOffset());
  return absl::OkStatus();
}

absl::Status DecodeCount(ByteCursor& payload, Record& record,
                         WarningSink& warnings) {
  record.count = Field<uint32_t>::FromStatusOr(payload.ReadU32(Endian::kLittle))
                     .Resolve("count", warnings, payload.BaseOffset());
  return absl::OkStatus();
}

absl::Status DecodeBroken(ByteCursor& payload, Record& record,
                          WarningSink& warnings) {
  return MAKE_DECODE_ERROR(ErrorKind::kMetadataField, "unsupported revision");
}

constexpr FieldRule<Record> kRules[] = {
    {kNameRecord, "NAME", DecodeName},
    {kCountRecord, "COUNT", DecodeCount},
    {kBrokenRecord, "BROKEN", DecodeBroken},
};

TEST(FieldRuleTest, FindsRuleByType) {
  const auto* rule = FindFieldRule<Record>(kRules, kCountRecord);
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(rule->record_name, "COUNT");
  EXPECT_EQ(FindFieldRule<Record>(kRules, 99), nullptr);
}

TEST(FieldRuleTest, AppliesRulesToFirstEntryOfEachType) {
  ByteWriter writer;
  writer.PutFixedString("Jane", 8);  // 0: NAME
  writer.PutU32(5);                  // 8: COUNT
  writer.PutU16(1);                  // 12: truncated COUNT
  writer.PutU32(0);                  // 14: BROKEN
  const std::vector<uint8_t> bytes = writer.Take();

  Directory directory;
  directory.Add({kNameRecord, "NAME", 0, 8});
  directory.Add({kCountRecord, "COUNT", 8, 4});
  directory.Add({kCountRecord, "COUNT", 12, 2});
  directory.Add({kBrokenRecord, "BROKEN", 14, 4});

  Record record;
  WarningSink warnings;
  const ByteCursor file(bytes);
  EXPECT_EQ(ApplyFieldRules<Record>(kRules, directory, file, record, warnings),
            3u);

  ASSERT_TRUE(record.name.has_value());
  EXPECT_EQ(*record.name, "Jane");
  ASSERT_TRUE(record.count.has_value());
  EXPECT_EQ(*record.count, 5u);

  // Only the broken record is reported, at its payload offset
  ASSERT_EQ(warnings.Size(), 1u);
  EXPECT_EQ(warnings.Get()[0].kind, ErrorKind::kMetadataField);
  EXPECT_NE(warnings.Get()[0].message.find("BROKEN"), std::string::npos);
  EXPECT_EQ(*warnings.Get()[0].offset, 14u);
}

TEST(FieldRuleTest, BadFieldLeavesSiblingsIntact) {
  ByteWriter writer;
  writer.PutFixedString("Jane", 8);
  writer.PutU16(1);
  const std::vector<uint8_t> bytes = writer.Take();

  Directory directory;
  directory.Add({kNameRecord, "NAME", 0, 8});
  directory.Add({kCountRecord, "COUNT", 8, 2});

  Record record;
  WarningSink warnings;
  ApplyFieldRules<Record>(kRules, directory, ByteCursor(bytes), record,
                          warnings);

  EXPECT_TRUE(record.name.has_value());
  EXPECT_FALSE(record.count.has_value());
  ASSERT_EQ(warnings.Size(), 1u);
  EXPECT_NE(warnings.Get()[0].message.find("count"), std::string::npos);
}

// ============================================================================
// Dates
// ============================================================================

TEST(DatesTest, MakeCivilDayRejectsNormalizedDates) {
  EXPECT_TRUE(MakeCivilDay(0, 0, 0).IsAbsent());
  EXPECT_TRUE(MakeCivilDay(2023, 2, 30).IsError());
  EXPECT_TRUE(MakeCivilDay(2023, 13, 1).IsError());
  EXPECT_TRUE(MakeCivilDay(12, 1, 1).IsError());

  auto day = MakeCivilDay(2024, 2, 29);
  ASSERT_TRUE(day.HasValue());
  EXPECT_EQ(day.GetValue(), absl::CivilDay(2024, 2, 29));
}

TEST(DatesTest, MakeCivilSecondValidatesTime) {
  EXPECT_TRUE(MakeCivilSecond(2020, 1, 1, 24, 0, 0).IsError());
  auto time = MakeCivilSecond(2020, 1, 1, 13, 45, 30);
  ASSERT_TRUE(time.HasValue());
  EXPECT_EQ(time.GetValue(), absl::CivilSecond(2020, 1, 1, 13, 45, 30));
}

TEST(DatesTest, JulianDay) {
  EXPECT_EQ(CivilDayFromJulianDay(2440588), absl::CivilDay(1970, 1, 1));
  EXPECT_EQ(CivilDayFromJulianDay(2451545), absl::CivilDay(2000, 1, 1));
}

TEST(DatesTest, HeidelbergBirthdate) {
  EXPECT_TRUE(HeidelbergBirthdate(0).IsAbsent());

  // JDN 2444240 is 1980-01-01
  const uint32_t raw = (2444240 + 14558805) * 64;
  auto birthdate = HeidelbergBirthdate(raw);
  ASSERT_TRUE(birthdate.HasValue());
  EXPECT_EQ(birthdate.GetValue(), absl::CivilDay(1980, 1, 1));

  EXPECT_TRUE(HeidelbergBirthdate(64).IsError());
}

TEST(DatesTest, HeidelbergAcquisitionTime) {
  EXPECT_TRUE(HeidelbergAcquisitionTime(0).IsAbsent());

  // One day and one minute after the epoch
  const uint64_t ticks = (uint64_t{86400} + 60) * 10'000'000;
  auto time = HeidelbergAcquisitionTime(ticks);
  ASSERT_TRUE(time.HasValue());
  EXPECT_EQ(time.GetValue(), absl::CivilSecond(1601, 1, 2, 0, 0, 0));

  EXPECT_TRUE(HeidelbergAcquisitionTime(UINT64_MAX).IsError());
}

TEST(DatesTest, DicomDate) {
  EXPECT_TRUE(ParseDicomDate("").IsAbsent());
  EXPECT_TRUE(ParseDicomDate("  ").IsAbsent());
  EXPECT_EQ(ParseDicomDate("20190704").GetValue(), absl::CivilDay(2019, 7, 4));
  EXPECT_EQ(ParseDicomDate("2019.07.04").GetValue(),
            absl::CivilDay(2019, 7, 4));
  EXPECT_TRUE(ParseDicomDate("2019074").IsError());
  EXPECT_TRUE(ParseDicomDate("2019O704").IsError());
}

TEST(DatesTest, DicomDateTime) {
  EXPECT_EQ(ParseDicomDateTime("20190704", "101530.123456").GetValue(),
            absl::CivilSecond(2019, 7, 4, 10, 15, 30));
  EXPECT_EQ(ParseDicomDateTime("20190704", "1015").GetValue(),
            absl::CivilSecond(2019, 7, 4, 10, 15, 0));
  EXPECT_EQ(ParseDicomDateTime("20190704", "").GetValue(),
            absl::CivilSecond(2019, 7, 4, 0, 0, 0));
  EXPECT_TRUE(ParseDicomDateTime("", "101530").IsAbsent());
  EXPECT_TRUE(ParseDicomDateTime("20190704", "10153").IsError());
}

TEST(DatesTest, DicomDt) {
  EXPECT_EQ(ParseDicomDt("20190704101530.5+0200").GetValue(),
            absl::CivilSecond(2019, 7, 4, 10, 15, 30));
  EXPECT_EQ(ParseDicomDt("20190704").GetValue(),
            absl::CivilSecond(2019, 7, 4, 0, 0, 0));
  EXPECT_TRUE(ParseDicomDt("2019").IsError());
}

TEST(DatesTest, LateralityCodes) {
  EXPECT_EQ(ParseLateralityCode("R"), Laterality::kRight);
  EXPECT_EQ(ParseLateralityCode(" od "), Laterality::kRight);
  EXPECT_EQ(ParseLateralityCode("L"), Laterality::kLeft);
  EXPECT_EQ(ParseLateralityCode("OS"), Laterality::kLeft);
  EXPECT_EQ(ParseLateralityCode("OU"), Laterality::kUnknown);
  EXPECT_EQ(ParseLateralityCode(""), Laterality::kUnknown);
}

}  // namespace
}  // namespace metadata
}  // namespace fastoct
