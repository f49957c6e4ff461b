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

#include "fastoct/metadata/dates.h"

#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace metadata {

namespace {

constexpr int64_t kMinYear = 1000;
constexpr int64_t kMaxYear = 9999;

/// Julian Day Number of 1970-01-01
constexpr int64_t kUnixEpochJulianDay = 2440588;
constexpr uint32_t kHeidelbergDateScale = 64;
constexpr int64_t kHeidelbergDateOffset = 14558805;
constexpr uint64_t kTicksPerSecond = 10'000'000;

absl::Status InvalidField(const std::string& message) {
  return MAKE_DECODE_ERROR(ErrorKind::kMetadataField, message);
}

/// Parse exactly @p text as a decimal number
bool ParseDigits(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return absl::SimpleAtoi(text, &value);
}

/// Digits of a DICOM time value with separators and fraction removed
std::string NormalizeTime(std::string_view time) {
  std::string_view trimmed = absl::StripAsciiWhitespace(time);
  if (auto dot = trimmed.find('.'); dot != std::string_view::npos) {
    trimmed = trimmed.substr(0, dot);
  }
  return absl::StrReplaceAll(trimmed, {{":", ""}});
}

}  // namespace

Field<absl::CivilDay> MakeCivilDay(int64_t year, int month, int day) {
  if (year == 0 && month == 0 && day == 0) {
    return Field<absl::CivilDay>::Absent();
  }
  const absl::CivilDay date(year, month, day);
  if (year < kMinYear || year > kMaxYear || date.year() != year ||
      date.month() != month || date.day() != day) {
    return Field<absl::CivilDay>::Error(InvalidField(
        absl::StrFormat("Invalid date %04d-%02d-%02d", year, month, day)));
  }
  return Field<absl::CivilDay>::Value(date);
}

Field<absl::CivilSecond> MakeCivilSecond(int64_t year, int month, int day,
                                         int hour, int minute, int second) {
  auto date = MakeCivilDay(year, month, day);
  if (date.IsAbsent()) {
    return Field<absl::CivilSecond>::Absent();
  }
  if (date.IsError()) {
    return Field<absl::CivilSecond>::Error(date.GetError());
  }
  if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 ||
      second > 59) {
    return Field<absl::CivilSecond>::Error(InvalidField(absl::StrFormat(
        "Invalid time %02d:%02d:%02d", hour, minute, second)));
  }
  return Field<absl::CivilSecond>::Value(
      absl::CivilSecond(year, month, day, hour, minute, second));
}

absl::CivilDay CivilDayFromJulianDay(int64_t julian_day) {
  return absl::CivilDay(1970, 1, 1) + (julian_day - kUnixEpochJulianDay);
}

Field<absl::CivilDay> HeidelbergBirthdate(uint32_t raw) {
  if (raw == 0) {
    return Field<absl::CivilDay>::Absent();
  }
  const int64_t julian_day =
      static_cast<int64_t>(raw / kHeidelbergDateScale) - kHeidelbergDateOffset;
  const absl::CivilDay date = CivilDayFromJulianDay(julian_day);
  if (date.year() < kMinYear || date.year() > kMaxYear) {
    return Field<absl::CivilDay>::Error(InvalidField(
        absl::StrFormat("Birth date value %u is out of range", raw)));
  }
  return Field<absl::CivilDay>::Value(date);
}

Field<absl::CivilSecond> HeidelbergAcquisitionTime(uint64_t ticks) {
  if (ticks == 0) {
    return Field<absl::CivilSecond>::Absent();
  }
  const absl::CivilSecond epoch(1600, 12, 31, 23, 59, 0);
  const absl::CivilSecond time =
      epoch + static_cast<int64_t>(ticks / kTicksPerSecond);
  if (time.year() > kMaxYear) {
    return Field<absl::CivilSecond>::Error(InvalidField(
        absl::StrFormat("Acquisition time %u is out of range", ticks)));
  }
  return Field<absl::CivilSecond>::Value(time);
}

Field<absl::CivilDay> ParseDicomDate(std::string_view text) {
  std::string date = absl::StrReplaceAll(absl::StripAsciiWhitespace(text),
                                         {{".", ""}, {"-", ""}});
  if (date.empty()) {
    return Field<absl::CivilDay>::Absent();
  }
  int year = 0;
  int month = 0;
  int day = 0;
  if (date.size() != 8 || !ParseDigits(date.substr(0, 4), year) ||
      !ParseDigits(date.substr(4, 2), month) ||
      !ParseDigits(date.substr(6, 2), day)) {
    return Field<absl::CivilDay>::Error(
        InvalidField(absl::StrFormat("Malformed DICOM date '%s'", text)));
  }
  return MakeCivilDay(year, month, day);
}

Field<absl::CivilSecond> ParseDicomDateTime(std::string_view date,
                                            std::string_view time) {
  auto day = ParseDicomDate(date);
  if (!day.HasValue()) {
    return day.IsError() ? Field<absl::CivilSecond>::Error(day.GetError())
                         : Field<absl::CivilSecond>::Absent();
  }

  const std::string digits = NormalizeTime(time);
  int hour = 0;
  int minute = 0;
  int second = 0;
  const bool parsed =
      (digits.size() == 2 || digits.size() == 4 || digits.size() == 6) &&
      ParseDigits(std::string_view(digits).substr(0, 2), hour) &&
      (digits.size() < 4 ||
       ParseDigits(std::string_view(digits).substr(2, 2), minute)) &&
      (digits.size() < 6 ||
       ParseDigits(std::string_view(digits).substr(4, 2), second));
  if (!digits.empty() && !parsed) {
    return Field<absl::CivilSecond>::Error(
        InvalidField(absl::StrFormat("Malformed DICOM time '%s'", time)));
  }

  const absl::CivilDay d = day.GetValue();
  return MakeCivilSecond(d.year(), d.month(), d.day(), hour, minute, second);
}

Field<absl::CivilSecond> ParseDicomDt(std::string_view text) {
  std::string_view value = absl::StripAsciiWhitespace(text);
  if (value.empty()) {
    return Field<absl::CivilSecond>::Absent();
  }
  if (auto zone = value.find_first_of("+-", 8); zone != std::string_view::npos) {
    value = value.substr(0, zone);
  }
  if (value.size() < 8) {
    return Field<absl::CivilSecond>::Error(
        InvalidField(absl::StrFormat("Malformed DICOM date time '%s'", text)));
  }
  return ParseDicomDateTime(value.substr(0, 8), value.substr(8));
}

Laterality ParseLateralityCode(std::string_view code) {
  const std::string upper =
      absl::AsciiStrToUpper(absl::StripAsciiWhitespace(code));
  if (upper == "R" || upper == "OD") {
    return Laterality::kRight;
  }
  if (upper == "L" || upper == "OS") {
    return Laterality::kLeft;
  }
  return Laterality::kUnknown;
}

}  // namespace metadata
}  // namespace fastoct
