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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_DATES_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_DATES_H_

#include <cstdint>
#include <string_view>

#include "absl/time/civil_time.h"
#include "fastoct/core/metadata.h"
#include "fastoct/metadata/field.h"

namespace fastoct {
namespace metadata {

/// @brief Calendar date from components
///
/// All-zero components mean "not recorded" and give an absent field.
/// Components that absl would normalize (month 13, February 30) are an
/// error rather than silently rolled over.
Field<absl::CivilDay> MakeCivilDay(int64_t year, int month, int day);

/// @brief Calendar date and time from components, validated like
///        MakeCivilDay()
Field<absl::CivilSecond> MakeCivilSecond(int64_t year, int month, int day,
                                         int hour, int minute, int second);

/// @brief Civil date of a Julian Day Number
absl::CivilDay CivilDayFromJulianDay(int64_t julian_day);

/// @brief Heidelberg birth date: `raw / 64 - 14558805` is a Julian Day
///        Number. Zero is absent.
Field<absl::CivilDay> HeidelbergBirthdate(uint32_t raw);

/// @brief Time stamp in 100 ns ticks since 1600-12-31 23:59. Zero is absent.
Field<absl::CivilSecond> HeidelbergAcquisitionTime(uint64_t ticks);

/// @brief DICOM DA value `YYYYMMDD`
Field<absl::CivilDay> ParseDicomDate(std::string_view text);

/// @brief DICOM DA + TM values (`HHMMSS.FFFFFF`, fractions and missing
///        minutes/seconds allowed)
Field<absl::CivilSecond> ParseDicomDateTime(std::string_view date,
                                            std::string_view time);

/// @brief DICOM DT value `YYYYMMDDHHMMSS.FFFFFF&ZZXX`; the UTC offset is
///        ignored
Field<absl::CivilSecond> ParseDicomDt(std::string_view text);

/// @brief Free-form laterality codes: "R", "OD", "L", "OS" (case and
///        whitespace insensitive). Anything else is kUnknown.
Laterality ParseLateralityCode(std::string_view code);

}  // namespace metadata
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_DATES_H_
