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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_METADATA_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_METADATA_H_

#include <optional>
#include <string>

#include "absl/time/civil_time.h"

namespace fastoct {

/// @brief Which eye an acquisition belongs to
enum class Laterality {
  kUnknown,
  kLeft,   ///< OS
  kRight,  ///< OD
};

constexpr const char* GetName(Laterality laterality) {
  switch (laterality) {
    case Laterality::kUnknown:
      return "unknown";
    case Laterality::kLeft:
      return "L";
    case Laterality::kRight:
      return "R";
  }
  return "unknown";
}

/// @brief Patient identity as recorded by the device
///
/// Every field is optional; absence is not an error.
struct PatientMetadata {
  std::optional<std::string> name;
  std::optional<std::string> first_name;
  std::optional<std::string> surname;
  std::optional<std::string> sex;
  std::optional<absl::CivilDay> birthdate;
  std::optional<std::string> patient_id;
};

/// @brief Acquisition device description
struct DeviceMetadata {
  std::optional<std::string> manufacturer;
  std::optional<std::string> model;
  std::optional<std::string> serial_number;
  std::optional<std::string> software_version;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_METADATA_H_
