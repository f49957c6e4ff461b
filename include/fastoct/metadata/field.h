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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_FIELD_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_FIELD_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace metadata {

/// @brief Result of decoding one metadata field
///
/// Unlike absl::StatusOr, a field distinguishes "not recorded" (absent) from
/// "recorded but undecodable" (error).
template <typename T>
class Field {
 public:
  /// @brief Absent field
  Field() = default;

  static Field Absent() { return Field(); }

  static Field Value(T value) {
    Field field;
    field.state_ = std::move(value);
    return field;
  }

  static Field Error(absl::Status status) {
    Field field;
    field.state_ = std::move(status);
    return field;
  }

  /// @brief Value on success, error otherwise
  static Field FromStatusOr(absl::StatusOr<T> value) {
    if (!value.ok()) {
      return Error(value.status());
    }
    return Value(*std::move(value));
  }

  [[nodiscard]] bool IsAbsent() const {
    return std::holds_alternative<std::monostate>(state_);
  }
  [[nodiscard]] bool HasValue() const {
    return std::holds_alternative<T>(state_);
  }
  [[nodiscard]] bool IsError() const {
    return std::holds_alternative<absl::Status>(state_);
  }

  [[nodiscard]] const T& GetValue() const { return std::get<T>(state_); }
  [[nodiscard]] const absl::Status& GetError() const {
    return std::get<absl::Status>(state_);
  }

  /// @brief Downgrade to an optional, reporting an error as a
  ///        MetadataFieldError warning that names the field
  std::optional<T> Resolve(std::string_view field_name, WarningSink& warnings,
                           std::optional<uint64_t> offset = std::nullopt) && {
    if (HasValue()) {
      return std::get<T>(std::move(state_));
    }
    if (IsError()) {
      Warning warning =
          Warning::FromStatus(GetError(), ErrorKind::kMetadataField);
      warning.kind = ErrorKind::kMetadataField;
      warning.message =
          absl::StrFormat("Field %s: %s", field_name, warning.message);
      if (!warning.offset.has_value()) {
        warning.offset = offset;
      }
      warnings.Add(std::move(warning));
    }
    return std::nullopt;
  }

 private:
  std::variant<std::monostate, T, absl::Status> state_;
};

/// @brief Field from a fixed-width text value; empty text is absent
inline Field<std::string> TextField(absl::StatusOr<std::string> text) {
  if (!text.ok()) {
    return Field<std::string>::Error(text.status());
  }
  if (text->empty()) {
    return Field<std::string>::Absent();
  }
  return Field<std::string>::Value(*std::move(text));
}

}  // namespace metadata

using metadata::Field;
using metadata::TextField;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_FIELD_H_
