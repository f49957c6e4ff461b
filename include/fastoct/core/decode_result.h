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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_DECODE_RESULT_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_DECODE_RESULT_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/errors.h"

/**
 * @file decode_result.h
 * @brief Entities paired with the non-fatal problems found while decoding
 *
 * Readers never abort a whole file for a local problem. Each decoded entity
 * carries the warnings raised while building it; problems that belong to no
 * returned entity (a dropped volume, a broken directory chain) are reported
 * on the DecodeResult itself.
 */

namespace fastoct {

/// @brief Collects warnings and logs each one as it is recorded
class WarningSink {
 public:
  WarningSink() = default;

  /// @param context Prefix for log lines, e.g. the volume id
  explicit WarningSink(std::string context) : context_(std::move(context)) {}

  void Add(ErrorKind kind, std::string message,
           std::optional<uint64_t> offset = std::nullopt);

  void Add(Warning warning);

  /// @brief Record a failed status as a warning
  /// @param fallback Kind used when the status carries no ErrorKind
  void AddStatus(const absl::Status& status, ErrorKind fallback);

  /// @brief Move all warnings of @p other into this sink without re-logging
  void Absorb(std::vector<Warning> other);

  [[nodiscard]] size_t Size() const { return warnings_.size(); }
  [[nodiscard]] bool Empty() const { return warnings_.empty(); }
  [[nodiscard]] const std::vector<Warning>& Get() const { return warnings_; }

  std::vector<Warning> Take() { return std::exchange(warnings_, {}); }

 private:
  std::string context_;
  std::vector<Warning> warnings_;
};

/// @brief One decoded entity and its warnings
template <typename T>
struct Decoded {
  T value;
  std::vector<Warning> warnings;
};

/// @brief All entities of one kind decoded from a file
template <typename T>
struct DecodeResult {
  std::vector<Decoded<T>> items;

  /// @brief File-level problems that belong to no returned entity
  std::vector<Warning> warnings;

  [[nodiscard]] size_t size() const { return items.size(); }
  [[nodiscard]] bool empty() const { return items.empty(); }

  /// @brief Total warnings, entity-level and file-level
  [[nodiscard]] size_t CountWarnings() const {
    size_t n = warnings.size();
    for (const auto& item : items) {
      n += item.warnings.size();
    }
    return n;
  }
};

/// @brief Accumulates decoded entities and dropped-entity failures
///
/// A dropped entity becomes a file-level warning. If nothing survives and
/// at least one entity was dropped, Finish() returns the first failure
/// instead of an empty result.
template <typename T>
class ResultBuilder {
 public:
  void Add(T value, std::vector<Warning> warnings = {}) {
    result_.items.push_back(Decoded<T>{std::move(value), std::move(warnings)});
  }

  void Add(Decoded<T> decoded) { result_.items.push_back(std::move(decoded)); }

  /// @brief Record an entity that had to be dropped
  /// @param status Why it was dropped
  /// @param fallback Kind used when the status carries no ErrorKind
  void AddFailure(const absl::Status& status, ErrorKind fallback) {
    if (first_failure_.ok()) {
      first_failure_ = status;
    }
    file_warnings_.AddStatus(status, fallback);
  }

  /// @brief Sink for problems that belong to no entity
  WarningSink& FileWarnings() { return file_warnings_; }

  [[nodiscard]] size_t size() const { return result_.items.size(); }

  absl::StatusOr<DecodeResult<T>> Finish() && {
    if (result_.items.empty() && !first_failure_.ok()) {
      return first_failure_;
    }
    result_.warnings = file_warnings_.Take();
    return std::move(result_);
  }

 private:
  DecodeResult<T> result_;
  WarningSink file_warnings_;
  absl::Status first_failure_;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_DECODE_RESULT_H_
