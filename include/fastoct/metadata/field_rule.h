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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_FIELD_RULE_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_FIELD_RULE_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fastoct/container/directory.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/errors.h"
#include "fastoct/io/byte_cursor.h"

/**
 * @file field_rule.h
 * @brief Table-driven metadata extraction
 *
 * Each format declares a static table of FieldRule entries mapping a known
 * record type to a function that decodes the record payload into a target
 * struct:
 *
 * ```cpp
 * constexpr FieldRule<TopconMetadata> kTopconRules[] = {
 *     {TopconRecord::kPatientInfo02, "@PATIENT_INFO_02", DecodePatientInfo},
 *     {TopconRecord::kHwInfo03, "@HW_INFO_03", DecodeHwInfo},
 * };
 * ApplyFieldRules<TopconMetadata>(kTopconRules, directory, file, meta,
 *                                 warnings);
 * ```
 *
 * Decode functions resolve every field through Field<T>::Resolve() so that a
 * bad field is reported and left absent while its siblings survive. A
 * decode function returning an error (the record itself is unreadable) is
 * reported as a MetadataFieldError naming the record.
 */

namespace fastoct {
namespace metadata {

template <typename Target>
struct FieldRule {
  using DecodeFn = absl::Status (*)(ByteCursor& payload, Target& target,
                                    WarningSink& warnings);

  uint32_t type;
  std::string_view record_name;
  DecodeFn decode;
};

/// @brief Rule for @p type, or nullptr
template <typename Target>
const FieldRule<Target>* FindFieldRule(std::span<const FieldRule<Target>> rules,
                                       uint32_t type) {
  for (const auto& rule : rules) {
    if (rule.type == type) {
      return &rule;
    }
  }
  return nullptr;
}

/// @brief Run one rule over a record payload
template <typename Target>
void ApplyFieldRule(const FieldRule<Target>& rule, ByteCursor payload,
                    Target& target, WarningSink& warnings) {
  const uint64_t offset = payload.BaseOffset();
  if (auto status = rule.decode(payload, target, warnings); !status.ok()) {
    Warning warning = Warning::FromStatus(status, ErrorKind::kMetadataField);
    warning.kind = ErrorKind::kMetadataField;
    warning.message = absl::StrFormat("Record %s: %s", rule.record_name,
                                      warning.message);
    if (!warning.offset.has_value()) {
      warning.offset = offset;
    }
    warnings.Add(std::move(warning));
  }
}

/// @brief Apply every rule to the first directory entry of its type
/// @param file Cursor over the whole file the directory offsets refer to
/// @return Number of records that were decoded
template <typename Target>
size_t ApplyFieldRules(std::span<const FieldRule<Target>> rules,
                       const container::Directory& directory,
                       const ByteCursor& file, Target& target,
                       WarningSink& warnings) {
  size_t applied = 0;
  for (const auto& rule : rules) {
    const container::DirectoryEntry* entry = directory.FindFirst(rule.type);
    if (entry == nullptr) {
      continue;
    }
    auto payload = file.Slice(entry->offset - file.BaseOffset(), entry->length);
    if (!payload.ok()) {
      warnings.AddStatus(payload.status(), ErrorKind::kOutOfBounds);
      continue;
    }
    VLOG(1) << "Decoding metadata record " << rule.record_name << " at "
            << entry->offset;
    ApplyFieldRule(rule, *payload, target, warnings);
    ++applied;
  }
  return applied;
}

}  // namespace metadata

using metadata::FieldRule;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_METADATA_FIELD_RULE_H_
