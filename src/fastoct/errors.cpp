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

#include "fastoct/errors.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

namespace fastoct {

namespace {

constexpr std::array<ErrorKind, 8> kAllKinds = {
    ErrorKind::kUnrecognizedFormat,  ErrorKind::kOutOfBounds,
    ErrorKind::kMalformedChunkChain, ErrorKind::kPixelDecode,
    ErrorKind::kInconsistentVolumeGeometry, ErrorKind::kMetadataField,
    ErrorKind::kDuplicateSlice,      ErrorKind::kIo,
};

}  // namespace

absl::Status AttachErrorKind(absl::Status status, ErrorKind kind,
                             std::optional<uint64_t> offset) {
  if (status.ok()) {
    return status;
  }
  status.SetPayload(kErrorKindPayload, absl::Cord(GetName(kind)));
  if (offset.has_value()) {
    status.SetPayload(kErrorOffsetPayload,
                      absl::Cord(absl::StrFormat("%u", *offset)));
  }
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  std::optional<absl::Cord> payload = status.GetPayload(kErrorKindPayload);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  const std::string name(*payload);
  for (ErrorKind kind : kAllKinds) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<uint64_t> GetErrorOffset(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(kErrorOffsetPayload);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  uint64_t offset = 0;
  if (!absl::SimpleAtoi(std::string(*payload), &offset)) {
    return std::nullopt;
  }
  return offset;
}

Warning Warning::FromStatus(const absl::Status& status, ErrorKind fallback) {
  Warning warning;
  warning.kind = GetErrorKind(status).value_or(fallback);
  warning.message = ::fastoct::status::StripStackTrace(status.message());
  warning.offset = GetErrorOffset(status);
  return warning;
}

std::string Warning::ToString() const {
  if (offset.has_value()) {
    return absl::StrFormat("%s @0x%x: %s", GetName(kind), *offset, message);
  }
  return absl::StrFormat("%s: %s", GetName(kind), message);
}

}  // namespace fastoct
