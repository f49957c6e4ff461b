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

#include "fastoct/core/decode_result.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"

namespace fastoct {

void WarningSink::Add(ErrorKind kind, std::string message,
                      std::optional<uint64_t> offset) {
  Add(Warning{kind, std::move(message), offset});
}

void WarningSink::Add(Warning warning) {
  if (context_.empty()) {
    LOG(WARNING) << warning.ToString();
  } else {
    LOG(WARNING) << context_ << ": " << warning.ToString();
  }
  warnings_.push_back(std::move(warning));
}

void WarningSink::AddStatus(const absl::Status& status, ErrorKind fallback) {
  if (status.ok()) {
    return;
  }
  Add(Warning::FromStatus(status, fallback));
}

void WarningSink::Absorb(std::vector<Warning> other) {
  for (auto& warning : other) {
    warnings_.push_back(std::move(warning));
  }
}

}  // namespace fastoct
