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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READ_OPTIONS_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READ_OPTIONS_H_

#include <cstdint>

namespace fastoct {

/// @brief Options passed to a reader at open time
///
/// Readers never consult global state; everything that changes how a file is
/// decoded is carried here.
struct ReadOptions {
  /// @brief Split every Zeiss frame into two half-depth slices
  bool de_interlace = false;

  /// @brief A-scans per frame for headerless Zeiss .img files
  uint32_t zeiss_ascans = 512;

  /// @brief Samples per A-scan for headerless Zeiss .img files
  uint32_t zeiss_depth = 1024;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READ_OPTIONS_H_
