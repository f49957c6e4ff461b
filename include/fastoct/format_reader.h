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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_FORMAT_READER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_FORMAT_READER_H_

#include <string_view>
#include <utility>

#include "absl/status/statusor.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/volume.h"
#include "fastoct/io/byte_cursor.h"
#include "fastoct/io/raw_buffer.h"
#include "fastoct/read_options.h"

namespace fastoct {

/// @brief Abstract base class for vendor file readers
///
/// A reader owns the bytes of exactly one file. The signature is validated
/// when the reader is created; both read operations then decode from the
/// owned buffer and may be called any number of times. Entities returned by
/// a read do not reference the buffer.
class FormatReader {
 public:
  /// @brief Virtual destructor
  virtual ~FormatReader() = default;

  /// @brief Delete copy constructor and assignment
  FormatReader(const FormatReader&) = delete;
  FormatReader& operator=(const FormatReader&) = delete;

  /// @brief Delete move constructor and assignment
  FormatReader(FormatReader&&) = delete;
  FormatReader& operator=(FormatReader&&) = delete;

  /// @brief Short format name, e.g. "FDA" or "E2E"
  [[nodiscard]] virtual std::string_view GetFormatName() const = 0;

  /// @brief Decode every OCT volume in the file
  ///
  /// Files without OCT data give an empty result. A volume that cannot be
  /// assembled is dropped with a file-level warning; the call fails only when
  /// volumes were present and none survived.
  [[nodiscard]] virtual absl::StatusOr<DecodeResult<OctVolume>>
  ReadOctVolumes() const = 0;

  /// @brief Decode every fundus image in the file
  [[nodiscard]] virtual absl::StatusOr<DecodeResult<FundusImage>>
  ReadFundusImages() const = 0;

  [[nodiscard]] const ReadOptions& GetOptions() const { return options_; }

  [[nodiscard]] const RawBuffer& GetBuffer() const { return buffer_; }

 protected:
  FormatReader(RawBuffer buffer, const ReadOptions& options)
      : buffer_(std::move(buffer)), options_(options) {}

  /// @brief Cursor over the whole file
  [[nodiscard]] ByteCursor Cursor() const { return buffer_.Cursor(); }

 private:
  RawBuffer buffer_;
  ReadOptions options_;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_FORMAT_READER_H_
