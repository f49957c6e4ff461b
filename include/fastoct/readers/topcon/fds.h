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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_FDS_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_FDS_H_

#include <memory>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/readers/topcon/topcon_reader.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file fds.h
 * @brief Topcon .fds reader
 *
 * OCT slices are stored uncompressed in `@IMG_SCAN_03`: a 25-byte header
 * with the same shape as FDA's `@IMG_JPEG` followed by `number_slices`
 * row-major uint16 little-endian planes of width x height samples. The
 * fundus image is the planar BGR `@IMG_OBS` record, or `@IMG_FUNDUS` when
 * the file has no `@IMG_OBS`.
 */

namespace fastoct {
namespace formats {
namespace topcon {

/// @brief Topcon .fds reader
class FdsReader : public TopconReader, public ReaderFactory<FdsReader> {
 public:
  static constexpr uint64_t kImgScanHeaderSize = 25;

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "FDS";
  }

 protected:
  bool CollectSlices(pixel::VolumeAssembler& assembler,
                     WarningSink& warnings) const override;

  [[nodiscard]] const container::DirectoryEntry* FindFundusRecord()
      const override;

  [[nodiscard]] absl::StatusOr<Slice> DecodeFundusRecord(
      const container::DirectoryEntry& entry) const override;

 private:
  friend class ReaderFactory<FdsReader>;

  using TopconReader::TopconReader;

  /// @brief Hook 1: "FOCT" + "FDS" magic
  static absl::Status ValidateSignature(ByteView data);

  /// @brief Hook 2: parse the header and record directory
  static absl::StatusOr<std::unique_ptr<FdsReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);
};

/// @brief Registry descriptor for .fds files
FormatDescriptor CreateFdsFormatDescriptor();

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_FDS_H_
