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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_FDA_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_FDA_H_

#include <memory>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/readers/topcon/topcon_reader.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file fda.h
 * @brief Topcon .fda reader
 *
 * OCT slices are JPEG streams inside `@IMG_JPEG`:
 *
 * ```
 * u8  scan_mode
 * u32 unknown[2]
 * u32 width, height, number_slices
 * u32 unknown
 * number_slices x { u32 size, u8 jpeg[size] }
 * ```
 *
 * The fundus photograph is `@IMG_FUNDUS`, the tracking (IR) images are
 * `@IMG_TRC_02`.
 *
 * Example usage:
 * ```cpp
 * ASSIGN_OR_RETURN(auto reader, FdaReader::Open("scan.fda"));
 * ASSIGN_OR_RETURN(auto volumes, reader->ReadOctVolumes());
 * ```
 */

namespace fastoct {
namespace formats {
namespace topcon {

/// @brief Topcon .fda reader
class FdaReader : public TopconReader, public ReaderFactory<FdaReader> {
 public:
  static constexpr uint64_t kImgJpegHeaderSize = 25;
  static constexpr uint64_t kImgTrcHeaderSize = 17;

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "FDA";
  }

  /// @brief Decode the grayscale `@IMG_TRC_02` tracking images
  ///
  /// Images are named "tracking_<n>" in file order. An image that fails to
  /// decode is dropped with a file-level warning.
  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadTrackingImages()
      const;

 protected:
  bool CollectSlices(pixel::VolumeAssembler& assembler,
                     WarningSink& warnings) const override;

  [[nodiscard]] const container::DirectoryEntry* FindFundusRecord()
      const override;

  [[nodiscard]] absl::StatusOr<Slice> DecodeFundusRecord(
      const container::DirectoryEntry& entry) const override;

 private:
  friend class ReaderFactory<FdaReader>;

  using TopconReader::TopconReader;

  /// @brief Hook 1: "FOCT" + "FDA" magic
  static absl::Status ValidateSignature(ByteView data);

  /// @brief Hook 2: parse the header and record directory
  static absl::StatusOr<std::unique_ptr<FdaReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);
};

/// @brief Registry descriptor for .fda files
FormatDescriptor CreateFdaFormatDescriptor();

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_FDA_H_
