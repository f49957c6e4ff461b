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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_TOPCON_READER_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_TOPCON_READER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/container/directory.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/volume.h"
#include "fastoct/format_reader.h"
#include "fastoct/io/raw_buffer.h"
#include "fastoct/pixel/volume_assembler.h"
#include "fastoct/read_options.h"
#include "fastoct/readers/topcon/topcon_records.h"

/**
 * @file topcon_reader.h
 * @brief Base class for Topcon FDA and FDS readers
 *
 * The record directory is parsed once when the reader is created; an empty
 * directory makes the file unrecognized. Derived readers only decide which
 * records hold the OCT slices and the fundus image:
 *
 * - CollectSlices() feeds the volume's slices to a VolumeAssembler
 * - FindFundusRecord() / DecodeFundusRecord() locate and decode the fundus
 *
 * Metadata and contours are shared by both formats and decoded here.
 */

namespace fastoct {
namespace formats {
namespace topcon {

/// @brief Shared flow of the Topcon readers
class TopconReader : public FormatReader {
 public:
  /// Topcon files hold at most one volume and one fundus image
  static constexpr const char* kVolumeId = "volume_0";
  static constexpr const char* kFundusId = "fundus_0";

  [[nodiscard]] absl::StatusOr<DecodeResult<OctVolume>> ReadOctVolumes()
      const final;

  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadFundusImages()
      const final;

  [[nodiscard]] const TopconHeader& GetHeader() const { return header_; }

  /// @brief Record directory in file order
  [[nodiscard]] const container::Directory& GetDirectory() const {
    return directory_;
  }

 protected:
  TopconReader(RawBuffer buffer, const ReadOptions& options,
               TopconHeader header, container::Directory directory,
               std::vector<Warning> directory_warnings);

  /// @brief Parse the record directory following the header
  /// @retval UnrecognizedFormat if no record can be read
  static absl::StatusOr<container::Directory> ParseDirectory(
      const RawBuffer& buffer, WarningSink& warnings);

  /// @brief Add the OCT slices of the file to @p assembler
  /// @return False when the file holds no OCT record
  virtual bool CollectSlices(pixel::VolumeAssembler& assembler,
                             WarningSink& warnings) const = 0;

  /// @brief Record holding the fundus image, or nullptr
  [[nodiscard]] virtual const container::DirectoryEntry* FindFundusRecord()
      const = 0;

  /// @brief Decode the record returned by FindFundusRecord()
  [[nodiscard]] virtual absl::StatusOr<Slice> DecodeFundusRecord(
      const container::DirectoryEntry& entry) const = 0;

  /// @brief Payload of @p entry as a cursor reporting absolute offsets
  [[nodiscard]] absl::StatusOr<ByteCursor> Payload(
      const container::DirectoryEntry& entry) const;

 private:
  TopconHeader header_;
  container::Directory directory_;
  std::vector<Warning> directory_warnings_;
};

}  // namespace topcon
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_TOPCON_TOPCON_READER_H_
