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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_ZEISS_ZEISS_IMG_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_ZEISS_ZEISS_IMG_H_

#include <cstdint>
#include <memory>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/core/decode_result.h"
#include "fastoct/core/volume.h"
#include "fastoct/format_reader.h"
#include "fastoct/pixel/raw_plane.h"
#include "fastoct/readers/reader_factory.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file zeiss_img.h
 * @brief Zeiss Cirrus .img reader
 *
 * An .img file has no header at all: it is a stream of 8-bit frames, each
 * `zeiss_ascans` A-scans of `zeiss_depth` samples stored one A-scan after the
 * other. Neither dimension is recorded in the file, so both come from
 * ReadOptions.
 *
 * Interlaced captures store two fields per frame, the first and second half
 * of every A-scan. With `ReadOptions::de_interlace` each frame is split into
 * two half-depth slices. The file gives no hint whether a capture is
 * interlaced; the caller has to know.
 */

namespace fastoct {
namespace formats {
namespace zeiss {

/// @brief Zeiss .img reader
class ZeissImgReader : public FormatReader,
                       public ReaderFactory<ZeissImgReader> {
 public:
  static constexpr const char* kManufacturer = "Carl Zeiss Meditec";

  [[nodiscard]] std::string_view GetFormatName() const override {
    return "IMG";
  }

  /// @brief The single volume of the file
  ///
  /// A trailing partial frame is ignored with a warning.
  [[nodiscard]] absl::StatusOr<DecodeResult<OctVolume>> ReadOctVolumes()
      const override;

  /// @brief Always empty; .img files hold no fundus image
  [[nodiscard]] absl::StatusOr<DecodeResult<FundusImage>> ReadFundusImages()
      const override;

  /// @brief Number of complete frames in the file
  [[nodiscard]] uint64_t GetNumFrames() const;

  /// @brief Shape of one frame as given by the options
  [[nodiscard]] pixel::RawPlaneSpec GetFrameSpec() const;

 private:
  friend class ReaderFactory<ZeissImgReader>;

  using FormatReader::FormatReader;

  /// @brief Hook 1: the file must not be empty
  static absl::Status ValidateSignature(ByteView data);

  /// @brief Hook 2: check that at least one frame fits
  static absl::StatusOr<std::unique_ptr<ZeissImgReader>> CreateReaderImpl(
      RawBuffer buffer, const ReadOptions& options);
};

/// @brief Registry descriptor for .img files
FormatDescriptor CreateZeissImgFormatDescriptor();

}  // namespace zeiss
}  // namespace formats
}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_ZEISS_ZEISS_IMG_H_
