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

#include "fastoct/readers/zeiss/zeiss_img.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/pixel/deinterlace.h"
#include "fastoct/pixel/volume_assembler.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace formats {
namespace zeiss {

namespace {

constexpr const char* kVolumeId = "volume_0";

pixel::RawPlaneSpec FrameSpec(const ReadOptions& options) {
  return pixel::RawPlaneSpec{options.zeiss_ascans, options.zeiss_depth,
                             DataType::kUInt8, Endian::kLittle,
                             pixel::SampleOrder::kAScanMajor};
}

}  // namespace

absl::Status ZeissImgReader::ValidateSignature(ByteView data) {
  if (data.empty()) {
    return MAKE_DECODE_ERROR_AT(ErrorKind::kUnrecognizedFormat, 0,
                                "Empty file is not a Zeiss .img stream");
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<ZeissImgReader>>
ZeissImgReader::CreateReaderImpl(RawBuffer buffer, const ReadOptions& options) {
  const uint64_t frame_size = FrameSpec(options).ByteSize();
  if (frame_size == 0 || buffer.Size() < frame_size) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kUnrecognizedFormat, 0,
        absl::StrFormat("%u bytes hold no complete %ux%u frame", buffer.Size(),
                        options.zeiss_ascans, options.zeiss_depth));
  }
  VLOG(1) << "Zeiss .img: " << buffer.Size() / frame_size << " frames of "
          << options.zeiss_ascans << "x" << options.zeiss_depth;
  return std::unique_ptr<ZeissImgReader>(
      new ZeissImgReader(std::move(buffer), options));
}

pixel::RawPlaneSpec ZeissImgReader::GetFrameSpec() const {
  return FrameSpec(GetOptions());
}

uint64_t ZeissImgReader::GetNumFrames() const {
  return GetBuffer().Size() / GetFrameSpec().ByteSize();
}

absl::StatusOr<DecodeResult<OctVolume>> ZeissImgReader::ReadOctVolumes()
    const {
  ResultBuilder<OctVolume> builder;
  WarningSink warnings(kVolumeId);

  const pixel::RawPlaneSpec spec = GetFrameSpec();
  const uint64_t frame_size = spec.ByteSize();
  const uint64_t num_frames = GetNumFrames();
  const ByteCursor file = Cursor();

  if (const uint64_t trailing = file.Size() - num_frames * frame_size;
      trailing != 0) {
    warnings.Add(ErrorKind::kOutOfBounds,
                 absl::StrFormat("Ignoring %u trailing bytes after %u "
                                 "complete frames of %u bytes",
                                 trailing, num_frames, frame_size),
                 num_frames * frame_size);
  }

  pixel::VolumeAssembler assembler(kVolumeId);
  for (uint64_t i = 0; i < num_frames; ++i) {
    const uint64_t offset = i * frame_size;
    auto view = file.ViewAt(offset, frame_size);
    if (!view.ok()) {
      assembler.Add(static_cast<int64_t>(i), view.status(), offset);
      continue;
    }
    assembler.Add(static_cast<int64_t>(i), pixel::DecodeRawPlane(*view, spec),
                  offset);
  }

  auto frames = std::move(assembler).Assemble(warnings);
  if (!frames.ok()) {
    builder.FileWarnings().Absorb(warnings.Take());
    builder.AddFailure(frames.status(), ErrorKind::kInconsistentVolumeGeometry);
    return std::move(builder).Finish();
  }

  OctVolume volume;
  volume.volume_id = kVolumeId;
  volume.device.manufacturer = kManufacturer;
  if (GetOptions().de_interlace) {
    auto fields = pixel::Deinterlace(*frames);
    if (!fields.ok()) {
      builder.FileWarnings().Absorb(warnings.Take());
      builder.AddFailure(fields.status(), ErrorKind::kPixelDecode);
      return std::move(builder).Finish();
    }
    volume.slices = *std::move(fields);
  } else {
    volume.slices = *std::move(frames);
  }

  builder.Add(std::move(volume), warnings.Take());
  return std::move(builder).Finish();
}

absl::StatusOr<DecodeResult<FundusImage>> ZeissImgReader::ReadFundusImages()
    const {
  return ResultBuilder<FundusImage>().Finish();
}

FormatDescriptor CreateZeissImgFormatDescriptor() {
  FormatDescriptor desc;

  desc.primary_extension = ".img";
  desc.format_name = "IMG";
  desc.version = "1.0.0";

  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kExternalGeometry);

  desc.signature_check = [](ByteView data) { return !data.empty(); };
  desc.factory = [](std::vector<uint8_t> bytes, const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> {
    DECLARE_ASSIGN_OR_RETURN(
        std::unique_ptr<ZeissImgReader>, reader,
        ZeissImgReader::FromBuffer(std::move(bytes), options));
    return std::unique_ptr<FormatReader>(std::move(reader));
  };

  return desc;
}

}  // namespace zeiss
}  // namespace formats
}  // namespace fastoct
