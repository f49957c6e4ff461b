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

#include "fastoct/pixel/volume_assembler.h"

#include <cstdint>
#include <utility>
#include <vector>

#include "fastoct/core/decode_result.h"
#include "fastoct/errors.h"
#include "gtest/gtest.h"

namespace fastoct {
namespace pixel {
namespace {

Slice Filled(uint8_t value, uint32_t width = 4, uint32_t height = 3) {
  Slice slice(SliceGeometry{width, height, PixelFormat::kGray,
                            DataType::kUInt8});
  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < width; ++x) {
      slice.Set<uint8_t>(x, y, value);
    }
  }
  return slice;
}

absl::Status Broken() {
  return MAKE_DECODE_ERROR_AT(ErrorKind::kPixelDecode, 0x40, "bad slice");
}

TEST(VolumeAssemblerTest, SortsByExplicitIndex) {
  VolumeAssembler assembler("vol");
  assembler.Add(2, Filled(2));
  assembler.Add(0, Filled(0));
  assembler.Add(1, Filled(1));

  WarningSink warnings;
  auto slices = std::move(assembler).Assemble(warnings);
  ASSERT_TRUE(slices.ok()) << slices.status();
  ASSERT_EQ(slices->size(), 3u);
  for (uint8_t i = 0; i < 3; ++i) {
    EXPECT_EQ((*slices)[i].At<uint8_t>(0, 0), i);
  }
  EXPECT_TRUE(warnings.Empty());
}

TEST(VolumeAssemblerTest, FallsBackToArrivalOrder) {
  VolumeAssembler assembler("vol");
  assembler.Add(std::nullopt, Filled(9));
  assembler.Add(5, Filled(5));
  assembler.Add(std::nullopt, Filled(1));

  WarningSink warnings;
  auto slices = std::move(assembler).Assemble(warnings);
  ASSERT_TRUE(slices.ok()) << slices.status();
  ASSERT_EQ(slices->size(), 3u);
  EXPECT_EQ((*slices)[0].At<uint8_t>(0, 0), 9);
  EXPECT_EQ((*slices)[1].At<uint8_t>(0, 0), 5);
  EXPECT_EQ((*slices)[2].At<uint8_t>(0, 0), 1);
}

TEST(VolumeAssemblerTest, DuplicateIndexKeepsFirstArrival) {
  VolumeAssembler assembler("vol");
  assembler.Add(0, Filled(10));
  assembler.Add(1, Filled(11));
  assembler.Add(0, Filled(99), 1234);

  WarningSink warnings;
  auto slices = std::move(assembler).Assemble(warnings);
  ASSERT_TRUE(slices.ok()) << slices.status();
  ASSERT_EQ(slices->size(), 2u);
  EXPECT_EQ((*slices)[0].At<uint8_t>(0, 0), 10);

  ASSERT_EQ(warnings.Size(), 1u);
  EXPECT_EQ(warnings.Get()[0].kind, ErrorKind::kDuplicateSlice);
  ASSERT_TRUE(warnings.Get()[0].offset.has_value());
  EXPECT_EQ(*warnings.Get()[0].offset, 1234u);
}

TEST(VolumeAssemblerTest, FailedSliceBecomesMissingPlaceholder) {
  VolumeAssembler assembler("vol");
  assembler.Add(0, Filled(1));
  assembler.Add(1, Broken());
  assembler.Add(2, Filled(3));

  WarningSink warnings;
  auto slices = std::move(assembler).Assemble(warnings);
  ASSERT_TRUE(slices.ok()) << slices.status();
  ASSERT_EQ(slices->size(), 3u);
  EXPECT_TRUE((*slices)[1].IsMissing());
  EXPECT_EQ((*slices)[1].GetGeometry(), (*slices)[0].GetGeometry());
  EXPECT_FALSE((*slices)[2].IsMissing());

  ASSERT_EQ(warnings.Size(), 1u);
  EXPECT_EQ(warnings.Get()[0].kind, ErrorKind::kPixelDecode);
  EXPECT_EQ(*warnings.Get()[0].offset, 0x40u);
}

TEST(VolumeAssemblerTest, GeometryMismatchIsInconsistentVolumeGeometry) {
  VolumeAssembler assembler("vol");
  assembler.Add(0, Filled(1, 4, 3));
  assembler.Add(1, Filled(1, 5, 3));

  WarningSink warnings;
  auto slices = std::move(assembler).Assemble(warnings);
  ASSERT_FALSE(slices.ok());
  EXPECT_TRUE(IsErrorKind(slices.status(),
                          ErrorKind::kInconsistentVolumeGeometry));
}

TEST(VolumeAssemblerTest, RejectsVolumeWithoutDecodedSlices) {
  VolumeAssembler empty("empty");
  WarningSink warnings;
  EXPECT_TRUE(IsErrorKind(std::move(empty).Assemble(warnings).status(),
                          ErrorKind::kInconsistentVolumeGeometry));

  VolumeAssembler broken("broken");
  broken.Add(0, Broken());
  broken.Add(1, Broken());
  auto slices = std::move(broken).Assemble(warnings);
  ASSERT_FALSE(slices.ok());
  EXPECT_TRUE(IsErrorKind(slices.status(), ErrorKind::kPixelDecode));
  EXPECT_EQ(warnings.Size(), 2u);
}

}  // namespace
}  // namespace pixel
}  // namespace fastoct
