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

#include "fastoct/runtime/reader_registry.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "fastoct/errors.h"
#include "fastoct/format_reader.h"
#include "fastoct/testing/byte_writer.h"

namespace fastoct {
namespace runtime {
namespace {

using fastoct::testing::ByteWriter;

// ============================================================================
// Mock Format Descriptors for Testing
// ============================================================================

/// @brief Descriptor whose factory fails with @p status
FormatDescriptor CreateMockDescriptor(std::string name, std::string extension,
                                      absl::Status status) {
  FormatDescriptor desc;
  desc.format_name = std::move(name);
  desc.primary_extension = std::move(extension);
  desc.factory = [status](std::vector<uint8_t> bytes,
                          const ReadOptions& options)
      -> absl::StatusOr<std::unique_ptr<FormatReader>> { return status; };
  return desc;
}

FormatDescriptor CreateMockE2eDescriptor() {
  FormatDescriptor desc = CreateMockDescriptor(
      "E2E", ".e2e", absl::UnimplementedError("Mock E2E factory"));
  desc.aliases = {".sdb"};
  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kContours);
  return desc;
}

FormatDescriptor CreateMockFdaDescriptor() {
  FormatDescriptor desc = CreateMockDescriptor(
      "FDA", ".fda", absl::UnimplementedError("Mock FDA factory"));
  desc.capabilities = SetCapability(0, FormatCapability::kOctVolumes);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kFundusImages);
  return desc;
}

FormatDescriptor CreateMockDicomDescriptor() {
  FormatDescriptor desc = CreateMockDescriptor(
      "DICOM", ".dcm", absl::UnimplementedError("Mock DICOM factory"));
  desc.aliases = {".dicom"};
  desc.capabilities = SetCapability(0, FormatCapability::kFundusImages);
  return desc;
}

absl::Status Unrecognized(std::string_view message) {
  return AttachErrorKind(absl::InvalidArgumentError(message),
                         ErrorKind::kUnrecognizedFormat);
}

// ============================================================================
// Vendor files for the shared .oct extension
// ============================================================================

void PutRecord(ByteWriter& w, std::string_view key,
               const std::vector<uint8_t>& data) {
  w.PutU32(static_cast<uint32_t>(key.size())).PutString(key);
  w.PutU32(static_cast<uint32_t>(data.size())).PutBytes(data);
}

std::vector<uint8_t> U32(uint32_t v) { return ByteWriter().PutU32(v).Take(); }

std::vector<uint8_t> Text(std::string_view v) {
  return ByteWriter().PutString(v).Take();
}

/// One 2x3 frame
std::vector<uint8_t> BioptigenFile() {
  ByteWriter w;
  w.PutU16(0xFFFF).PutU16(0x9205).PutU16(3);
  PutRecord(w, "FRAMECOUNT", U32(1));
  PutRecord(w, "LINECOUNT", U32(2));
  PutRecord(w, "LINELENGTH", U32(3));
  PutRecord(w, "FRAMEDATA", {});
  PutRecord(w, "FRAMELINES", U32(2));
  PutRecord(w, "FRAMESAMPLES", std::vector<uint8_t>(2 * 3 * 2, 0x11));
  return w.Take();
}

/// One 2x3 frame
std::vector<uint8_t> OptovueFile() {
  ByteWriter w;
  PutRecord(w, "OCT", Text("2.1"));
  PutRecord(w, "Width", Text("2"));
  PutRecord(w, "Height", Text("3"));
  PutRecord(w, "HeaderEnd", {});
  w.PutZeros(2 * 3 * 2);
  return w.Take();
}

// ============================================================================
// Registration
// ============================================================================

TEST(ReaderRegistryTest, EmptyRegistry) {
  ReaderRegistry registry;

  EXPECT_TRUE(registry.ListFormats().empty());
  EXPECT_TRUE(registry.GetSupportedExtensions().empty());
  EXPECT_FALSE(registry.SupportsExtension(".e2e"));
  EXPECT_EQ(registry.GetFormat(".e2e"), nullptr);
}

TEST(ReaderRegistryTest, RegisterSingleFormat) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockE2eDescriptor());

  EXPECT_TRUE(registry.SupportsExtension(".e2e"));
  EXPECT_TRUE(registry.SupportsExtension(".sdb"));

  const auto formats = registry.ListFormats();
  ASSERT_EQ(formats.size(), 1u);
  EXPECT_EQ(formats[0], "E2E");

  const FormatDescriptor* format = registry.GetFormat(".sdb");
  ASSERT_NE(format, nullptr);
  EXPECT_EQ(format->format_name, "E2E");
  EXPECT_EQ(format->primary_extension, ".e2e");
}

TEST(ReaderRegistryTest, RegisterFormatsBulk) {
  ReaderRegistry registry;
  registry.RegisterFormats({CreateMockE2eDescriptor(),
                            CreateMockFdaDescriptor(),
                            CreateMockDicomDescriptor()});

  EXPECT_EQ(registry.ListFormats(),
            (std::vector<std::string>{"DICOM", "E2E", "FDA"}));
  EXPECT_EQ(registry.GetSupportedExtensions(),
            (std::vector<std::string>{".dcm", ".dicom", ".e2e", ".fda",
                                      ".sdb"}));
}

TEST(ReaderRegistryTest, ReplaceExistingFormat) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockFdaDescriptor());

  FormatDescriptor updated = CreateMockFdaDescriptor();
  updated.version = "2.0.0";
  registry.RegisterFormat(std::move(updated));

  const auto formats = registry.GetFormats(".fda");
  ASSERT_EQ(formats.size(), 1u);
  EXPECT_EQ(formats[0].version, "2.0.0");
}

TEST(ReaderRegistryTest, SharedExtensionKeepsRegistrationOrder) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockDescriptor(
      "First", ".oct", absl::UnimplementedError("Mock first factory")));
  registry.RegisterFormat(CreateMockDescriptor(
      "Second", ".oct", absl::UnimplementedError("Mock second factory")));

  const auto formats = registry.GetFormats(".OCT");
  ASSERT_EQ(formats.size(), 2u);
  EXPECT_EQ(formats[0].format_name, "First");
  EXPECT_EQ(formats[1].format_name, "Second");
  EXPECT_EQ(registry.GetFormat(".oct")->format_name, "First");
}

TEST(ReaderRegistryTest, ClearRegistry) {
  ReaderRegistry registry;
  registry.RegisterFormats(
      {CreateMockE2eDescriptor(), CreateMockFdaDescriptor()});
  registry.Clear();

  EXPECT_TRUE(registry.ListFormats().empty());
  EXPECT_FALSE(registry.SupportsExtension(".e2e"));
}

TEST(ReaderRegistryTest, NormalizeExtension) {
  EXPECT_EQ(ReaderRegistry::NormalizeExtension(".E2E"), ".e2e");
  EXPECT_EQ(ReaderRegistry::NormalizeExtension("fda"), ".fda");
  EXPECT_EQ(ReaderRegistry::NormalizeExtension("DiCoM"), ".dicom");
  EXPECT_EQ(ReaderRegistry::NormalizeExtension(""), "");

  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockE2eDescriptor());
  EXPECT_TRUE(registry.SupportsExtension("E2E"));
  EXPECT_TRUE(registry.SupportsExtension(".SDB"));
}

TEST(ReaderRegistryTest, CapabilityQueries) {
  ReaderRegistry registry;
  registry.RegisterFormats({CreateMockE2eDescriptor(),
                            CreateMockFdaDescriptor(),
                            CreateMockDicomDescriptor()});

  EXPECT_TRUE(
      registry.SupportsCapability(".e2e", FormatCapability::kContours));
  EXPECT_FALSE(
      registry.SupportsCapability(".fda", FormatCapability::kContours));
  EXPECT_FALSE(
      registry.SupportsCapability(".xyz", FormatCapability::kOctVolumes));

  EXPECT_EQ(registry.ListFormatsByCapability(FormatCapability::kFundusImages),
            (std::vector<std::string>{"DICOM", "FDA"}));
  EXPECT_TRUE(
      registry.ListFormatsByCapability(FormatCapability::kCompressed).empty());
}

// ============================================================================
// Reader creation
// ============================================================================

TEST(ReaderRegistryTest, PathWithoutExtension) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockE2eDescriptor());

  auto reader = registry.CreateReader("scan");
  ASSERT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ReaderRegistryTest, UnknownExtension) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockE2eDescriptor());

  auto reader = registry.CreateReader("scan.xyz");
  ASSERT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kNotFound);

  auto from_buffer = registry.CreateReaderFromBuffer(".xyz", {1, 2, 3});
  EXPECT_EQ(from_buffer.status().code(), absl::StatusCode::kNotFound);
}

TEST(ReaderRegistryTest, MissingFileIsAnIoError) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockE2eDescriptor());

  auto reader = registry.CreateReader("/nonexistent/path/scan.e2e");
  ASSERT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kNotFound);
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kIo));
}

TEST(ReaderRegistryTest, FactoryErrorsOtherThanSignatureArePropagated) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateMockE2eDescriptor());

  auto reader = registry.CreateReaderFromBuffer(".e2e", {1, 2, 3});
  ASSERT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kUnimplemented);
}

TEST(ReaderRegistryTest, UnrecognizedCandidatesAreSkipped) {
  ReaderRegistry registry;
  registry.RegisterFormat(
      CreateMockDescriptor("First", ".oct", Unrecognized("not first")));
  registry.RegisterFormat(CreateMockDescriptor(
      "Second", ".oct", absl::UnimplementedError("second tried")));

  auto reader = registry.CreateReaderFromBuffer(".oct", {1, 2, 3});
  ASSERT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kUnimplemented);
}

TEST(ReaderRegistryTest, NoCandidateIsUnrecognizedFormat) {
  ReaderRegistry registry;
  registry.RegisterFormat(
      CreateMockDescriptor("First", ".oct", Unrecognized("not first")));

  FormatDescriptor picky =
      CreateMockDescriptor("Picky", ".oct", absl::InternalError("unreached"));
  picky.signature_check = [](ByteView data) { return false; };
  registry.RegisterFormat(std::move(picky));

  auto reader = registry.CreateReaderFromBuffer(".oct", {1, 2, 3});
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(ReaderRegistryTest, SharedOctExtensionPicksReaderBySignature) {
  ReaderRegistry registry;
  RegisterBuiltinFormats(registry);
  ASSERT_EQ(registry.GetFormats(".oct").size(), 2u);

  auto bioptigen = registry.CreateReaderFromBuffer(".oct", BioptigenFile());
  ASSERT_TRUE(bioptigen.ok()) << bioptigen.status();
  EXPECT_EQ((*bioptigen)->GetFormatName(), "Bioptigen");

  auto optovue = registry.CreateReaderFromBuffer(".oct", OptovueFile());
  ASSERT_TRUE(optovue.ok()) << optovue.status();
  EXPECT_EQ((*optovue)->GetFormatName(), "Optovue");

  auto volumes = (*optovue)->ReadOctVolumes();
  ASSERT_TRUE(volumes.ok()) << volumes.status();
  ASSERT_EQ(volumes->size(), 1u);
  EXPECT_EQ(volumes->items[0].value.GetNumSlices(), 1u);

  auto neither = registry.CreateReaderFromBuffer(".oct", {0, 1, 2, 3, 4, 5});
  ASSERT_FALSE(neither.ok());
  EXPECT_TRUE(IsErrorKind(neither.status(), ErrorKind::kUnrecognizedFormat));
}

TEST(ReaderRegistryTest, CreateReaderLoadsTheFile) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "fastoct_registry_test.OCT";
  {
    const std::vector<uint8_t> bytes = BioptigenFile();
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  }

  ReaderRegistry registry;
  RegisterBuiltinFormats(registry);
  auto reader = registry.CreateReader(path);
  std::filesystem::remove(path);

  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetFormatName(), "Bioptigen");
  EXPECT_EQ((*reader)->GetBuffer().Size(), BioptigenFile().size());
}

TEST(ReaderRegistryTest, GlobalRegistryHasBuiltinFormats) {
  const auto formats = GetGlobalRegistry().ListFormats();
  EXPECT_EQ(formats,
            (std::vector<std::string>{"Bioptigen", "DICOM", "E2E", "FDA", "FDS",
                                      "IMG", "Optovue"}));

  EXPECT_TRUE(GetGlobalRegistry().SupportsExtension(".sdb"));
  EXPECT_TRUE(GetGlobalRegistry().SupportsExtension(".dicom"));
  EXPECT_TRUE(GetGlobalRegistry().SupportsCapability(
      ".img", FormatCapability::kExternalGeometry));
}

}  // namespace
}  // namespace runtime
}  // namespace fastoct
