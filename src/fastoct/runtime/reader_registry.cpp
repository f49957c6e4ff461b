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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastoct/errors.h"
#include "fastoct/format_reader.h"
#include "fastoct/io/file_reader.h"
#include "fastoct/status/status_macros.h"
#include "fastoct/utilities/fmt.h"

namespace fastoct {
namespace runtime {

std::string ReaderRegistry::NormalizeExtension(std::string_view extension) {
  std::string result(extension);

  // Convert to lowercase
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  // Ensure leading dot
  if (!result.empty() && result[0] != '.') {
    result = "." + result;
  }

  return result;
}

void ReaderRegistry::AddLocked(const std::string& extension,
                               const FormatDescriptor& descriptor) {
  auto& descriptors = formats_[extension];
  for (auto& existing : descriptors) {
    if (existing.format_name == descriptor.format_name) {
      existing = descriptor;
      return;
    }
  }
  descriptors.push_back(descriptor);
}

void ReaderRegistry::RegisterFormat(FormatDescriptor descriptor) {
  absl::MutexLock lock(&mutex_);

  AddLocked(NormalizeExtension(descriptor.primary_extension), descriptor);

  // Also register aliases
  for (const auto& alias : descriptor.aliases) {
    AddLocked(NormalizeExtension(alias), descriptor);
  }
}

void ReaderRegistry::RegisterFormats(
    std::vector<FormatDescriptor> descriptors) {
  for (auto& desc : descriptors) {
    RegisterFormat(std::move(desc));
  }
}

absl::StatusOr<std::unique_ptr<FormatReader>> ReaderRegistry::CreateReader(
    const std::filesystem::path& path, const ReadOptions& options) const {
  std::string extension = path.extension().string();
  if (extension.empty()) {
    return absl::InvalidArgumentError(
        fmt::format("File has no extension: {}", path.string()));
  }

  if (!SupportsExtension(extension)) {
    return absl::NotFoundError(fmt::format(
        "No reader registered for extension: {}", extension));
  }

  DECLARE_ASSIGN_OR_RETURN(io::FileReader, file, io::FileReader::Open(path),
                           "Failed to open input file");
  DECLARE_ASSIGN_OR_RETURN(std::vector<uint8_t>, bytes, file.ReadAll(),
                           "Failed to read input file");

  return CreateReaderFromBuffer(extension, std::move(bytes), options);
}

absl::StatusOr<std::unique_ptr<FormatReader>>
ReaderRegistry::CreateReaderFromBuffer(std::string_view extension,
                                       std::vector<uint8_t> bytes,
                                       const ReadOptions& options) const {
  const std::vector<FormatDescriptor> descriptors = GetFormats(extension);
  if (descriptors.empty()) {
    return absl::NotFoundError(fmt::format(
        "No reader registered for extension: {}", extension));
  }

  // Narrow down by signature before handing out copies of the bytes
  std::vector<const FormatDescriptor*> candidates;
  for (const auto& descriptor : descriptors) {
    if (!descriptor.factory) {
      LOG(ERROR) << "Format descriptor " << descriptor.format_name
                 << " has no factory function";
      continue;
    }
    if (descriptor.Accepts(ByteView(bytes))) {
      candidates.push_back(&descriptor);
    }
  }

  for (size_t i = 0; i < candidates.size(); ++i) {
    const FormatDescriptor& descriptor = *candidates[i];
    const bool last = i + 1 == candidates.size();

    absl::StatusOr<std::unique_ptr<FormatReader>> reader =
        last ? descriptor.factory(std::move(bytes), options)
             : descriptor.factory(bytes, options);

    if (reader.ok()) {
      if (*reader == nullptr) {
        LOG(ERROR) << "Factory for " << descriptor.format_name
                   << " returned no reader";
        return absl::InternalError(fmt::format(
            "Factory for {} returned no reader", descriptor.format_name));
      }
      VLOG(1) << "Opened " << extension << " file as "
              << descriptor.format_name;
      return reader;
    }
    if (!IsErrorKind(reader.status(), ErrorKind::kUnrecognizedFormat)) {
      RETURN_IF_ERROR(reader.status(),
                      fmt::format("{} reader failed", descriptor.format_name));
    }
    VLOG(1) << descriptor.format_name << " rejected the file: "
            << reader.status().message();
  }

  return MAKE_DECODE_ERROR(
      ErrorKind::kUnrecognizedFormat,
      fmt::format("No {} format recognized the file signature", extension));
}

std::vector<std::string> ReaderRegistry::ListFormats() const {
  absl::ReaderMutexLock lock(&mutex_);

  // Collect unique format names (avoid duplicates from aliases)
  std::set<std::string> seen;
  for (const auto& [ext, descriptors] : formats_) {
    for (const auto& desc : descriptors) {
      seen.insert(desc.format_name);
    }
  }

  return {seen.begin(), seen.end()};
}

const FormatDescriptor* ReaderRegistry::GetFormat(
    std::string_view extension) const {
  std::string normalized = NormalizeExtension(extension);

  absl::ReaderMutexLock lock(&mutex_);

  auto it = formats_.find(normalized);
  if (it == formats_.end() || it->second.empty()) {
    return nullptr;
  }

  return &it->second.front();
}

std::vector<FormatDescriptor> ReaderRegistry::GetFormats(
    std::string_view extension) const {
  std::string normalized = NormalizeExtension(extension);

  absl::ReaderMutexLock lock(&mutex_);

  auto it = formats_.find(normalized);
  if (it == formats_.end()) {
    return {};
  }

  return it->second;
}

bool ReaderRegistry::SupportsExtension(std::string_view extension) const {
  return GetFormat(extension) != nullptr;
}

bool ReaderRegistry::SupportsCapability(std::string_view extension,
                                        FormatCapability capability) const {
  for (const auto& format : GetFormats(extension)) {
    if (format.HasCapability(capability)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> ReaderRegistry::ListFormatsByCapability(
    FormatCapability capability) const {
  absl::ReaderMutexLock lock(&mutex_);

  std::set<std::string> seen;
  for (const auto& [ext, descriptors] : formats_) {
    for (const auto& desc : descriptors) {
      if (HasCapability(desc.capabilities, capability)) {
        seen.insert(desc.format_name);
      }
    }
  }

  return {seen.begin(), seen.end()};
}

std::vector<std::string> ReaderRegistry::GetSupportedExtensions() const {
  absl::ReaderMutexLock lock(&mutex_);

  std::vector<std::string> extensions;
  extensions.reserve(formats_.size());

  for (const auto& [ext, descriptors] : formats_) {
    if (!descriptors.empty()) {
      extensions.push_back(ext);
    }
  }

  // std::map keeps keys ordered already
  return extensions;
}

void ReaderRegistry::Clear() {
  absl::MutexLock lock(&mutex_);
  formats_.clear();
}

// Global registry implementation
ReaderRegistry& GetGlobalRegistry() {
  static ReaderRegistry* global_registry = []() {
    auto* registry = new ReaderRegistry();
    RegisterBuiltinFormats(*registry);
    return registry;
  }();
  return *global_registry;
}

}  // namespace runtime
}  // namespace fastoct
