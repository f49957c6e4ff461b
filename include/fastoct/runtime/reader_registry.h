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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_RUNTIME_READER_REGISTRY_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_RUNTIME_READER_REGISTRY_H_

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "fastoct/read_options.h"
#include "fastoct/runtime/format_descriptor.h"

/**
 * @file reader_registry.h
 * @brief Extension-based registry of format descriptors
 *
 * The registry can be owned by applications or test fixtures; a global
 * instance with every built-in format is available through
 * GetGlobalRegistry().
 */

namespace fastoct {

// Forward declaration
class FormatReader;

namespace runtime {

/// @brief Reader registry for vendor formats
///
/// Several formats may claim the same extension (`.oct` is used by both
/// Bioptigen and Optovue). A file is then offered to each candidate whose
/// signature check accepts its leading bytes, in registration order, until one
/// factory succeeds.
///
/// Example usage:
/// @code
/// ReaderRegistry registry;
/// registry.RegisterFormat(CreateE2eFormatDescriptor());
/// registry.RegisterFormat(CreateBioptigenFormatDescriptor());
/// registry.RegisterFormat(CreateOptovueFormatDescriptor());
///
/// auto reader = registry.CreateReader("scan.oct");
/// @endcode
class ReaderRegistry {
 public:
  ReaderRegistry() = default;
  ~ReaderRegistry() = default;

  // Non-copyable, non-movable (owns a mutex)
  ReaderRegistry(const ReaderRegistry&) = delete;
  ReaderRegistry& operator=(const ReaderRegistry&) = delete;
  ReaderRegistry(ReaderRegistry&&) = delete;
  ReaderRegistry& operator=(ReaderRegistry&&) = delete;

  /// @brief Register a format descriptor under its extension and aliases
  /// @note Thread-safe. A descriptor with the same format name already
  ///       registered for an extension is replaced in place.
  void RegisterFormat(FormatDescriptor descriptor);

  /// @brief Register multiple format descriptors
  void RegisterFormats(std::vector<FormatDescriptor> descriptors);

  /// @brief Load a file and create a reader for it
  /// @param path Path to the vendor file
  /// @param options Decode options handed to the reader
  /// @retval InvalidArgument if the path has no extension
  /// @retval NotFound if no format is registered for the extension
  /// @retval UnrecognizedFormat if no candidate accepts the file
  [[nodiscard]] absl::StatusOr<std::unique_ptr<FormatReader>> CreateReader(
      const std::filesystem::path& path,
      const ReadOptions& options = ReadOptions()) const;

  /// @brief Create a reader for file contents held in memory
  /// @param extension Extension the bytes would have on disk (e.g. ".oct")
  /// @param bytes File contents; ownership moves to the reader
  /// @param options Decode options handed to the reader
  [[nodiscard]] absl::StatusOr<std::unique_ptr<FormatReader>>
  CreateReaderFromBuffer(std::string_view extension,
                         std::vector<uint8_t> bytes,
                         const ReadOptions& options = ReadOptions()) const;

  /// @brief List all registered format names (sorted, unique)
  [[nodiscard]] std::vector<std::string> ListFormats() const;

  /// @brief First descriptor registered for an extension
  /// @return Descriptor or nullptr if not found
  /// @note The pointer is invalidated by the next registration or Clear().
  [[nodiscard]] const FormatDescriptor* GetFormat(
      std::string_view extension) const;

  /// @brief Every descriptor registered for an extension, in order
  [[nodiscard]] std::vector<FormatDescriptor> GetFormats(
      std::string_view extension) const;

  /// @brief Check if extension is supported
  [[nodiscard]] bool SupportsExtension(std::string_view extension) const;

  /// @brief Check if any format registered for an extension has a capability
  [[nodiscard]] bool SupportsCapability(std::string_view extension,
                                        FormatCapability capability) const;

  /// @brief List formats that support a specific capability (sorted)
  [[nodiscard]] std::vector<std::string> ListFormatsByCapability(
      FormatCapability capability) const;

  /// @brief Get all supported extensions (sorted)
  [[nodiscard]] std::vector<std::string> GetSupportedExtensions() const;

  /// @brief Clear all registered formats
  void Clear();

  /// @brief Normalize extension (lowercase with leading dot)
  static std::string NormalizeExtension(std::string_view extension);

 private:
  void AddLocked(const std::string& extension,
                 const FormatDescriptor& descriptor)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  /// @brief Format storage (extension -> descriptors in registration order)
  std::map<std::string, std::vector<FormatDescriptor>> formats_
      ABSL_GUARDED_BY(mutex_);

  mutable absl::Mutex mutex_;
};

/// @brief Register every built-in vendor format
void RegisterBuiltinFormats(ReaderRegistry& registry);

/// @brief Get global default registry
///
/// The global registry is created on first access with all built-in formats
/// registered. Tests and applications that need control over the formats
/// should own a ReaderRegistry instead.
ReaderRegistry& GetGlobalRegistry();

}  // namespace runtime

// Import into fastoct namespace
using runtime::GetGlobalRegistry;
using runtime::ReaderRegistry;
using runtime::RegisterBuiltinFormats;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_RUNTIME_READER_REGISTRY_H_
