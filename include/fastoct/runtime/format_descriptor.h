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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_RUNTIME_FORMAT_DESCRIPTOR_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_RUNTIME_FORMAT_DESCRIPTOR_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/io/byte_cursor.h"
#include "fastoct/read_options.h"

/**
 * @file format_descriptor.h
 * @brief Format descriptors and capability flags
 *
 * A FormatDescriptor describes one vendor format: the extensions it claims,
 * what it can decode, a cheap signature check and a factory creating a
 * reader from file bytes. Descriptors are registered with a ReaderRegistry.
 */

namespace fastoct {

// Forward declarations
class FormatReader;

namespace runtime {

/// @brief Format capability flags
enum class FormatCapability : uint32_t {
  kOctVolumes = 1 << 0,         ///< Format stores OCT volumes
  kFundusImages = 1 << 1,       ///< Format stores fundus images
  kMultipleVolumes = 1 << 2,    ///< One file may hold several volumes
  kContours = 1 << 3,           ///< Format stores layer segmentations
  kCompressed = 1 << 4,         ///< Pixel data may be compressed
  kPatientMetadata = 1 << 5,    ///< Format records patient identity
  kExternalGeometry = 1 << 6,   ///< Dimensions come from ReadOptions
};

/// @brief Capability flags container
using CapabilityFlags = uint32_t;

/// @brief Check if capability is set
inline bool HasCapability(CapabilityFlags flags, FormatCapability cap) {
  return (flags & static_cast<uint32_t>(cap)) != 0;
}

/// @brief Set a capability flag
inline CapabilityFlags SetCapability(CapabilityFlags flags,
                                     FormatCapability cap) {
  return flags | static_cast<uint32_t>(cap);
}

/// @brief Format descriptor
struct FormatDescriptor {
  using Factory = std::function<absl::StatusOr<std::unique_ptr<FormatReader>>(
      std::vector<uint8_t> bytes, const ReadOptions& options)>;

  /// @brief Primary file extension (e.g., ".e2e")
  std::string primary_extension;

  /// @brief Alternative extensions (e.g., {".dicom"})
  std::vector<std::string> aliases;

  /// @brief Human-readable format name (e.g., "E2E")
  std::string format_name;

  /// @brief Format capabilities
  CapabilityFlags capabilities = 0;

  /// @brief Version string (e.g., "1.0.0")
  std::string version;

  /// @brief Cheap signature check on the leading bytes of a file
  ///
  /// Used to pick between formats sharing an extension. A descriptor
  /// without a check accepts every file.
  std::function<bool(ByteView data)> signature_check;

  /// @brief Create a reader from the complete file contents
  Factory factory;

  /// @brief Check if this descriptor handles a given extension
  /// @param extension Lowercase file extension with leading dot
  [[nodiscard]] bool HandlesExtension(std::string_view extension) const {
    if (extension == primary_extension) {
      return true;
    }
    for (const auto& alias : aliases) {
      if (extension == alias) {
        return true;
      }
    }
    return false;
  }

  /// @brief Check if format has a specific capability
  [[nodiscard]] bool HasCapability(FormatCapability capability) const {
    return runtime::HasCapability(capabilities, capability);
  }

  /// @brief Run the signature check, accepting when none is set
  [[nodiscard]] bool Accepts(ByteView data) const {
    return !signature_check || signature_check(data);
  }
};

}  // namespace runtime

// Import runtime types into fastoct namespace
using runtime::CapabilityFlags;
using runtime::FormatCapability;
using runtime::FormatDescriptor;
using runtime::HasCapability;
using runtime::SetCapability;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_RUNTIME_FORMAT_DESCRIPTOR_H_
