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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_READER_FACTORY_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_READER_FACTORY_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastoct/io/raw_buffer.h"
#include "fastoct/read_options.h"
#include "fastoct/status/status_macros.h"

/**
 * @file reader_factory.h
 * @brief Generic CRTP factory mixin for format readers
 *
 * ReaderFactory provides the two public entry points every reader shares,
 * `Open(path, options)` and `FromBuffer(bytes, options)`, and funnels both
 * through the same creation flow.
 *
 * **Usage Pattern:**
 * ```cpp
 * class FdaReader : public TopconReader, public ReaderFactory<FdaReader> {
 *  private:
 *   friend class ReaderFactory<FdaReader>;
 *
 *   // Hook 1: Check the magic bytes, fail with UnrecognizedFormat
 *   static absl::Status ValidateSignature(ByteView data);
 *
 *   // Hook 2: Parse what is needed up front and construct the reader
 *   static absl::StatusOr<std::unique_ptr<FdaReader>> CreateReaderImpl(
 *       RawBuffer buffer, const ReadOptions& options);
 * };
 * ```
 *
 * **Factory Flow:**
 * 1. Load the file into a RawBuffer (Open only)
 * 2. Call `Derived::ValidateSignature()` on the bytes
 * 3. Call `Derived::CreateReaderImpl()` to construct the reader
 *
 * @tparam Derived The concrete reader class (CRTP parameter)
 */

namespace fs = std::filesystem;

namespace fastoct {

/// @brief Generic CRTP factory mixin for format readers
/// @tparam Derived The concrete reader class (CRTP parameter)
template <typename Derived>
class ReaderFactory {
 public:
  /// @brief Load and open a file
  /// @param path Path to the file
  /// @param options Decode options
  /// @return Reader or error (Io when loading fails, UnrecognizedFormat when
  ///         the signature does not match)
  static absl::StatusOr<std::unique_ptr<Derived>> Open(
      const fs::path& path, const ReadOptions& options = ReadOptions()) {
    DECLARE_ASSIGN_OR_RETURN(RawBuffer, buffer, RawBuffer::Load(path),
                             "Failed to load file");
    return CreateImpl(std::move(buffer), options);
  }

  /// @brief Open a file already held in memory
  /// @param bytes File contents; ownership moves to the reader
  /// @param options Decode options
  static absl::StatusOr<std::unique_ptr<Derived>> FromBuffer(
      std::vector<uint8_t> bytes, const ReadOptions& options = ReadOptions()) {
    return CreateImpl(RawBuffer::Adopt(std::move(bytes)), options);
  }

 protected:
  /// @brief Shared creation flow: validate the signature, then construct
  static absl::StatusOr<std::unique_ptr<Derived>> CreateImpl(
      RawBuffer buffer, const ReadOptions& options) {
    // Hook 1: Validate signature (format-specific)
    RETURN_IF_ERROR(Derived::ValidateSignature(buffer.View()),
                    "Failed to validate signature");

    // Hook 2: Create reader with all initialization (format-specific)
    return Derived::CreateReaderImpl(std::move(buffer), options);
  }

  /// @brief Protected constructor (only derived classes can instantiate via CRTP)
  ReaderFactory() = default;

  /// @brief Protected destructor (not polymorphic - no virtual needed)
  ~ReaderFactory() = default;

  ReaderFactory(const ReaderFactory&) = delete;
  ReaderFactory& operator=(const ReaderFactory&) = delete;
  ReaderFactory(ReaderFactory&&) = delete;
  ReaderFactory& operator=(ReaderFactory&&) = delete;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_READERS_READER_FACTORY_H_
