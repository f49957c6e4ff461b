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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_ERRORS_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_ERRORS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "fastoct/status/status_macros.h"

/**
 * @file errors.h
 * @brief Decoder error kinds carried on absl::Status
 *
 * Every decoder failure is an absl::Status whose canonical code is derived
 * from an ErrorKind. The kind itself (and optionally the byte offset where
 * the problem was found) travels as a status payload so that it survives
 * RETURN_IF_ERROR / ASSIGN_OR_RETURN propagation.
 */

namespace fastoct {

/// @brief Classification of decoder failures
enum class ErrorKind {
  kUnrecognizedFormat,          ///< Magic/header signature mismatch
  kOutOfBounds,                 ///< Read past the end of the buffer
  kMalformedChunkChain,         ///< Broken or cyclic E2E directory chain
  kPixelDecode,                 ///< Pixel payload could not be decoded
  kInconsistentVolumeGeometry,  ///< Slices of one volume disagree in shape
  kMetadataField,               ///< A single metadata field failed to decode
  kDuplicateSlice,              ///< Two slices of one volume share an index
  kIo,                          ///< File could not be opened or read
};

/// @brief Payload type URL carrying the ErrorKind name
inline constexpr std::string_view kErrorKindPayload = "fastoct.error_kind";

/// @brief Payload type URL carrying the decimal byte offset of the failure
inline constexpr std::string_view kErrorOffsetPayload = "fastoct.offset";

/// @brief Get string representation of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnrecognizedFormat:
      return "UnrecognizedFormat";
    case ErrorKind::kOutOfBounds:
      return "OutOfBounds";
    case ErrorKind::kMalformedChunkChain:
      return "MalformedChunkChain";
    case ErrorKind::kPixelDecode:
      return "PixelDecodeError";
    case ErrorKind::kInconsistentVolumeGeometry:
      return "InconsistentVolumeGeometry";
    case ErrorKind::kMetadataField:
      return "MetadataFieldError";
    case ErrorKind::kDuplicateSlice:
      return "DuplicateSlice";
    case ErrorKind::kIo:
      return "Io";
  }
  return "unknown";
}

/// @brief Canonical absl status code used for an error kind
/// @note kIo maps to kInternal; file-not-found is reported as kNotFound by
///       the I/O layer directly and tagged with kIo afterwards.
constexpr absl::StatusCode GetStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnrecognizedFormat:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kOutOfBounds:
      return absl::StatusCode::kOutOfRange;
    case ErrorKind::kMalformedChunkChain:
    case ErrorKind::kPixelDecode:
      return absl::StatusCode::kDataLoss;
    case ErrorKind::kInconsistentVolumeGeometry:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kMetadataField:
    case ErrorKind::kDuplicateSlice:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kIo:
      return absl::StatusCode::kInternal;
  }
  return absl::StatusCode::kUnknown;
}

/// @brief Tag a status with an error kind and optional byte offset
/// @param status Non-OK status to tag (OK statuses are returned unchanged)
/// @param kind Error kind
/// @param offset Absolute byte offset of the failure, if known
/// @return The tagged status
[[nodiscard]] absl::Status AttachErrorKind(
    absl::Status status, ErrorKind kind,
    std::optional<uint64_t> offset = std::nullopt);

/// @brief Recover the error kind attached to a status
/// @return The kind, or nullopt when the status is OK or untagged
[[nodiscard]] std::optional<ErrorKind> GetErrorKind(
    const absl::Status& status);

/// @brief Recover the byte offset attached to a status
[[nodiscard]] std::optional<uint64_t> GetErrorOffset(
    const absl::Status& status);

/// @brief Check whether a status carries the given error kind
[[nodiscard]] inline bool IsErrorKind(const absl::Status& status,
                                      ErrorKind kind) {
  return GetErrorKind(status) == kind;
}

/// @brief Non-fatal decode problem attached to an entity or a whole file
struct Warning {
  ErrorKind kind;
  std::string message;
  std::optional<uint64_t> offset;

  /// @brief Build a warning from a tagged status
  ///
  /// The message keeps only the root error text, not the trace frames.
  /// Untagged statuses are classified with @p fallback.
  static Warning FromStatus(const absl::Status& status, ErrorKind fallback);

  /// @brief Human-readable single-line form, e.g.
  ///        "PixelDecodeError @0x1a2b: truncated JPEG"
  [[nodiscard]] std::string ToString() const;
};

}  // namespace fastoct

/**
 * @brief Create a traced status of the given ErrorKind.
 *
 * @param kind    fastoct::ErrorKind value.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_DECODE_ERROR(kind, message) \
  ::fastoct::AttachErrorKind(            \
      MAKE_STATUS(::fastoct::GetStatusCode(kind), (message)), (kind))

/**
 * @brief Create a traced status of the given ErrorKind at a byte offset.
 *
 * @param kind    fastoct::ErrorKind value.
 * @param offset  Absolute byte offset of the failure.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_DECODE_ERROR_AT(kind, offset, message)                       \
  ::fastoct::AttachErrorKind(                                             \
      MAKE_STATUS(::fastoct::GetStatusCode(kind), (message)), (kind), \
      static_cast<uint64_t>(offset))

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_ERRORS_H_
