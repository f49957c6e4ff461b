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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_IO_BYTE_CURSOR_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_IO_BYTE_CURSOR_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

/**
 * @file byte_cursor.h
 * @brief Bounds-checked positional reader over borrowed bytes
 *
 * All vendor decoders read through ByteCursor. A cursor never owns the bytes
 * it reads; views returned from ReadBytes() and Slice() borrow the same
 * underlying buffer and must not outlive it.
 */

namespace fastoct {
namespace io {

/// @brief Byte order of a multi-byte read
enum class Endian {
  kLittle,
  kBig,
};

/// @brief Encoding of fixed-width text fields
enum class TextEncoding {
  kAscii,   ///< Bytes above 0x7F are replaced by '?'
  kLatin1,  ///< ISO-8859-1, converted to UTF-8
};

/// @brief Non-owning view of a byte range
using ByteView = std::span<const uint8_t>;

/// @brief Check that [offset, offset + length) lies within [0, size)
///
/// Overflow of offset + length is detected rather than wrapped, so
/// adversarial inputs such as UINT64_MAX never pass.
[[nodiscard]] constexpr bool RangeFits(uint64_t offset, uint64_t length,
                                       uint64_t size) {
  return offset <= size && length <= size - offset;
}

/// @brief Positionable, bounds-checked reader
///
/// Every read advances the cursor by the consumed width and fails with
/// ErrorKind::kOutOfBounds (absl::StatusCode::kOutOfRange) when the request
/// does not fit. A failed read leaves the position unchanged.
///
/// Positions returned by Tell() are relative to the start of the cursor's
/// view; AbsoluteOffset() adds the offset of the view within the file so
/// that warnings can name a file position.
class ByteCursor {
 public:
  ByteCursor() = default;

  /// @brief Create a cursor over @p data
  /// @param data Borrowed bytes
  /// @param base_offset Absolute file offset of data[0]
  explicit ByteCursor(ByteView data, uint64_t base_offset = 0)
      : data_(data), base_offset_(base_offset) {}

  absl::StatusOr<uint8_t> ReadU8();
  absl::StatusOr<uint16_t> ReadU16(Endian endian);
  absl::StatusOr<uint32_t> ReadU32(Endian endian);
  absl::StatusOr<uint64_t> ReadU64(Endian endian);
  absl::StatusOr<int16_t> ReadI16(Endian endian);
  absl::StatusOr<int32_t> ReadI32(Endian endian);
  absl::StatusOr<float> ReadF32(Endian endian);
  absl::StatusOr<double> ReadF64(Endian endian);

  /// @brief Read @p n bytes as a view into the underlying buffer
  absl::StatusOr<ByteView> ReadBytes(uint64_t n);

  /// @brief Read a fixed-width text field
  ///
  /// The field occupies exactly @p n bytes. The returned string stops at the
  /// first NUL and has trailing spaces removed.
  absl::StatusOr<std::string> ReadFixedString(
      uint64_t n, TextEncoding encoding = TextEncoding::kAscii);

  /// @brief Move to @p offset (relative to the view; Size() is allowed)
  absl::Status Seek(uint64_t offset);

  /// @brief Advance by @p n bytes
  absl::Status Skip(uint64_t n);

  /// @brief Sub-cursor over [offset, offset + length) of this view
  /// @note The new cursor starts at position 0 and reports absolute offsets
  ///       consistent with this one.
  [[nodiscard]] absl::StatusOr<ByteCursor> Slice(uint64_t offset,
                                                 uint64_t length) const;

  /// @brief View of [offset, offset + length) without creating a cursor
  [[nodiscard]] absl::StatusOr<ByteView> ViewAt(uint64_t offset,
                                                uint64_t length) const;

  [[nodiscard]] uint64_t Tell() const { return pos_; }
  [[nodiscard]] uint64_t Size() const { return data_.size(); }
  [[nodiscard]] uint64_t Remaining() const { return data_.size() - pos_; }
  [[nodiscard]] bool AtEnd() const { return pos_ >= data_.size(); }

  /// @brief Absolute file offset of the view's first byte
  [[nodiscard]] uint64_t BaseOffset() const { return base_offset_; }

  /// @brief Absolute file offset of the current position
  [[nodiscard]] uint64_t AbsoluteOffset() const { return base_offset_ + pos_; }

  /// @brief The whole view this cursor reads from
  [[nodiscard]] ByteView View() const { return data_; }

 private:
  /// @brief OutOfBounds error unless @p n bytes remain
  absl::Status Require(uint64_t n) const;

  template <typename T>
  absl::StatusOr<T> ReadInteger(Endian endian);

  ByteView data_;
  uint64_t base_offset_ = 0;
  uint64_t pos_ = 0;
};

}  // namespace io

using io::ByteCursor;
using io::ByteView;
using io::Endian;
using io::TextEncoding;

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_IO_BYTE_CURSOR_H_
