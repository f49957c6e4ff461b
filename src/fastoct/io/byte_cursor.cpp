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

#include "fastoct/io/byte_cursor.h"

#include <bit>
#include <cstdint>
#include <string>
#include <type_traits>

#include "absl/strings/str_format.h"
#include "fastoct/errors.h"
#include "fastoct/status/status_macros.h"

namespace fastoct {
namespace io {

absl::Status ByteCursor::Require(uint64_t n) const {
  if (!RangeFits(pos_, n, data_.size())) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, AbsoluteOffset(),
        absl::StrFormat("Read of %u bytes at offset %u exceeds buffer of %u "
                        "bytes",
                        n, AbsoluteOffset(), base_offset_ + data_.size()));
  }
  return absl::OkStatus();
}

template <typename T>
absl::StatusOr<T> ByteCursor::ReadInteger(Endian endian) {
  static_assert(std::is_unsigned_v<T>);
  RETURN_IF_ERROR(Require(sizeof(T)), "Integer read out of bounds");

  T value = 0;
  const uint8_t* p = data_.data() + pos_;
  if (endian == Endian::kLittle) {
    for (size_t i = sizeof(T); i-- > 0;) {
      value = static_cast<T>((value << 8) | p[i]);
    }
  } else {
    for (size_t i = 0; i < sizeof(T); ++i) {
      value = static_cast<T>((value << 8) | p[i]);
    }
  }
  pos_ += sizeof(T);
  return value;
}

absl::StatusOr<uint8_t> ByteCursor::ReadU8() {
  RETURN_IF_ERROR(Require(1), "Byte read out of bounds");
  return data_[pos_++];
}

absl::StatusOr<uint16_t> ByteCursor::ReadU16(Endian endian) {
  return ReadInteger<uint16_t>(endian);
}

absl::StatusOr<uint32_t> ByteCursor::ReadU32(Endian endian) {
  return ReadInteger<uint32_t>(endian);
}

absl::StatusOr<uint64_t> ByteCursor::ReadU64(Endian endian) {
  return ReadInteger<uint64_t>(endian);
}

absl::StatusOr<int16_t> ByteCursor::ReadI16(Endian endian) {
  DECLARE_ASSIGN_OR_RETURN(uint16_t, raw, ReadInteger<uint16_t>(endian));
  return static_cast<int16_t>(raw);
}

absl::StatusOr<int32_t> ByteCursor::ReadI32(Endian endian) {
  DECLARE_ASSIGN_OR_RETURN(uint32_t, raw, ReadInteger<uint32_t>(endian));
  return static_cast<int32_t>(raw);
}

absl::StatusOr<float> ByteCursor::ReadF32(Endian endian) {
  DECLARE_ASSIGN_OR_RETURN(uint32_t, raw, ReadInteger<uint32_t>(endian));
  return std::bit_cast<float>(raw);
}

absl::StatusOr<double> ByteCursor::ReadF64(Endian endian) {
  DECLARE_ASSIGN_OR_RETURN(uint64_t, raw, ReadInteger<uint64_t>(endian));
  return std::bit_cast<double>(raw);
}

absl::StatusOr<ByteView> ByteCursor::ReadBytes(uint64_t n) {
  RETURN_IF_ERROR(Require(n), "Byte range read out of bounds");
  ByteView view = data_.subspan(pos_, n);
  pos_ += n;
  return view;
}

absl::StatusOr<std::string> ByteCursor::ReadFixedString(uint64_t n,
                                                        TextEncoding encoding) {
  DECLARE_ASSIGN_OR_RETURN(ByteView, raw, ReadBytes(n));

  size_t length = 0;
  while (length < raw.size() && raw[length] != 0) {
    ++length;
  }
  while (length > 0 && raw[length - 1] == ' ') {
    --length;
  }

  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    const uint8_t c = raw[i];
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else if (encoding == TextEncoding::kLatin1) {
      // Latin-1 code points map 1:1 onto U+0080..U+00FF
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
      out.push_back('?');
    }
  }
  return out;
}

absl::Status ByteCursor::Seek(uint64_t offset) {
  if (offset > data_.size()) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, base_offset_,
        absl::StrFormat("Seek to %u beyond buffer of %u bytes", offset,
                        data_.size()));
  }
  pos_ = offset;
  return absl::OkStatus();
}

absl::Status ByteCursor::Skip(uint64_t n) {
  RETURN_IF_ERROR(Require(n), "Skip out of bounds");
  pos_ += n;
  return absl::OkStatus();
}

absl::StatusOr<ByteView> ByteCursor::ViewAt(uint64_t offset,
                                            uint64_t length) const {
  if (!RangeFits(offset, length, data_.size())) {
    return MAKE_DECODE_ERROR_AT(
        ErrorKind::kOutOfBounds, base_offset_,
        absl::StrFormat("Range [%u, +%u) exceeds buffer of %u bytes",
                        base_offset_ + offset, length, data_.size()));
  }
  return data_.subspan(offset, length);
}

absl::StatusOr<ByteCursor> ByteCursor::Slice(uint64_t offset,
                                             uint64_t length) const {
  DECLARE_ASSIGN_OR_RETURN(ByteView, view, ViewAt(offset, length),
                           "Slice out of bounds");
  return ByteCursor(view, base_offset_ + offset);
}

}  // namespace io
}  // namespace fastoct
