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

#ifndef AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_SLICE_H_
#define AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_SLICE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace fastoct {

/// @brief Pixel format enumeration
enum class PixelFormat {
  kGray = 1,  ///< Single channel grayscale
  kRGB = 3,   ///< 3 channels: Red, Green, Blue (interleaved)
};

/// @brief Data type enumeration for pixel values
enum class DataType {
  kUInt8,    ///< 8-bit unsigned integer
  kUInt16,   ///< 16-bit unsigned integer
  kFloat32,  ///< 32-bit floating point
};

/// @brief Get size in bytes for a given data type
constexpr size_t GetDataTypeSize(DataType dtype) {
  switch (dtype) {
    case DataType::kUInt8:
      return sizeof(uint8_t);
    case DataType::kUInt16:
      return sizeof(uint16_t);
    case DataType::kFloat32:
      return sizeof(float);
  }
  return 0;
}

/// @brief Get string representation of data type
constexpr const char* GetName(DataType dtype) {
  switch (dtype) {
    case DataType::kUInt8:
      return "uint8";
    case DataType::kUInt16:
      return "uint16";
    case DataType::kFloat32:
      return "float32";
  }
  return "unknown";
}

/// @brief Get string representation of pixel format
constexpr const char* GetName(PixelFormat format) {
  switch (format) {
    case PixelFormat::kGray:
      return "Gray";
    case PixelFormat::kRGB:
      return "RGB";
  }
  return "unknown";
}

/// @brief Get number of channels of a pixel format
constexpr uint32_t GetFormatChannels(PixelFormat format) {
  return static_cast<uint32_t>(format);
}

/// @brief Shape and sample type shared by all slices of one volume
struct SliceGeometry {
  uint32_t width = 0;
  uint32_t height = 0;
  PixelFormat format = PixelFormat::kGray;
  DataType dtype = DataType::kUInt8;

  [[nodiscard]] uint32_t GetChannels() const {
    return GetFormatChannels(format);
  }

  [[nodiscard]] uint32_t GetBitDepth() const {
    return static_cast<uint32_t>(GetDataTypeSize(dtype) * 8);
  }

  /// @brief Number of bytes of one plane with this geometry
  [[nodiscard]] size_t ByteSize() const {
    return static_cast<size_t>(width) * height * GetChannels() *
           GetDataTypeSize(dtype);
  }

  /// @brief e.g. "512x496 Gray uint16"
  [[nodiscard]] std::string ToString() const;

  bool operator==(const SliceGeometry& other) const = default;
};

/// @brief One decoded 2D plane
///
/// Pixels are stored row-major with interleaved channels, each sample in
/// host byte order. A slice whose source record failed to decode is kept as
/// a *missing* placeholder: it reports the volume geometry but holds no
/// pixels.
class Slice {
 public:
  /// @brief Default constructor for an empty slice
  Slice() = default;

  /// @brief Zero-filled slice of the given geometry
  explicit Slice(const SliceGeometry& geometry)
      : geometry_(geometry), data_(geometry.ByteSize(), 0) {}

  /// @brief Wrap already decoded pixels
  /// @retval absl::InvalidArgumentError if the byte count does not match
  static absl::StatusOr<Slice> FromPixels(const SliceGeometry& geometry,
                                          std::vector<uint8_t> pixels);

  /// @brief Placeholder for a slice that could not be decoded
  static Slice Missing(const SliceGeometry& geometry) {
    Slice slice;
    slice.geometry_ = geometry;
    slice.missing_ = true;
    return slice;
  }

  Slice(const Slice& other) = default;
  Slice(Slice&& other) noexcept = default;
  Slice& operator=(const Slice& other) = default;
  Slice& operator=(Slice&& other) noexcept = default;
  ~Slice() = default;

  [[nodiscard]] const SliceGeometry& GetGeometry() const noexcept {
    return geometry_;
  }
  [[nodiscard]] uint32_t GetWidth() const noexcept { return geometry_.width; }
  [[nodiscard]] uint32_t GetHeight() const noexcept {
    return geometry_.height;
  }
  [[nodiscard]] uint32_t GetChannels() const noexcept {
    return geometry_.GetChannels();
  }
  [[nodiscard]] uint32_t GetBitDepth() const noexcept {
    return geometry_.GetBitDepth();
  }
  [[nodiscard]] PixelFormat GetFormat() const noexcept {
    return geometry_.format;
  }
  [[nodiscard]] DataType GetDataType() const noexcept {
    return geometry_.dtype;
  }

  /// @brief True for placeholders of slices that failed to decode
  [[nodiscard]] bool IsMissing() const noexcept { return missing_; }

  /// @brief True when the slice holds no pixels (missing or default)
  [[nodiscard]] bool Empty() const noexcept { return data_.empty(); }

  [[nodiscard]] size_t SizeBytes() const noexcept { return data_.size(); }

  [[nodiscard]] uint8_t* GetData() noexcept { return data_.data(); }
  [[nodiscard]] const uint8_t* GetData() const noexcept {
    return data_.data();
  }

  /// @brief Get typed pointer to pixel data
  template <typename T>
  [[nodiscard]] T* GetDataAs() noexcept {
    return reinterpret_cast<T*>(data_.data());
  }

  template <typename T>
  [[nodiscard]] const T* GetDataAs() const noexcept {
    return reinterpret_cast<const T*>(data_.data());
  }

  /// @brief Sample at column @p x, row @p y, channel @p c
  /// @note No bounds checking
  template <typename T>
  [[nodiscard]] T At(uint32_t x, uint32_t y, uint32_t c = 0) const noexcept {
    const size_t index =
        (static_cast<size_t>(y) * geometry_.width + x) * GetChannels() + c;
    return GetDataAs<T>()[index];
  }

  template <typename T>
  void Set(uint32_t x, uint32_t y, T value, uint32_t c = 0) noexcept {
    const size_t index =
        (static_cast<size_t>(y) * geometry_.width + x) * GetChannels() + c;
    GetDataAs<T>()[index] = value;
  }

 private:
  SliceGeometry geometry_;
  std::vector<uint8_t> data_;
  bool missing_ = false;
};

}  // namespace fastoct

#endif  // AIFO_FASTOCT_INCLUDE_FASTOCT_CORE_SLICE_H_
