// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file volume.hpp
 * @brief Dense voxel buffer assembled from a stack of slices
 * @details Volume stores voxels of one datatype with shape
 *          (rows, columns, slices) for single-channel data or
 *          (rows, columns, slices, samples) for multi-channel data, in
 *          row-major order (last index varies fastest). A default
 *          constructed Volume is empty and signals that no pixel data could
 *          be decoded.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_types.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace dicom_stacker::core {

/**
 * @brief Datatype corresponding to a C++ component type
 */
template <typename T>
constexpr PixelDatatype pixelDatatypeOf() noexcept {
    if constexpr (std::is_same_v<T, std::uint8_t>) return PixelDatatype::UInt8;
    else if constexpr (std::is_same_v<T, std::int8_t>) return PixelDatatype::Int8;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return PixelDatatype::UInt16;
    else if constexpr (std::is_same_v<T, std::int16_t>) return PixelDatatype::Int16;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return PixelDatatype::UInt32;
    else if constexpr (std::is_same_v<T, std::int32_t>) return PixelDatatype::Int32;
    else if constexpr (std::is_same_v<T, float>) return PixelDatatype::Float32;
    else {
        static_assert(std::is_same_v<T, double>, "Unsupported voxel component type");
        return PixelDatatype::Float64;
    }
}

class Volume {
public:
    /// Empty volume
    Volume() = default;

    /// Zero-filled volume; a Character datatype is stored as Int8
    Volume(int rows, int columns, int slices, int samplesPerPixel, PixelDatatype datatype);

    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    /// (rows, columns, slices) or (rows, columns, slices, samples); empty when empty()
    [[nodiscard]] std::vector<size_t> shape() const;

    [[nodiscard]] int rows() const noexcept { return rows_; }
    [[nodiscard]] int columns() const noexcept { return columns_; }
    [[nodiscard]] int numberOfSlices() const noexcept { return slices_; }
    [[nodiscard]] int samplesPerPixel() const noexcept { return samplesPerPixel_; }
    [[nodiscard]] PixelDatatype datatype() const noexcept { return datatype_; }

    [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return data_; }

    /**
     * @brief Copy a decoded slice into the given slice index
     *
     * The slice must match the volume's rows, columns and samples per pixel,
     * and carry the volume's datatype (a Character slice is accepted by an
     * Int8 volume).
     */
    [[nodiscard]] std::expected<void, DicomErrorInfo>
    setSlice(size_t sliceIndex, const SliceImage& slice);

    /// Voxel value; T must match datatype() and every index must be in range
    template <typename T>
    [[nodiscard]] T at(size_t row, size_t column, size_t slice, size_t sample = 0) const {
        if (pixelDatatypeOf<T>() != datatype_) {
            throw std::invalid_argument("Voxel type does not match volume datatype");
        }
        if (row >= static_cast<size_t>(rows_) || column >= static_cast<size_t>(columns_) ||
            slice >= static_cast<size_t>(slices_) || sample >= static_cast<size_t>(samplesPerPixel_)) {
            throw std::out_of_range("Voxel index outside volume bounds");
        }
        T value{};
        std::memcpy(&value, data_.data() + byteOffset(row, column, slice, sample), sizeof(T));
        return value;
    }

private:
    [[nodiscard]] size_t byteOffset(size_t row, size_t column, size_t slice, size_t sample) const;

    int rows_ = 0;
    int columns_ = 0;
    int slices_ = 0;
    int samplesPerPixel_ = 1;
    PixelDatatype datatype_ = PixelDatatype::UInt8;
    std::vector<std::uint8_t> data_;
};

}  // namespace dicom_stacker::core
