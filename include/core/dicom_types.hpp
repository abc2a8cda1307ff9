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
 * @file dicom_types.hpp
 * @brief Shared value types for DICOM slice stacking
 * @details Defines the error codes returned by every stage of the volume
 *          assembly pipeline, the tag set read from a single DICOM file,
 *          the pixel datatypes a decoded slice may carry, and the SliceImage
 *          buffer handed from a decoder to the volume assembler.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dicom_stacker::core {

/// Error types for DICOM loading
enum class DicomError {
    FileNotFound,
    InvalidDicomFormat,
    DecodingFailed,
    MetadataExtractionFailed,
    SeriesAssemblyFailed,
    UnsupportedPixelFormat
};

/// Error result with message
struct DicomErrorInfo {
    DicomError code;
    std::string message;
};

/**
 * @brief Tag values of one DICOM file
 *
 * Keys use the ITK metadata dictionary convention "gggg|eeee" with lower-case
 * hexadecimal digits. Values are the string rendering of the element with
 * trailing padding removed; multi-valued elements keep the '\' separator.
 */
using DicomTagSet = std::map<std::string, std::string>;

/// Tag keys read for grouping and sorting
namespace tags {
    inline constexpr std::string_view ImageType = "0008|0008";
    inline constexpr std::string_view Modality = "0008|0060";
    inline constexpr std::string_view SeriesDescription = "0008|103e";
    inline constexpr std::string_view StudyInstanceUid = "0020|000d";
    inline constexpr std::string_view SeriesInstanceUid = "0020|000e";
    inline constexpr std::string_view SeriesNumber = "0020|0011";
    inline constexpr std::string_view InstanceNumber = "0020|0013";
    inline constexpr std::string_view ImagePositionPatient = "0020|0032";
    inline constexpr std::string_view ImageOrientationPatient = "0020|0037";
    inline constexpr std::string_view SliceLocation = "0020|1041";
    inline constexpr std::string_view SamplesPerPixel = "0028|0002";
    inline constexpr std::string_view Rows = "0028|0010";
    inline constexpr std::string_view Columns = "0028|0011";
    inline constexpr std::string_view PixelSpacing = "0028|0030";
    inline constexpr std::string_view BitsAllocated = "0028|0100";
    inline constexpr std::string_view PixelRepresentation = "0028|0103";
    inline constexpr std::string_view SliceThickness = "0018|0050";
}  // namespace tags

/// Tags needed to group and sort slices, without pixel data
std::vector<std::string> groupingTagFilter();

/// Pixel component types a decoded slice may carry
enum class PixelDatatype {
    UInt8,
    Int8,
    UInt16,
    Int16,
    UInt32,
    Int32,
    Float32,
    Float64,
    Character  ///< Text/character buffer, stored as int8 in a volume
};

/// Size in bytes of one component of the given datatype
constexpr std::size_t bytesPerComponent(PixelDatatype type) noexcept {
    switch (type) {
        case PixelDatatype::UInt8:
        case PixelDatatype::Int8:
        case PixelDatatype::Character:
            return 1;
        case PixelDatatype::UInt16:
        case PixelDatatype::Int16:
            return 2;
        case PixelDatatype::UInt32:
        case PixelDatatype::Int32:
        case PixelDatatype::Float32:
            return 4;
        case PixelDatatype::Float64:
            return 8;
    }
    return 1;
}

/// Display name of a datatype ("int16", "float32", ...)
std::string toString(PixelDatatype type);

/**
 * @brief One decoded 2D slice
 *
 * Pixel bytes are stored row-major as (row, column, sample), matching the
 * native interleaved layout of DICOM pixel data.
 */
struct SliceImage {
    int rows = 0;
    int columns = 0;
    int samplesPerPixel = 1;
    PixelDatatype datatype = PixelDatatype::UInt8;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::size_t expectedByteCount() const noexcept {
        return static_cast<std::size_t>(rows) * static_cast<std::size_t>(columns) *
               static_cast<std::size_t>(samplesPerPixel) * bytesPerComponent(datatype);
    }
};

}  // namespace dicom_stacker::core
