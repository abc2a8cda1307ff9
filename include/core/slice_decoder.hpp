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
 * @file slice_decoder.hpp
 * @brief Single-file DICOM decoding interface and GDCM implementation
 * @details ISliceDecoder is the boundary between the volume assembly
 *          pipeline and the code that parses one DICOM file. The pipeline
 *          only ever asks for a tag set (optionally restricted to a filter)
 *          and for the decoded 2D pixel array. GdcmSliceDecoder implements
 *          the interface with gdcm::Reader for tags and itk::GDCMImageIO for
 *          pixel data, so every transfer syntax supported by the ITK/GDCM
 *          build is supported here.
 *
 * ## Thread Safety
 * - A decoder instance must not be shared between concurrent loads
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_types.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dicom_stacker::core {

/**
 * @brief Interface for decoding one DICOM file
 */
class ISliceDecoder {
public:
    virtual ~ISliceDecoder() = default;

    /**
     * @brief Read the tags of a DICOM file without its pixel data
     * @param filePath Path to the DICOM file
     * @param tagFilter Keys ("gggg|eeee") to read; empty reads all tags
     * @return Tag set on success, error info on parse failure
     */
    [[nodiscard]] virtual std::expected<DicomTagSet, DicomErrorInfo>
    readTags(const std::filesystem::path& filePath,
             const std::vector<std::string>& tagFilter) = 0;

    /**
     * @brief Decode the pixel data of a single-frame DICOM file
     * @param filePath Path to the DICOM file
     * @return Decoded slice on success, error info on failure
     */
    [[nodiscard]] virtual std::expected<SliceImage, DicomErrorInfo>
    readPixels(const std::filesystem::path& filePath) = 0;
};

/**
 * @brief ITK/GDCM backed slice decoder
 */
class GdcmSliceDecoder : public ISliceDecoder {
public:
    GdcmSliceDecoder();
    ~GdcmSliceDecoder() override;

    // Non-copyable, movable
    GdcmSliceDecoder(const GdcmSliceDecoder&) = delete;
    GdcmSliceDecoder& operator=(const GdcmSliceDecoder&) = delete;
    GdcmSliceDecoder(GdcmSliceDecoder&&) noexcept;
    GdcmSliceDecoder& operator=(GdcmSliceDecoder&&) noexcept;

    [[nodiscard]] std::expected<DicomTagSet, DicomErrorInfo>
    readTags(const std::filesystem::path& filePath,
             const std::vector<std::string>& tagFilter) override;

    [[nodiscard]] std::expected<SliceImage, DicomErrorInfo>
    readPixels(const std::filesystem::path& filePath) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_stacker::core
