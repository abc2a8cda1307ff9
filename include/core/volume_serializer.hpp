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
 * @file volume_serializer.hpp
 * @brief JSON summary of a loaded volume
 * @details Writes the geometry and identity of a loaded volume (shape,
 *          datatype, slice thickness, origin, per-slice positions and
 *          series identifiers) as JSON, for pipelines that consume the
 *          volume's description alongside the raw data.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_types.hpp"
#include "core/volume_loader.hpp"

#include <expected>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace dicom_stacker::core {

class VolumeSerializer {
public:
    /**
     * @brief Build the JSON summary
     *
     * An unknown slice thickness is written as null.
     */
    [[nodiscard]] static nlohmann::json toJson(const LoadedVolume& loaded);

    /**
     * @brief Write the JSON summary to a file
     * @return FileNotFound if the file cannot be opened for writing
     */
    [[nodiscard]] static std::expected<void, DicomErrorInfo>
    saveToFile(const LoadedVolume& loaded, const std::filesystem::path& filePath);
};

}  // namespace dicom_stacker::core
