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

#include "core/volume_assembler.hpp"

#include <cmath>
#include <format>

#include <kcenon/common/logging/log_macros.h>

namespace dicom_stacker::core {

VolumeAssembler::VolumeAssembler(ISliceDecoder& decoder)
    : decoder_(decoder)
{
}

std::expected<Volume, DicomErrorInfo>
VolumeAssembler::loadImagesFromStack(const DicomStack& stack, IReporting& reporting)
{
    reporting.showProgress("Reading pixel data");
    reporting.updateProgress(0);

    if (stack.empty()) {
        return Volume{};
    }

    const size_t numSlices = stack.size();

    auto firstSlice = decoder_.readPixels(stack[0].filePath);
    if (!firstSlice) {
        LOG_WARNING(std::format("Could not decode first slice {}: {}",
                                stack[0].filePath.string(), firstSlice.error().message));
        return Volume{};
    }

    const auto& snapshot = stack[0].snapshot;
    PixelDatatype datatype = firstSlice->datatype;
    if (datatype == PixelDatatype::Character) {
        reporting.showMessage("loadImagesFromStack:SettingDatatypeToInt8",
                              "Char datatype detected. Setting to int8");
        datatype = PixelDatatype::Int8;
    }

    // Rows/Columns tags missing from the metadata: use the decoded size
    const int rows = snapshot.rows > 0 ? snapshot.rows : firstSlice->rows;
    const int columns = snapshot.columns > 0 ? snapshot.columns : firstSlice->columns;

    // Palette color slices decode to RGB, so the decoded component count wins
    const int samplesPerPixel = firstSlice->samplesPerPixel;
    if (samplesPerPixel != snapshot.samplesPerPixel) {
        LOG_INFO(std::format("Decoded {} samples per pixel where tags declare {}",
                             samplesPerPixel, snapshot.samplesPerPixel));
    }

    Volume volume(rows, columns, static_cast<int>(numSlices), samplesPerPixel, datatype);
    LOG_INFO(std::format("Allocated {}x{}x{} volume ({} samples, {})",
                         rows, columns, numSlices, samplesPerPixel, toString(datatype)));

    if (auto written = volume.setSlice(0, *firstSlice); !written) {
        return std::unexpected(written.error());
    }

    for (size_t fileIndex = 1; fileIndex < numSlices; ++fileIndex) {
        auto nextSlice = decoder_.readPixels(stack[fileIndex].filePath);
        if (!nextSlice) {
            LOG_ERROR(std::format("Failed to decode slice {} ({}): {}", fileIndex,
                                  stack[fileIndex].filePath.string(),
                                  nextSlice.error().message));
            return std::unexpected(nextSlice.error());
        }
        if (auto written = volume.setSlice(fileIndex, *nextSlice); !written) {
            LOG_ERROR(std::format("Failed to store slice {}: {}", fileIndex,
                                  written.error().message));
            return std::unexpected(written.error());
        }
        reporting.updateProgress(static_cast<int>(
            std::round(100.0 * static_cast<double>(fileIndex) / static_cast<double>(numSlices))));
    }

    reporting.completeProgress();
    return volume;
}

}  // namespace dicom_stacker::core
