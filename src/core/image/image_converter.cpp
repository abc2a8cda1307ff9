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

#include "core/image_converter.hpp"

namespace dicom_stacker::core {

namespace {

template <typename T>
void copyAsFloat(const Volume& volume, float* buffer)
{
    for (int k = 0; k < volume.numberOfSlices(); ++k) {
        for (int r = 0; r < volume.rows(); ++r) {
            for (int c = 0; c < volume.columns(); ++c) {
                *buffer++ = static_cast<float>(volume.at<T>(r, c, k));
            }
        }
    }
}

}  // anonymous namespace

std::expected<void, DicomErrorInfo> ImageConverter::validate(const Volume& volume)
{
    if (volume.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::UnsupportedPixelFormat,
            "Cannot convert an empty volume"
        });
    }
    if (volume.samplesPerPixel() != 1) {
        return std::unexpected(DicomErrorInfo{
            DicomError::UnsupportedPixelFormat,
            std::format("Cannot convert a volume with {} samples per pixel to a scalar image",
                        volume.samplesPerPixel())
        });
    }
    return {};
}

void ImageConverter::applyGeometry(itk::ImageBase<3>* image, const LoadedVolume& loaded)
{
    const auto& snapshot = loaded.representativeSnapshot;

    itk::ImageBase<3>::SpacingType spacing;
    spacing[0] = snapshot.pixelSpacing[1];
    spacing[1] = snapshot.pixelSpacing[0];
    spacing[2] = loaded.sliceThickness > 0.0 ? loaded.sliceThickness : 1.0;
    image->SetSpacing(spacing);

    itk::ImageBase<3>::PointType origin;
    for (unsigned int i = 0; i < 3; ++i) {
        origin[i] = loaded.globalOriginMm[i];
    }
    image->SetOrigin(origin);

    itk::ImageBase<3>::DirectionType direction;
    direction.SetIdentity();
    if (snapshot.orientation) {
        const auto& ori = *snapshot.orientation;
        auto normal = computeSliceNormal(ori);
        for (unsigned int i = 0; i < 3; ++i) {
            direction[i][0] = ori[i];
            direction[i][1] = ori[i + 3];
            direction[i][2] = normal[i];
        }
    }
    image->SetDirection(direction);
}

std::expected<CTImageType::Pointer, DicomErrorInfo>
ImageConverter::toCTImage(const LoadedVolume& loaded)
{
    return toItkImage<short>(loaded);
}

std::expected<MRImageType::Pointer, DicomErrorInfo>
ImageConverter::toMRImage(const LoadedVolume& loaded)
{
    return toItkImage<unsigned short>(loaded);
}

std::expected<FloatImageType::Pointer, DicomErrorInfo>
ImageConverter::toFloatImage(const LoadedVolume& loaded)
{
    const auto& volume = loaded.volume;
    if (auto valid = validate(volume); !valid) {
        return std::unexpected(valid.error());
    }

    auto image = allocate<FloatImageType>(loaded);
    float* buffer = image->GetBufferPointer();

    switch (volume.datatype()) {
        case PixelDatatype::UInt8: copyAsFloat<std::uint8_t>(volume, buffer); break;
        case PixelDatatype::Int8:
        case PixelDatatype::Character: copyAsFloat<std::int8_t>(volume, buffer); break;
        case PixelDatatype::UInt16: copyAsFloat<std::uint16_t>(volume, buffer); break;
        case PixelDatatype::Int16: copyAsFloat<std::int16_t>(volume, buffer); break;
        case PixelDatatype::UInt32: copyAsFloat<std::uint32_t>(volume, buffer); break;
        case PixelDatatype::Int32: copyAsFloat<std::int32_t>(volume, buffer); break;
        case PixelDatatype::Float32: copyAsFloat<float>(volume, buffer); break;
        case PixelDatatype::Float64: copyAsFloat<double>(volume, buffer); break;
    }
    return image;
}

} // namespace dicom_stacker::core
