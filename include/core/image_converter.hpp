#pragma once

#include "core/dicom_types.hpp"
#include "core/volume.hpp"
#include "core/volume_loader.hpp"

#include <expected>
#include <format>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace dicom_stacker::core {

/// Image types
using CTImageType = itk::Image<short, 3>;
using MRImageType = itk::Image<unsigned short, 3>;
using FloatImageType = itk::Image<float, 3>;

/**
 * @brief Conversion of assembled volumes to ITK images
 *
 * ITK index (x, y, z) maps to volume index (column, row, slice). Spacing is
 * taken from PixelSpacing and the slice thickness (1 mm when unknown), the
 * origin from the global origin and the direction from the orientation of
 * the representative slice.
 */
class ImageConverter {
public:
    /**
     * @brief Copy a single-channel volume into an ITK image of the same type
     * @return UnsupportedPixelFormat if the volume is empty, multi-channel or
     *         of a different datatype
     */
    template <typename TPixel>
    static std::expected<typename itk::Image<TPixel, 3>::Pointer, DicomErrorInfo>
    toItkImage(const LoadedVolume& loaded)
    {
        using ImageType = itk::Image<TPixel, 3>;
        const auto& volume = loaded.volume;

        if (auto valid = validate(volume); !valid) {
            return std::unexpected(valid.error());
        }
        if (volume.datatype() != pixelDatatypeOf<TPixel>()) {
            return std::unexpected(DicomErrorInfo{
                DicomError::UnsupportedPixelFormat,
                std::format("Volume datatype {} does not match requested {}",
                            toString(volume.datatype()), toString(pixelDatatypeOf<TPixel>()))
            });
        }

        auto image = allocate<ImageType>(loaded);
        TPixel* buffer = image->GetBufferPointer();
        for (int k = 0; k < volume.numberOfSlices(); ++k) {
            for (int r = 0; r < volume.rows(); ++r) {
                for (int c = 0; c < volume.columns(); ++c) {
                    *buffer++ = volume.at<TPixel>(r, c, k);
                }
            }
        }
        return image;
    }

    static std::expected<CTImageType::Pointer, DicomErrorInfo>
    toCTImage(const LoadedVolume& loaded);

    static std::expected<MRImageType::Pointer, DicomErrorInfo>
    toMRImage(const LoadedVolume& loaded);

    /// Single-channel volume of any datatype, converted to float
    static std::expected<FloatImageType::Pointer, DicomErrorInfo>
    toFloatImage(const LoadedVolume& loaded);

private:
    static std::expected<void, DicomErrorInfo> validate(const Volume& volume);

    static void applyGeometry(itk::ImageBase<3>* image, const LoadedVolume& loaded);

    template <typename ImageType>
    static typename ImageType::Pointer allocate(const LoadedVolume& loaded)
    {
        const auto& volume = loaded.volume;
        auto image = ImageType::New();

        typename ImageType::SizeType size;
        size[0] = static_cast<itk::SizeValueType>(volume.columns());
        size[1] = static_cast<itk::SizeValueType>(volume.rows());
        size[2] = static_cast<itk::SizeValueType>(volume.numberOfSlices());

        typename ImageType::IndexType start;
        start.Fill(0);

        typename ImageType::RegionType region;
        region.SetSize(size);
        region.SetIndex(start);

        image->SetRegions(region);
        applyGeometry(image.GetPointer(), loaded);
        image->Allocate();
        return image;
    }
};

} // namespace dicom_stacker::core
