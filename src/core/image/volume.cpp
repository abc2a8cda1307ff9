#include "core/volume.hpp"

#include <format>

namespace dicom_stacker::core {

Volume::Volume(int rows, int columns, int slices, int samplesPerPixel, PixelDatatype datatype)
    : rows_(rows)
    , columns_(columns)
    , slices_(slices)
    , samplesPerPixel_(samplesPerPixel)
    , datatype_(datatype == PixelDatatype::Character ? PixelDatatype::Int8 : datatype)
{
    data_.assign(static_cast<size_t>(rows) * static_cast<size_t>(columns) *
                 static_cast<size_t>(slices) * static_cast<size_t>(samplesPerPixel) *
                 bytesPerComponent(datatype_), 0);
}

std::vector<size_t> Volume::shape() const
{
    if (empty()) {
        return {};
    }
    std::vector<size_t> result = {
        static_cast<size_t>(rows_),
        static_cast<size_t>(columns_),
        static_cast<size_t>(slices_)
    };
    if (samplesPerPixel_ > 1) {
        result.push_back(static_cast<size_t>(samplesPerPixel_));
    }
    return result;
}

size_t Volume::byteOffset(size_t row, size_t column, size_t slice, size_t sample) const
{
    size_t index = ((row * static_cast<size_t>(columns_) + column) * static_cast<size_t>(slices_) + slice)
                   * static_cast<size_t>(samplesPerPixel_) + sample;
    return index * bytesPerComponent(datatype_);
}

std::expected<void, DicomErrorInfo>
Volume::setSlice(size_t sliceIndex, const SliceImage& slice)
{
    if (sliceIndex >= static_cast<size_t>(slices_)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            std::format("Slice index {} is outside a volume of {} slices", sliceIndex, slices_)
        });
    }

    if (slice.rows != rows_ || slice.columns != columns_ ||
        slice.samplesPerPixel != samplesPerPixel_) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            std::format("Slice {} is {}x{}x{} but the volume expects {}x{}x{}",
                        sliceIndex, slice.rows, slice.columns, slice.samplesPerPixel,
                        rows_, columns_, samplesPerPixel_)
        });
    }

    bool compatible = slice.datatype == datatype_ ||
        (datatype_ == PixelDatatype::Int8 && slice.datatype == PixelDatatype::Character);
    if (!compatible) {
        return std::unexpected(DicomErrorInfo{
            DicomError::UnsupportedPixelFormat,
            std::format("Slice {} has datatype {} but the volume is {}",
                        sliceIndex, toString(slice.datatype), toString(datatype_))
        });
    }

    if (slice.pixels.size() != slice.expectedByteCount()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::DecodingFailed,
            std::format("Slice {} has {} bytes of pixel data, expected {}",
                        sliceIndex, slice.pixels.size(), slice.expectedByteCount())
        });
    }

    const size_t pixelBytes = static_cast<size_t>(samplesPerPixel_) * bytesPerComponent(datatype_);
    const auto* source = slice.pixels.data();
    for (size_t row = 0; row < static_cast<size_t>(rows_); ++row) {
        for (size_t column = 0; column < static_cast<size_t>(columns_); ++column) {
            std::memcpy(data_.data() + byteOffset(row, column, sliceIndex, 0), source, pixelBytes);
            source += pixelBytes;
        }
    }
    return {};
}

}  // namespace dicom_stacker::core
