#include "core/slice_decoder.hpp"

#include <exception>
#include <format>
#include <set>

#include <gdcmDataSet.h>
#include <gdcmReader.h>
#include <gdcmStringFilter.h>
#include <gdcmTag.h>

#include <itkGDCMImageIO.h>

#include <kcenon/common/logging/log_macros.h>

namespace dicom_stacker::core {

namespace {

const gdcm::Tag kPixelData{0x7fe0, 0x0010};

std::string trimValue(std::string value)
{
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    return value;
}

std::expected<PixelDatatype, DicomErrorInfo>
toPixelDatatype(itk::IOComponentEnum componentType)
{
    switch (componentType) {
        case itk::IOComponentEnum::UCHAR: return PixelDatatype::UInt8;
        case itk::IOComponentEnum::CHAR: return PixelDatatype::Int8;
        case itk::IOComponentEnum::USHORT: return PixelDatatype::UInt16;
        case itk::IOComponentEnum::SHORT: return PixelDatatype::Int16;
        case itk::IOComponentEnum::UINT: return PixelDatatype::UInt32;
        case itk::IOComponentEnum::INT: return PixelDatatype::Int32;
        case itk::IOComponentEnum::FLOAT: return PixelDatatype::Float32;
        case itk::IOComponentEnum::DOUBLE: return PixelDatatype::Float64;
        default:
            break;
    }
    return std::unexpected(DicomErrorInfo{
        DicomError::UnsupportedPixelFormat,
        "Unsupported pixel component type: " +
            itk::ImageIOBase::GetComponentTypeAsString(componentType)
    });
}

}  // anonymous namespace

class GdcmSliceDecoder::Impl {
public:
    static std::set<gdcm::Tag> toGdcmTags(const std::vector<std::string>& keys)
    {
        std::set<gdcm::Tag> result;
        for (const auto& key : keys) {
            gdcm::Tag tag;
            if (tag.ReadFromPipeSeparatedString(key.c_str())) {
                result.insert(tag);
            } else {
                LOG_WARNING(std::format("Ignoring malformed tag key in filter: {}", key));
            }
        }
        return result;
    }
};

GdcmSliceDecoder::GdcmSliceDecoder() : impl_(std::make_unique<Impl>()) {}

GdcmSliceDecoder::~GdcmSliceDecoder() = default;

GdcmSliceDecoder::GdcmSliceDecoder(GdcmSliceDecoder&&) noexcept = default;
GdcmSliceDecoder& GdcmSliceDecoder::operator=(GdcmSliceDecoder&&) noexcept = default;

std::expected<DicomTagSet, DicomErrorInfo>
GdcmSliceDecoder::readTags(const std::filesystem::path& filePath,
                           const std::vector<std::string>& tagFilter)
{
    if (!std::filesystem::exists(filePath)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            "File not found: " + filePath.string()
        });
    }

    DicomTagSet tagSet;
    try {
        gdcm::Reader reader;
        reader.SetFileName(filePath.string().c_str());

        bool ok = false;
        if (tagFilter.empty()) {
            ok = reader.ReadUpToTag(kPixelData);
        } else {
            ok = reader.ReadSelectedTags(Impl::toGdcmTags(tagFilter));
        }
        if (!ok) {
            return std::unexpected(DicomErrorInfo{
                DicomError::InvalidDicomFormat,
                "Failed to read DICOM tags: " + filePath.string()
            });
        }

        gdcm::StringFilter stringFilter;
        stringFilter.SetFile(reader.GetFile());

        const auto& ds = reader.GetFile().GetDataSet();
        for (auto it = ds.Begin(); it != ds.End(); ++it) {
            const auto& de = *it;
            const auto& tag = de.GetTag();
            if (tag == kPixelData || de.GetVR() == gdcm::VR::SQ) {
                continue;
            }
            tagSet[tag.PrintAsPipeSeparatedString()] = trimValue(stringFilter.ToString(tag));
        }

        if (tagSet.empty()) {
            return std::unexpected(DicomErrorInfo{
                DicomError::InvalidDicomFormat,
                "No DICOM tags found in " + filePath.string()
            });
        }
    } catch (const std::exception& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            std::format("Failed to read DICOM tags from {}: {}", filePath.string(), e.what())
        });
    }

    LOG_DEBUG(std::format("Read {} tags from {}", tagSet.size(), filePath.string()));
    return tagSet;
}

std::expected<SliceImage, DicomErrorInfo>
GdcmSliceDecoder::readPixels(const std::filesystem::path& filePath)
{
    if (!std::filesystem::exists(filePath)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            "File not found: " + filePath.string()
        });
    }

    try {
        auto gdcmIO = itk::GDCMImageIO::New();
        gdcmIO->SetFileName(filePath.string());
        gdcmIO->ReadImageInformation();

        if (gdcmIO->GetNumberOfDimensions() > 2 && gdcmIO->GetDimensions(2) > 1) {
            return std::unexpected(DicomErrorInfo{
                DicomError::UnsupportedPixelFormat,
                std::format("Multi-frame file ({} frames) cannot be used as a slice: {}",
                            gdcmIO->GetDimensions(2), filePath.string())
            });
        }

        auto datatype = toPixelDatatype(gdcmIO->GetComponentType());
        if (!datatype) {
            return std::unexpected(datatype.error());
        }

        SliceImage slice;
        slice.columns = static_cast<int>(gdcmIO->GetDimensions(0));
        slice.rows = static_cast<int>(gdcmIO->GetDimensions(1));
        slice.samplesPerPixel = static_cast<int>(gdcmIO->GetNumberOfComponents());
        slice.datatype = *datatype;
        slice.pixels.resize(static_cast<size_t>(gdcmIO->GetImageSizeInBytes()));

        if (slice.pixels.size() != slice.expectedByteCount()) {
            return std::unexpected(DicomErrorInfo{
                DicomError::DecodingFailed,
                std::format("Pixel buffer size {} does not match {}x{}x{} {}: {}",
                            slice.pixels.size(), slice.rows, slice.columns,
                            slice.samplesPerPixel, toString(slice.datatype),
                            filePath.string())
            });
        }

        gdcmIO->Read(slice.pixels.data());
        return slice;

    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::DecodingFailed,
            std::string("Failed to decode DICOM pixel data: ") + e.GetDescription()
        });
    } catch (const std::exception& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::DecodingFailed,
            std::format("Failed to decode DICOM pixel data from {}: {}",
                        filePath.string(), e.what())
        });
    }
}

}  // namespace dicom_stacker::core
