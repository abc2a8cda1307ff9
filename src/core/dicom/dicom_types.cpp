#include "core/dicom_types.hpp"

namespace dicom_stacker::core {

std::vector<std::string> groupingTagFilter()
{
    return {
        std::string(tags::ImageType),
        std::string(tags::Modality),
        std::string(tags::SeriesDescription),
        std::string(tags::StudyInstanceUid),
        std::string(tags::SeriesInstanceUid),
        std::string(tags::SeriesNumber),
        std::string(tags::InstanceNumber),
        std::string(tags::ImagePositionPatient),
        std::string(tags::ImageOrientationPatient),
        std::string(tags::SliceLocation),
        std::string(tags::SamplesPerPixel),
        std::string(tags::Rows),
        std::string(tags::Columns),
        std::string(tags::PixelSpacing),
        std::string(tags::BitsAllocated),
        std::string(tags::PixelRepresentation),
        std::string(tags::SliceThickness)
    };
}

std::string toString(PixelDatatype type)
{
    switch (type) {
        case PixelDatatype::UInt8: return "uint8";
        case PixelDatatype::Int8: return "int8";
        case PixelDatatype::UInt16: return "uint16";
        case PixelDatatype::Int16: return "int16";
        case PixelDatatype::UInt32: return "uint32";
        case PixelDatatype::Int32: return "int32";
        case PixelDatatype::Float32: return "float32";
        case PixelDatatype::Float64: return "float64";
        case PixelDatatype::Character: return "char";
    }
    return "unknown";
}

}  // namespace dicom_stacker::core
