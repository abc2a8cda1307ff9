#pragma once

#include "core/dicom_stack.hpp"
#include "core/reporting.hpp"
#include "core/slice_decoder.hpp"
#include "core/volume.hpp"

#include <expected>

namespace dicom_stacker::core {

/**
 * @brief Streams the pixel data of a sorted stack into one Volume
 *
 * @trace SRS-FR-002, SRS-FR-003
 */
class VolumeAssembler {
public:
    explicit VolumeAssembler(ISliceDecoder& decoder);

    /**
     * @brief Decode every slice of the stack into a new volume
     *
     * The shape comes from the first slice's metadata and the stack length,
     * the datatype from the first decoded slice (a character datatype is
     * stored as int8). If the first slice cannot be decoded an empty Volume
     * is returned. A failure on any later slice is returned as an error,
     * since a partially filled volume must not be used.
     *
     * @param stack Sorted stack
     * @param reporting Sink for progress and datatype notices
     * @return Complete or empty volume, or the error of a later slice
     */
    [[nodiscard]] std::expected<Volume, DicomErrorInfo>
    loadImagesFromStack(const DicomStack& stack, IReporting& reporting);

private:
    ISliceDecoder& decoder_;
};

}  // namespace dicom_stacker::core
