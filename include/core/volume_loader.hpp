#pragma once

#include "core/dicom_file_utils.hpp"
#include "core/dicom_grouper.hpp"
#include "core/dicom_stack.hpp"
#include "core/reporting.hpp"
#include "core/slice_decoder.hpp"
#include "core/volume.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dicom_stacker::core {

/// Loader settings
struct LoaderConfig {
    /// Tolerance per direction cosine when checking series orientation
    double orientationTolerance = 1e-4;
    /// Tags read during the metadata pass
    std::vector<std::string> tagFilter = groupingTagFilter();
};

/// Result of loading the main volume of a directory
struct LoadedVolume {
    Volume volume;
    /// Tags of the first slice in sorted order
    DicomTagSet representativeMetadata;
    /// Snapshot of the first slice in sorted order
    TagSnapshot representativeSnapshot;
    double sliceThickness = kUnknownSliceThickness;
    std::array<double, 3> globalOriginMm = {0.0, 0.0, 0.0};
    std::vector<double> sortedPositions;
    /// Number of coherent groups found; only the largest is loaded
    size_t numberOfGroups = 0;
};

/**
 * @brief Loads the main image volume from a set of DICOM files
 *
 * Runs the metadata pass (signature check, tag reading, grouping), selects the
 * largest coherent group, sorts it along the slice normal and decodes its
 * pixel data. Each stage runs once per call.
 *
 * @trace SRS-FR-001, SRS-FR-002
 */
class VolumeLoader {
public:
    /// Loader using GdcmSliceDecoder and LoggingReporting
    VolumeLoader();

    VolumeLoader(std::shared_ptr<ISliceDecoder> decoder,
                 std::shared_ptr<IReporting> reporting,
                 LoaderConfig config = {});

    ~VolumeLoader();

    // Non-copyable, movable
    VolumeLoader(const VolumeLoader&) = delete;
    VolumeLoader& operator=(const VolumeLoader&) = delete;
    VolumeLoader(VolumeLoader&&) noexcept;
    VolumeLoader& operator=(VolumeLoader&&) noexcept;

    /**
     * @brief Read grouping metadata and group files into coherent series
     *
     * Files are processed in natural filename order. Files that are not DICOM
     * images (DICOMDIR, missing signature) or whose tags cannot be read are
     * skipped with a warning.
     *
     * @param imagePath Directory for entries without their own path
     * @param filenames Files to consider
     * @return Grouper holding every accepted slice
     */
    [[nodiscard]] DicomGrouper loadMetadataFromDicomFiles(
        const std::filesystem::path& imagePath,
        const std::vector<DicomFileEntry>& filenames);

    /**
     * @brief Load the largest coherent series as one volume
     *
     * Warns when more than one group was found. The returned volume is empty
     * when the first slice cannot be decoded.
     *
     * @param imagePath Directory for entries without their own path
     * @param filenames Files to consider
     * @return Volume and geometry, or an error if no slice was usable or a
     *         slice after the first failed to decode
     */
    [[nodiscard]] std::expected<LoadedVolume, DicomErrorInfo> loadMainImageFromDicomFiles(
        const std::filesystem::path& imagePath,
        const std::vector<DicomFileEntry>& filenames);

    /// Single-file overload
    [[nodiscard]] std::expected<LoadedVolume, DicomErrorInfo> loadMainImageFromDicomFiles(
        const std::filesystem::path& imagePath,
        const std::string& filename);

    [[nodiscard]] const LoaderConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_stacker::core
