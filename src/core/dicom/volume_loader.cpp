#include "core/volume_loader.hpp"

#include <cmath>
#include <format>

#include <kcenon/common/logging/log_macros.h>

#include "core/volume_assembler.hpp"

namespace dicom_stacker::core {

class VolumeLoader::Impl {
public:
    std::shared_ptr<ISliceDecoder> decoder;
    std::shared_ptr<IReporting> reporting;
    LoaderConfig config;

    Impl(std::shared_ptr<ISliceDecoder> d, std::shared_ptr<IReporting> r, LoaderConfig c)
        : decoder(std::move(d))
        , reporting(std::move(r))
        , config(std::move(c))
    {
        if (!decoder) {
            decoder = std::make_shared<GdcmSliceDecoder>();
        }
        if (!reporting) {
            reporting = std::make_shared<LoggingReporting>();
        }
    }
};

VolumeLoader::VolumeLoader()
    : impl_(std::make_unique<Impl>(nullptr, nullptr, LoaderConfig{}))
{
}

VolumeLoader::VolumeLoader(std::shared_ptr<ISliceDecoder> decoder,
                           std::shared_ptr<IReporting> reporting,
                           LoaderConfig config)
    : impl_(std::make_unique<Impl>(std::move(decoder), std::move(reporting), std::move(config)))
{
}

VolumeLoader::~VolumeLoader() = default;

VolumeLoader::VolumeLoader(VolumeLoader&&) noexcept = default;
VolumeLoader& VolumeLoader::operator=(VolumeLoader&&) noexcept = default;

const LoaderConfig& VolumeLoader::config() const
{
    return impl_->config;
}

DicomGrouper VolumeLoader::loadMetadataFromDicomFiles(
    const std::filesystem::path& imagePath,
    const std::vector<DicomFileEntry>& filenames)
{
    auto& reporting = *impl_->reporting;
    reporting.showProgress("Reading image metadata");
    reporting.updateProgress(0);

    // Numerical filename order is only used when slice positions are missing
    auto sortedFilenames = sortFilenamesNumerically(filenames);
    const size_t numFiles = sortedFilenames.size();

    DicomGrouper grouper;

    size_t fileIndex = 0;
    for (const auto& entry : sortedFilenames) {
        const auto directory = entry.filePath ? *entry.filePath : imagePath;
        const auto combinedFileName = entry.resolve(imagePath);

        if (isDicomImageFile(directory, entry.fileName)) {
            auto tags = impl_->decoder->readTags(combinedFileName, impl_->config.tagFilter);
            if (tags) {
                grouper.addItem(combinedFileName, std::move(*tags));
            } else {
                LOG_WARNING(std::format("Failed to read tags from {}: {}",
                                        combinedFileName.string(), tags.error().message));
                reporting.showWarning(
                    "loadMetadataFromDicomFiles:MetadataReadFailed",
                    std::format("loadMetadataFromDicomFiles: The metadata of file {} could "
                                "not be read and it will be removed from this series: {}",
                                combinedFileName.string(), tags.error().message));
            }
        } else {
            reporting.showWarning(
                "loadMetadataFromDicomFiles:NotADicomFile",
                std::format("loadMetadataFromDicomFiles: The file {} is not a DICOM file "
                            "and will be removed from this series.",
                            combinedFileName.string()));
        }

        reporting.updateProgress(static_cast<int>(
            std::round(100.0 * static_cast<double>(fileIndex) / static_cast<double>(numFiles))));
        ++fileIndex;
    }

    reporting.completeProgress();
    LOG_INFO(std::format("Grouped {} files into {} series", numFiles, grouper.numberOfGroups()));
    return grouper;
}

std::expected<LoadedVolume, DicomErrorInfo> VolumeLoader::loadMainImageFromDicomFiles(
    const std::filesystem::path& imagePath,
    const std::vector<DicomFileEntry>& filenames)
{
    auto& reporting = *impl_->reporting;

    auto grouper = loadMetadataFromDicomFiles(imagePath, filenames);

    // Only the largest group is loaded into the volume
    if (grouper.numberOfGroups() > 1) {
        reporting.showWarning(
            "loadMainImageFromDicomFiles:MultipleGroupings",
            "I have removed some images from this dataset because the images did "
            "not form a coherent set. This may be due to the presence of scout "
            "images or dose reports, or localizer images in multiple orientations. "
            "I have formed a volume from the largest coherent set of images in the "
            "same orientation.");
    }

    auto mainGroup = grouper.largestStack();
    if (!mainGroup) {
        LOG_ERROR(std::format("No usable DICOM images in {}", imagePath.string()));
        return std::unexpected(mainGroup.error());
    }

    auto geometry = mainGroup->sortAndGetParameters(reporting, impl_->config.orientationTolerance);

    LoadedVolume result;
    result.representativeMetadata = (*mainGroup)[0].tags;
    result.representativeSnapshot = (*mainGroup)[0].snapshot;
    result.sliceThickness = geometry.sliceThickness;
    result.globalOriginMm = geometry.globalOriginMm;
    result.sortedPositions = std::move(geometry.sortedPositions);
    result.numberOfGroups = grouper.numberOfGroups();

    VolumeAssembler assembler(*impl_->decoder);
    auto volume = assembler.loadImagesFromStack(*mainGroup, reporting);
    if (!volume) {
        LOG_ERROR(std::format("Failed to assemble volume: {}", volume.error().message));
        return std::unexpected(volume.error());
    }
    result.volume = std::move(*volume);

    return result;
}

std::expected<LoadedVolume, DicomErrorInfo> VolumeLoader::loadMainImageFromDicomFiles(
    const std::filesystem::path& imagePath,
    const std::string& filename)
{
    return loadMainImageFromDicomFiles(imagePath, std::vector<DicomFileEntry>{DicomFileEntry(filename)});
}

}  // namespace dicom_stacker::core
