#include "core/dicom_grouper.hpp"

#include <format>

#include <kcenon/common/logging/log_macros.h>

namespace dicom_stacker::core {

void DicomGrouper::addItem(const std::filesystem::path& filePath, DicomTagSet tags)
{
    StackItem item;
    item.filePath = filePath;
    item.snapshot = TagSnapshot::fromTags(tags);
    item.tags = std::move(tags);

    auto [it, inserted] = groupIndex_.try_emplace(item.snapshot.seriesKey, groups_.size());
    if (inserted) {
        LOG_DEBUG(std::format("New group {} for series {} ({}x{}, orientation {})",
                              groups_.size(), item.snapshot.seriesKey.seriesInstanceUid,
                              item.snapshot.rows, item.snapshot.columns,
                              item.snapshot.seriesKey.orientationSignature));
        groups_.emplace_back();
    }
    groups_[it->second].append(std::move(item));
}

std::expected<DicomStack, DicomErrorInfo> DicomGrouper::largestStack() const
{
    if (groups_.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            "No DICOM images were found"
        });
    }

    size_t largest = 0;
    for (size_t i = 1; i < groups_.size(); ++i) {
        if (groups_[i].size() > groups_[largest].size()) {
            largest = i;
        }
    }

    LOG_DEBUG(std::format("Largest of {} groups is group {} with {} slices",
                          groups_.size(), largest, groups_[largest].size()));
    return groups_[largest];
}

}  // namespace dicom_stacker::core
