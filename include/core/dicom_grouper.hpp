#pragma once

#include "core/dicom_stack.hpp"
#include "core/dicom_types.hpp"
#include "core/tag_snapshot.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <vector>

namespace dicom_stacker::core {

/**
 * @brief Groups slices into coherent series in a single forward pass
 *
 * Each added slice joins the group whose SeriesKey equals its own, or starts
 * a new group. Groups are never merged and stay in creation order.
 *
 * @trace SRS-FR-002
 */
class DicomGrouper {
public:
    DicomGrouper() = default;

    /**
     * @brief Add a slice to the group matching its series key
     * @param filePath Full path of the slice file
     * @param tags Grouping tags read from the file
     */
    void addItem(const std::filesystem::path& filePath, DicomTagSet tags);

    [[nodiscard]] size_t numberOfGroups() const noexcept { return groups_.size(); }

    /// All groups in creation order
    [[nodiscard]] const std::vector<DicomStack>& groups() const noexcept { return groups_; }

    /**
     * @brief Copy of the group with the most slices
     *
     * Ties go to the group created first.
     *
     * @return Stack on success, SeriesAssemblyFailed if no slice was added
     */
    [[nodiscard]] std::expected<DicomStack, DicomErrorInfo> largestStack() const;

private:
    std::vector<DicomStack> groups_;
    std::map<SeriesKey, size_t> groupIndex_;
};

}  // namespace dicom_stacker::core
