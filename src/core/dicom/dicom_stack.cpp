#include "core/dicom_stack.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

#include <kcenon/common/logging/log_macros.h>

namespace dicom_stacker::core {

namespace {

double projectOntoNormal(const std::array<double, 3>& position,
                         const std::array<double, 3>& normal)
{
    return position[0] * normal[0] +
           position[1] * normal[1] +
           position[2] * normal[2];
}

}  // anonymous namespace

void DicomStack::append(StackItem item)
{
    items_.push_back(std::move(item));
}

bool DicomStack::hasConsistentOrientation(double tolerance) const
{
    if (items_.size() < 2) {
        return true;
    }

    const auto& reference = items_.front().snapshot.orientation;
    for (const auto& item : items_) {
        const auto& orientation = item.snapshot.orientation;
        if (orientation.has_value() != reference.has_value()) {
            return false;
        }
        if (!orientation) {
            continue;
        }
        for (size_t i = 0; i < 6; ++i) {
            if (std::abs((*orientation)[i] - (*reference)[i]) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

double DicomStack::medianSpacing(const std::vector<double>& sortedPositions)
{
    if (sortedPositions.size() < 2) {
        return kUnknownSliceThickness;
    }

    std::vector<double> spacings;
    spacings.reserve(sortedPositions.size() - 1);
    for (size_t i = 1; i < sortedPositions.size(); ++i) {
        spacings.push_back(std::abs(sortedPositions[i] - sortedPositions[i - 1]));
    }

    std::sort(spacings.begin(), spacings.end());
    size_t mid = spacings.size() / 2;
    if (spacings.size() % 2 == 1) {
        return spacings[mid];
    }
    return (spacings[mid - 1] + spacings[mid]) / 2.0;
}

StackGeometry DicomStack::sortAndGetParameters(IReporting& reporting,
                                               double orientationTolerance)
{
    StackGeometry geometry;
    if (items_.empty()) {
        return geometry;
    }

    if (!hasConsistentOrientation(orientationTolerance)) {
        LOG_WARNING("Slices in one series have different orientations");
        reporting.showWarning(
            "sortAndGetParameters:InconsistentOrientation",
            "The images in this series do not all share the same orientation. "
            "The orientation of the first image has been used to order the slices.");
    }

    const auto orientation = items_.front().snapshot.orientation;
    bool allPositionsKnown = std::all_of(items_.begin(), items_.end(),
        [](const StackItem& item) { return item.snapshot.position.has_value(); });

    if (!orientation || !allPositionsKnown) {
        LOG_WARNING(std::format("Slice positions unavailable for {} slices; keeping file order",
                                items_.size()));
        reporting.showWarning(
            "sortAndGetParameters:PositionsUnavailable",
            "Some images do not have position and orientation information, so "
            "the slices have been ordered by filename and the slice thickness "
            "is unknown.");

        geometry.sortedPositions.resize(items_.size());
        std::iota(geometry.sortedPositions.begin(), geometry.sortedPositions.end(), 0.0);
        if (items_.front().snapshot.position) {
            geometry.globalOriginMm = *items_.front().snapshot.position;
        }
        return geometry;
    }

    auto normal = computeSliceNormal(*orientation);

    std::vector<double> projections;
    projections.reserve(items_.size());
    for (const auto& item : items_) {
        projections.push_back(projectOntoNormal(*item.snapshot.position, normal));
    }

    std::vector<size_t> order(items_.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
        [&projections](size_t a, size_t b) {
            return projections[a] < projections[b];
        });

    std::vector<StackItem> sorted;
    sorted.reserve(items_.size());
    geometry.sortedPositions.reserve(items_.size());
    for (size_t index : order) {
        sorted.push_back(std::move(items_[index]));
        geometry.sortedPositions.push_back(projections[index]);
    }
    items_ = std::move(sorted);

    geometry.positionsKnown = true;
    geometry.globalOriginMm = *items_.front().snapshot.position;

    if (items_.size() == 1) {
        reporting.showMessage(
            "sortAndGetParameters:SingleSlice",
            "Only one image was found, so the slice thickness is unknown.");
    } else {
        geometry.sliceThickness = medianSpacing(geometry.sortedPositions);
    }

    LOG_INFO(std::format("Sorted {} slices, slice thickness {:.4f} mm",
                         items_.size(), geometry.sliceThickness));
    return geometry;
}

}  // namespace dicom_stacker::core
