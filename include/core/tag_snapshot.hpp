/**
 * @file tag_snapshot.hpp
 * @brief Minimal per-slice metadata used for grouping and sorting
 * @details TagSnapshot is extracted once from a slice's tag set and carries
 *          only what the grouper and the stack geometry need: orientation,
 *          position, image dimensions and the SeriesKey that decides which
 *          slices belong together.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_types.hpp"

#include <array>
#include <compare>
#include <optional>
#include <string>
#include <vector>

namespace dicom_stacker::core {

/**
 * @brief Equality key identifying a coherent series
 *
 * Two slices with equal keys share study/series identity, image geometry and
 * orientation, and can be stacked along one axis.
 */
struct SeriesKey {
    std::string studyInstanceUid;
    std::string seriesInstanceUid;
    std::string modality;
    std::string imageType;
    int rows = 0;
    int columns = 0;
    int samplesPerPixel = 1;
    int bitsAllocated = 0;
    /// Direction cosines rounded to 1e-3, or "none" when absent
    std::string orientationSignature;

    auto operator<=>(const SeriesKey&) const = default;
    bool operator==(const SeriesKey&) const = default;
};

/// Per-slice metadata record for grouping and sorting decisions
struct TagSnapshot {
    std::optional<std::array<double, 6>> orientation;
    std::optional<std::array<double, 3>> position;
    SeriesKey seriesKey;
    int rows = 0;
    int columns = 0;
    int samplesPerPixel = 1;
    int bitsAllocated = 0;
    /// Row spacing, column spacing in mm
    std::array<double, 2> pixelSpacing = {1.0, 1.0};

    /**
     * @brief Build a snapshot from a tag set
     *
     * Missing or malformed position/orientation values leave the
     * corresponding optional empty; missing integers fall back to their
     * defaults (samples per pixel to 1).
     */
    [[nodiscard]] static TagSnapshot fromTags(const DicomTagSet& tags);
};

/// Parse a backslash-separated DICOM decimal string
std::vector<double> parseMultiValueDouble(const std::string& str);

/// Signature of six direction cosines used inside SeriesKey
std::string orientationSignature(const std::optional<std::array<double, 6>>& orientation);

/// Slice normal: cross product of row and column direction cosines
std::array<double, 3> computeSliceNormal(const std::array<double, 6>& orientation);

}  // namespace dicom_stacker::core
