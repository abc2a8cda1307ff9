// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file dicom_stack.hpp
 * @brief One coherent group of slices and its geometric reconstruction
 * @details A DicomStack holds the slices of one series, in the order they
 *          were added, and sorts them along the slice normal. Sorting also
 *          derives the slice thickness (median spacing between consecutive
 *          slices) and the patient-space origin of the first slice.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_types.hpp"
#include "core/reporting.hpp"
#include "core/tag_snapshot.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace dicom_stacker::core {

/// Slice thickness reported when it cannot be derived from positions
inline constexpr double kUnknownSliceThickness = 0.0;

/// One slice of a stack
struct StackItem {
    std::filesystem::path filePath;
    TagSnapshot snapshot;
    DicomTagSet tags;
};

/// Geometry derived by DicomStack::sortAndGetParameters()
struct StackGeometry {
    /// Median distance between consecutive slices in mm, or kUnknownSliceThickness
    double sliceThickness = kUnknownSliceThickness;
    std::array<double, 3> globalOriginMm = {0.0, 0.0, 0.0};
    /// Position of each slice along the slice normal, or 0..N-1 when unknown
    std::vector<double> sortedPositions;
    bool positionsKnown = false;
};

/**
 * @brief Ordered collection of slices belonging to one series
 *
 * @trace SRS-FR-002
 */
class DicomStack {
public:
    DicomStack() = default;

    void append(StackItem item);

    [[nodiscard]] size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] const StackItem& operator[](size_t index) const { return items_[index]; }
    [[nodiscard]] const std::vector<StackItem>& items() const noexcept { return items_; }

    /**
     * @brief Sort the slices along the slice normal and derive geometry
     *
     * When every slice has a position and the series has an orientation, the
     * slices are stably sorted by their projection onto the normal of the
     * first slice's orientation. Otherwise the current order is kept, a
     * warning is reported and the slice thickness is reported as unknown.
     *
     * @param reporting Sink for warnings about missing or inconsistent metadata
     * @param orientationTolerance Tolerance for the orientation consistency check
     * @return Slice thickness, origin and per-slice positions in final order
     */
    StackGeometry sortAndGetParameters(IReporting& reporting,
                                       double orientationTolerance = 1e-4);

    /**
     * @brief Check that every slice shares the first slice's orientation
     * @param tolerance Maximum absolute difference per direction cosine
     * @return true if consistent; slices without orientation are inconsistent
     *         unless no slice has one
     */
    [[nodiscard]] bool hasConsistentOrientation(double tolerance = 1e-4) const;

    /**
     * @brief Median of consecutive differences of sorted positions
     * @return kUnknownSliceThickness for fewer than two positions
     */
    [[nodiscard]] static double medianSpacing(const std::vector<double>& sortedPositions);

private:
    std::vector<StackItem> items_;
};

}  // namespace dicom_stacker::core
