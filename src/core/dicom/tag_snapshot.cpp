#include "core/tag_snapshot.hpp"

#include <cmath>
#include <format>
#include <sstream>

namespace dicom_stacker::core {

namespace {

std::string getString(const DicomTagSet& tags, std::string_view key)
{
    auto it = tags.find(std::string(key));
    if (it == tags.end()) {
        return {};
    }
    std::string value = it->second;
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    while (!value.empty() && value.front() == ' ') {
        value.erase(value.begin());
    }
    return value;
}

int getInt(const DicomTagSet& tags, std::string_view key, int defaultValue)
{
    auto str = getString(tags, key);
    if (str.empty()) {
        return defaultValue;
    }
    try {
        return std::stoi(str);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

}  // anonymous namespace

std::vector<double> parseMultiValueDouble(const std::string& str)
{
    std::vector<double> values;
    if (str.empty()) return values;

    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, '\\')) {
        try {
            values.push_back(std::stod(token));
        } catch (const std::exception&) {
            // A malformed component invalidates the whole value
            return {};
        }
    }
    return values;
}

std::string orientationSignature(const std::optional<std::array<double, 6>>& orientation)
{
    if (!orientation) {
        return "none";
    }
    std::string signature;
    for (double v : *orientation) {
        // Avoid "-0.000" and "0.000" producing different keys
        double rounded = std::round(v * 1000.0) / 1000.0;
        if (rounded == 0.0) {
            rounded = 0.0;
        }
        if (!signature.empty()) {
            signature += '\\';
        }
        signature += std::format("{:.3f}", rounded);
    }
    return signature;
}

std::array<double, 3> computeSliceNormal(const std::array<double, 6>& orientation)
{
    return {
        orientation[1] * orientation[5] - orientation[2] * orientation[4],
        orientation[2] * orientation[3] - orientation[0] * orientation[5],
        orientation[0] * orientation[4] - orientation[1] * orientation[3]
    };
}

TagSnapshot TagSnapshot::fromTags(const DicomTagSet& tags)
{
    TagSnapshot snapshot;

    auto orientation = parseMultiValueDouble(getString(tags, tags::ImageOrientationPatient));
    if (orientation.size() == 6) {
        snapshot.orientation = std::array<double, 6>{
            orientation[0], orientation[1], orientation[2],
            orientation[3], orientation[4], orientation[5]};
    }

    auto position = parseMultiValueDouble(getString(tags, tags::ImagePositionPatient));
    if (position.size() == 3) {
        snapshot.position = std::array<double, 3>{position[0], position[1], position[2]};
    }

    auto spacing = parseMultiValueDouble(getString(tags, tags::PixelSpacing));
    if (spacing.size() == 2 && spacing[0] > 0.0 && spacing[1] > 0.0) {
        snapshot.pixelSpacing = {spacing[0], spacing[1]};
    }

    snapshot.rows = getInt(tags, tags::Rows, 0);
    snapshot.columns = getInt(tags, tags::Columns, 0);
    snapshot.samplesPerPixel = getInt(tags, tags::SamplesPerPixel, 1);
    snapshot.bitsAllocated = getInt(tags, tags::BitsAllocated, 0);

    auto& key = snapshot.seriesKey;
    key.studyInstanceUid = getString(tags, tags::StudyInstanceUid);
    key.seriesInstanceUid = getString(tags, tags::SeriesInstanceUid);
    key.modality = getString(tags, tags::Modality);
    key.imageType = getString(tags, tags::ImageType);
    key.rows = snapshot.rows;
    key.columns = snapshot.columns;
    key.samplesPerPixel = snapshot.samplesPerPixel;
    key.bitsAllocated = snapshot.bitsAllocated;
    key.orientationSignature = orientationSignature(snapshot.orientation);

    return snapshot;
}

}  // namespace dicom_stacker::core
