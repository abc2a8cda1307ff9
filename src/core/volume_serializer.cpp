#include "core/volume_serializer.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace dicom_stacker::core {

using json = nlohmann::json;

namespace {

std::string tagValue(const DicomTagSet& tags, std::string_view key) {
    auto it = tags.find(std::string(key));
    return it == tags.end() ? std::string{} : it->second;
}

}  // anonymous namespace

json VolumeSerializer::toJson(const LoadedVolume& loaded) {
    const auto& volume = loaded.volume;
    const auto& meta = loaded.representativeMetadata;

    json j;
    j["empty"] = volume.empty();
    j["shape"] = volume.shape();
    j["datatype"] = volume.empty() ? json(nullptr) : json(toString(volume.datatype()));
    j["sliceThickness"] = loaded.sliceThickness > 0.0
        ? json(loaded.sliceThickness) : json(nullptr);
    j["globalOriginMm"] = json::array({
        loaded.globalOriginMm[0], loaded.globalOriginMm[1], loaded.globalOriginMm[2]});
    j["sortedPositions"] = loaded.sortedPositions;
    j["numberOfGroups"] = loaded.numberOfGroups;
    j["series"] = {
        {"studyInstanceUid", tagValue(meta, tags::StudyInstanceUid)},
        {"seriesInstanceUid", tagValue(meta, tags::SeriesInstanceUid)},
        {"seriesDescription", tagValue(meta, tags::SeriesDescription)},
        {"modality", tagValue(meta, tags::Modality)}
    };
    return j;
}

std::expected<void, DicomErrorInfo>
VolumeSerializer::saveToFile(const LoadedVolume& loaded, const std::filesystem::path& filePath) {
    std::ofstream ofs(filePath);
    if (!ofs) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            "Cannot open file for writing: " + filePath.string()
        });
    }
    ofs << toJson(loaded).dump(2) << '\n';
    return {};
}

}  // namespace dicom_stacker::core
