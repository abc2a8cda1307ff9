/**
 * @file dicom_file_utils.hpp
 * @brief Cheap DICOM file detection and filename ordering helpers
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dicom_stacker::core {

/// Name of the DICOM directory index file, never an image
inline constexpr const char* kDicomDirFileName = "DICOMDIR";

/**
 * @brief A file to load, optionally with its own directory
 *
 * When filePath is empty the file is resolved against the directory passed
 * to the loader.
 */
struct DicomFileEntry {
    std::string fileName;
    std::optional<std::filesystem::path> filePath;

    DicomFileEntry() = default;
    DicomFileEntry(std::string name) : fileName(std::move(name)) {}
    DicomFileEntry(const char* name) : fileName(name) {}
    DicomFileEntry(std::string name, std::filesystem::path path)
        : fileName(std::move(name)), filePath(std::move(path)) {}

    /// Full path given the loader's default directory
    [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& defaultDirectory) const;
};

/**
 * @brief Test for the "DICM" signature at byte offset 128
 *
 * Very fast, but a file passing this check may still fail to parse.
 * Missing, unreadable and short files return false.
 */
[[nodiscard]] bool isDicomFile(const std::filesystem::path& filePath);

/// isDicomFile() that also rejects the DICOMDIR index file
[[nodiscard]] bool isDicomImageFile(const std::filesystem::path& directory,
                                    const std::string& fileName);

/**
 * @brief Compare two filenames in natural order
 *
 * Digit runs compare by numeric value ("img2" < "img10"), other characters
 * compare case-sensitively. Equal natural keys fall back to plain string order.
 */
[[nodiscard]] bool naturalLess(const std::string& a, const std::string& b);

/// Stable sort of entries by naturalLess on their file names
[[nodiscard]] std::vector<DicomFileEntry>
sortFilenamesNumerically(std::vector<DicomFileEntry> entries);

/// Regular files directly inside a directory, in natural order
[[nodiscard]] std::vector<DicomFileEntry>
listDirectory(const std::filesystem::path& directory);

}  // namespace dicom_stacker::core
