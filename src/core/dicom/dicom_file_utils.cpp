#include "core/dicom_file_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string_view>
#include <system_error>

namespace dicom_stacker::core {

namespace {

constexpr std::streamoff kPreambleLength = 128;
constexpr std::array<char, 4> kDicomSignature = {'D', 'I', 'C', 'M'};

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Compare two digit runs by value without converting (runs may overflow)
int compareDigitRuns(std::string_view a, std::string_view b)
{
    auto stripZeros = [](std::string_view s) {
        auto pos = s.find_first_not_of('0');
        return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
    };
    a = stripZeros(a);
    b = stripZeros(b);
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    int cmp = a.compare(b);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

}  // anonymous namespace

std::filesystem::path DicomFileEntry::resolve(const std::filesystem::path& defaultDirectory) const
{
    const auto& directory = filePath ? *filePath : defaultDirectory;
    return directory / fileName;
}

bool isDicomFile(const std::filesystem::path& filePath)
{
    std::ifstream ifs(filePath, std::ios::binary);
    if (!ifs) {
        return false;
    }

    ifs.seekg(kPreambleLength, std::ios::beg);
    std::array<char, 4> signature{};
    ifs.read(signature.data(), static_cast<std::streamsize>(signature.size()));
    if (ifs.gcount() != static_cast<std::streamsize>(signature.size())) {
        return false;
    }
    return signature == kDicomSignature;
}

bool isDicomImageFile(const std::filesystem::path& directory, const std::string& fileName)
{
    if (std::filesystem::path(fileName).filename() == kDicomDirFileName) {
        return false;
    }
    return isDicomFile(directory / fileName);
}

bool naturalLess(const std::string& a, const std::string& b)
{
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (isDigit(a[i]) && isDigit(b[j])) {
            size_t iEnd = i;
            while (iEnd < a.size() && isDigit(a[iEnd])) ++iEnd;
            size_t jEnd = j;
            while (jEnd < b.size() && isDigit(b[jEnd])) ++jEnd;

            int cmp = compareDigitRuns(std::string_view(a).substr(i, iEnd - i),
                                       std::string_view(b).substr(j, jEnd - j));
            if (cmp != 0) {
                return cmp < 0;
            }
            i = iEnd;
            j = jEnd;
            continue;
        }
        if (a[i] != b[j]) {
            return a[i] < b[j];
        }
        ++i;
        ++j;
    }
    if ((i < a.size()) != (j < b.size())) {
        return j < b.size();
    }
    // Natural keys equal ("01" vs "1"): keep a total order
    return a < b;
}

std::vector<DicomFileEntry> sortFilenamesNumerically(std::vector<DicomFileEntry> entries)
{
    std::stable_sort(entries.begin(), entries.end(),
        [](const DicomFileEntry& a, const DicomFileEntry& b) {
            return naturalLess(a.fileName, b.fileName);
        });
    return entries;
}

std::vector<DicomFileEntry> listDirectory(const std::filesystem::path& directory)
{
    std::vector<DicomFileEntry> entries;
    std::error_code ec;
    for (const auto& item : std::filesystem::directory_iterator(directory, ec)) {
        if (item.is_regular_file(ec)) {
            entries.emplace_back(item.path().filename().string());
        }
    }
    return sortFilenamesNumerically(std::move(entries));
}

}  // namespace dicom_stacker::core
