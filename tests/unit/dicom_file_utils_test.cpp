#include "core/dicom_file_utils.hpp"

#include "../test_utils/fake_slice_decoder.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace dicom_stacker::core::test {

namespace fs = std::filesystem;

class DicomFileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        tempDir_ = fs::temp_directory_path() / "dicom_stacker_file_utils_test";
        fs::remove_all(tempDir_);
        fs::create_directories(tempDir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    void writeText(const std::string& name, const std::string& content)
    {
        std::ofstream ofs(tempDir_ / name, std::ios::binary);
        ofs << content;
    }

    static std::vector<std::string> names(const std::vector<DicomFileEntry>& entries)
    {
        std::vector<std::string> result;
        for (const auto& entry : entries) {
            result.push_back(entry.fileName);
        }
        return result;
    }

    fs::path tempDir_;
};

// ============================================================================
// Signature detection
// ============================================================================
TEST_F(DicomFileUtilsTest, SignatureFileIsDicom)
{
    test_utils::writeDicomSignatureFile(tempDir_ / "image.dcm");
    EXPECT_TRUE(isDicomFile(tempDir_ / "image.dcm"));
}

TEST_F(DicomFileUtilsTest, ZeroLengthFileIsNotDicom)
{
    writeText("empty.dcm", "");
    EXPECT_FALSE(isDicomFile(tempDir_ / "empty.dcm"));
}

TEST_F(DicomFileUtilsTest, ShortFileIsNotDicom)
{
    writeText("short.dcm", std::string(130, 'x'));
    EXPECT_FALSE(isDicomFile(tempDir_ / "short.dcm"));
}

TEST_F(DicomFileUtilsTest, WrongMagicIsNotDicom)
{
    writeText("wrong.dcm", std::string(128, '\0') + "DICX");
    EXPECT_FALSE(isDicomFile(tempDir_ / "wrong.dcm"));
}

TEST_F(DicomFileUtilsTest, MissingFileIsNotDicom)
{
    EXPECT_FALSE(isDicomFile(tempDir_ / "missing.dcm"));
}

TEST_F(DicomFileUtilsTest, DicomDirIsNeverAnImage)
{
    test_utils::writeDicomSignatureFile(tempDir_ / kDicomDirFileName);
    EXPECT_TRUE(isDicomFile(tempDir_ / kDicomDirFileName));
    EXPECT_FALSE(isDicomImageFile(tempDir_, kDicomDirFileName));
}

TEST_F(DicomFileUtilsTest, DicomDirInSubdirectoryIsNeverAnImage)
{
    fs::create_directories(tempDir_ / "sub");
    test_utils::writeDicomSignatureFile(tempDir_ / "sub" / kDicomDirFileName);
    const std::string nested = (fs::path("sub") / kDicomDirFileName).string();
    EXPECT_TRUE(isDicomFile(tempDir_ / nested));
    EXPECT_FALSE(isDicomImageFile(tempDir_, nested));
}

TEST_F(DicomFileUtilsTest, ImageFileAcceptsSignatureFile)
{
    test_utils::writeDicomSignatureFile(tempDir_ / "IM0001");
    EXPECT_TRUE(isDicomImageFile(tempDir_, "IM0001"));
}

// ============================================================================
// Natural ordering
// ============================================================================
TEST_F(DicomFileUtilsTest, NaturalLessComparesDigitRunsByValue)
{
    EXPECT_TRUE(naturalLess("img2.dcm", "img10.dcm"));
    EXPECT_FALSE(naturalLess("img10.dcm", "img2.dcm"));
    EXPECT_TRUE(naturalLess("a", "b"));
    EXPECT_FALSE(naturalLess("same", "same"));
}

TEST_F(DicomFileUtilsTest, SortFilenamesNumerically)
{
    std::vector<DicomFileEntry> entries = {"img10.dcm", "img2.dcm", "img1.dcm", "img20.dcm"};
    auto sorted = sortFilenamesNumerically(entries);
    EXPECT_EQ(names(sorted),
              (std::vector<std::string>{"img1.dcm", "img2.dcm", "img10.dcm", "img20.dcm"}));
}

TEST_F(DicomFileUtilsTest, SortKeepsPathsWithNames)
{
    std::vector<DicomFileEntry> entries = {
        DicomFileEntry("2.dcm", "/b"),
        DicomFileEntry("1.dcm", "/a"),
    };
    auto sorted = sortFilenamesNumerically(entries);
    ASSERT_EQ(sorted.size(), 2u);
    EXPECT_EQ(sorted[0].fileName, "1.dcm");
    EXPECT_EQ(*sorted[0].filePath, fs::path("/a"));
}

// ============================================================================
// Entries and listing
// ============================================================================
TEST_F(DicomFileUtilsTest, ResolveUsesOwnPathOrDefault)
{
    DicomFileEntry plain("a.dcm");
    DicomFileEntry withPath("b.dcm", "/data/sub");

    EXPECT_EQ(plain.resolve("/data"), fs::path("/data/a.dcm"));
    EXPECT_EQ(withPath.resolve("/data"), fs::path("/data/sub/b.dcm"));
}

TEST_F(DicomFileUtilsTest, ListDirectorySkipsSubdirectories)
{
    writeText("slice10", "x");
    writeText("slice9", "x");
    fs::create_directories(tempDir_ / "nested");

    EXPECT_EQ(names(listDirectory(tempDir_)),
              (std::vector<std::string>{"slice9", "slice10"}));
}

TEST_F(DicomFileUtilsTest, ListMissingDirectoryIsEmpty)
{
    EXPECT_TRUE(listDirectory(tempDir_ / "missing").empty());
}

}  // namespace dicom_stacker::core::test
