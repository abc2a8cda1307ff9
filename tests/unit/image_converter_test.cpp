#include "core/image_converter.hpp"

#include "../test_utils/fake_slice_decoder.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace dicom_stacker::core;
using dicom_stacker::test_utils::makeSlice;

namespace {

/// Volume whose voxel (r, c, k) holds 100*k + 10*r + c
template <typename T>
LoadedVolume createGradientVolume(int rows, int columns, int slices, PixelDatatype datatype)
{
    LoadedVolume loaded;
    loaded.volume = Volume(rows, columns, slices, 1, datatype);
    for (int k = 0; k < slices; ++k) {
        SliceImage slice = makeSlice<T>(rows, columns, 1, datatype, T{});
        T* pixels = reinterpret_cast<T*>(slice.pixels.data());
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < columns; ++c) {
                pixels[r * columns + c] = static_cast<T>(100 * k + 10 * r + c);
            }
        }
        EXPECT_TRUE(loaded.volume.setSlice(k, slice).has_value());
    }

    loaded.representativeSnapshot.pixelSpacing = {0.7, 0.5};
    loaded.representativeSnapshot.orientation = std::array<double, 6>{1, 0, 0, 0, 1, 0};
    loaded.sliceThickness = 2.5;
    loaded.globalOriginMm = {10.5, -20.3, 150.7};
    return loaded;
}

}  // anonymous namespace

// =============================================================================
// Volume to ITK, CT (short)
// =============================================================================

class VolumeToCTImageTest : public ::testing::Test {
protected:
    void SetUp() override {
        loaded_ = createGradientVolume<std::int16_t>(3, 4, 2, PixelDatatype::Int16);
    }
    LoadedVolume loaded_;
};

TEST_F(VolumeToCTImageTest, ColumnsMapToX) {
    auto image = ImageConverter::toCTImage(loaded_);
    ASSERT_TRUE(image.has_value());

    auto size = (*image)->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(size[0], 4u);
    EXPECT_EQ(size[1], 3u);
    EXPECT_EQ(size[2], 2u);
}

TEST_F(VolumeToCTImageTest, PixelValuesPreserved) {
    auto image = ImageConverter::toCTImage(loaded_);
    ASSERT_TRUE(image.has_value());

    CTImageType::IndexType idx = {{3, 2, 1}};  // column, row, slice
    EXPECT_EQ((*image)->GetPixel(idx), 123);

    idx = {{0, 1, 0}};
    EXPECT_EQ((*image)->GetPixel(idx), 10);
}

TEST_F(VolumeToCTImageTest, SpacingFromPixelSpacingAndThickness) {
    auto image = ImageConverter::toCTImage(loaded_);
    ASSERT_TRUE(image.has_value());

    auto spacing = (*image)->GetSpacing();
    EXPECT_NEAR(spacing[0], 0.5, 1e-9);  // column spacing
    EXPECT_NEAR(spacing[1], 0.7, 1e-9);  // row spacing
    EXPECT_NEAR(spacing[2], 2.5, 1e-9);
}

TEST_F(VolumeToCTImageTest, OriginPreserved) {
    auto image = ImageConverter::toCTImage(loaded_);
    ASSERT_TRUE(image.has_value());

    auto origin = (*image)->GetOrigin();
    EXPECT_NEAR(origin[0], 10.5, 1e-9);
    EXPECT_NEAR(origin[1], -20.3, 1e-9);
    EXPECT_NEAR(origin[2], 150.7, 1e-9);
}

TEST_F(VolumeToCTImageTest, UnknownThicknessUsesUnitSpacing) {
    loaded_.sliceThickness = kUnknownSliceThickness;
    auto image = ImageConverter::toCTImage(loaded_);
    ASSERT_TRUE(image.has_value());
    EXPECT_NEAR((*image)->GetSpacing()[2], 1.0, 1e-9);
}

TEST_F(VolumeToCTImageTest, DirectionFromOrientation) {
    // Coronal: row along x, column along -z, normal along +y
    loaded_.representativeSnapshot.orientation = std::array<double, 6>{1, 0, 0, 0, 0, -1};
    auto image = ImageConverter::toCTImage(loaded_);
    ASSERT_TRUE(image.has_value());

    auto direction = (*image)->GetDirection();
    EXPECT_NEAR(direction[0][0], 1.0, 1e-9);
    EXPECT_NEAR(direction[2][1], -1.0, 1e-9);
    EXPECT_NEAR(direction[1][2], 1.0, 1e-9);
}

TEST_F(VolumeToCTImageTest, WrongDatatypeRejected) {
    auto image = ImageConverter::toMRImage(loaded_);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, DicomError::UnsupportedPixelFormat);
}

// =============================================================================
// Volume to ITK, MR (unsigned short)
// =============================================================================

TEST(VolumeToMRImageTest, PixelValuesPreserved) {
    auto loaded = createGradientVolume<std::uint16_t>(2, 2, 3, PixelDatatype::UInt16);
    auto image = ImageConverter::toMRImage(loaded);
    ASSERT_TRUE(image.has_value());

    MRImageType::IndexType idx = {{1, 1, 2}};
    EXPECT_EQ((*image)->GetPixel(idx), 211);
}

// =============================================================================
// Volume to ITK, float
// =============================================================================

TEST(VolumeToFloatImageTest, ConvertsAnyScalarDatatype) {
    auto loaded = createGradientVolume<std::uint8_t>(2, 3, 2, PixelDatatype::UInt8);
    auto image = ImageConverter::toFloatImage(loaded);
    ASSERT_TRUE(image.has_value());

    FloatImageType::IndexType idx = {{2, 1, 1}};
    EXPECT_FLOAT_EQ((*image)->GetPixel(idx), 112.0f);
}

TEST(VolumeToFloatImageTest, EmptyVolumeRejected) {
    LoadedVolume loaded;
    auto image = ImageConverter::toFloatImage(loaded);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, DicomError::UnsupportedPixelFormat);
}

TEST(VolumeToFloatImageTest, MultiChannelVolumeRejected) {
    LoadedVolume loaded;
    loaded.volume = Volume(2, 2, 1, 3, PixelDatatype::UInt8);
    auto image = ImageConverter::toFloatImage(loaded);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, DicomError::UnsupportedPixelFormat);
}
