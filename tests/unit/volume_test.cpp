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

#include "core/volume.hpp"

#include "../test_utils/fake_slice_decoder.hpp"

#include <gtest/gtest.h>

namespace dicom_stacker::core::test {

using test_utils::makeSlice;

TEST(VolumeTest, DefaultVolumeIsEmpty)
{
    Volume volume;
    EXPECT_TRUE(volume.empty());
    EXPECT_TRUE(volume.shape().empty());
}

TEST(VolumeTest, SingleChannelShapeHasThreeDimensions)
{
    Volume volume(3, 4, 5, 1, PixelDatatype::Int16);
    EXPECT_FALSE(volume.empty());
    EXPECT_EQ(volume.shape(), (std::vector<size_t>{3, 4, 5}));
    EXPECT_EQ(volume.data().size(), 3u * 4u * 5u * 2u);
}

TEST(VolumeTest, MultiChannelShapeHasFourDimensions)
{
    Volume volume(2, 2, 3, 3, PixelDatatype::UInt8);
    EXPECT_EQ(volume.shape(), (std::vector<size_t>{2, 2, 3, 3}));
}

TEST(VolumeTest, CharacterDatatypeIsStoredAsInt8)
{
    Volume volume(1, 1, 1, 1, PixelDatatype::Character);
    EXPECT_EQ(volume.datatype(), PixelDatatype::Int8);

    auto slice = makeSlice<std::int8_t>(1, 1, 1, PixelDatatype::Character, -5);
    ASSERT_TRUE(volume.setSlice(0, slice).has_value());
    EXPECT_EQ(volume.at<std::int8_t>(0, 0, 0), -5);
}

TEST(VolumeTest, SetSliceFillsOnlyThatSlice)
{
    Volume volume(2, 3, 4, 1, PixelDatatype::Int16);
    ASSERT_TRUE(volume.setSlice(2, makeSlice<std::int16_t>(2, 3, 1, PixelDatatype::Int16, 42))
                    .has_value());

    for (size_t r = 0; r < 2; ++r) {
        for (size_t c = 0; c < 3; ++c) {
            EXPECT_EQ(volume.at<std::int16_t>(r, c, 2), 42);
            EXPECT_EQ(volume.at<std::int16_t>(r, c, 1), 0);
        }
    }
}

TEST(VolumeTest, SetSliceKeepsRowMajorPixelOrder)
{
    SliceImage slice = makeSlice<std::uint16_t>(2, 2, 1, PixelDatatype::UInt16, 0);
    const std::uint16_t values[] = {10, 11, 20, 21};
    std::memcpy(slice.pixels.data(), values, sizeof(values));

    Volume volume(2, 2, 1, 1, PixelDatatype::UInt16);
    ASSERT_TRUE(volume.setSlice(0, slice).has_value());

    EXPECT_EQ(volume.at<std::uint16_t>(0, 0, 0), 10);
    EXPECT_EQ(volume.at<std::uint16_t>(0, 1, 0), 11);
    EXPECT_EQ(volume.at<std::uint16_t>(1, 0, 0), 20);
    EXPECT_EQ(volume.at<std::uint16_t>(1, 1, 0), 21);
}

TEST(VolumeTest, MultiChannelSamplesStayTogether)
{
    SliceImage slice = makeSlice<std::uint8_t>(1, 2, 3, PixelDatatype::UInt8, 0);
    const std::uint8_t rgb[] = {1, 2, 3, 4, 5, 6};
    std::memcpy(slice.pixels.data(), rgb, sizeof(rgb));

    Volume volume(1, 2, 2, 3, PixelDatatype::UInt8);
    ASSERT_TRUE(volume.setSlice(1, slice).has_value());

    EXPECT_EQ(volume.at<std::uint8_t>(0, 0, 1, 0), 1);
    EXPECT_EQ(volume.at<std::uint8_t>(0, 0, 1, 2), 3);
    EXPECT_EQ(volume.at<std::uint8_t>(0, 1, 1, 1), 5);
    EXPECT_EQ(volume.at<std::uint8_t>(0, 1, 0, 1), 0);
}

TEST(VolumeTest, SetSliceRejectsOutOfRangeIndex)
{
    Volume volume(2, 2, 2, 1, PixelDatatype::UInt8);
    auto result = volume.setSlice(2, makeSlice<std::uint8_t>(2, 2, 1, PixelDatatype::UInt8, 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DicomError::SeriesAssemblyFailed);
}

TEST(VolumeTest, SetSliceRejectsShapeMismatch)
{
    Volume volume(2, 2, 2, 1, PixelDatatype::UInt8);
    auto result = volume.setSlice(0, makeSlice<std::uint8_t>(3, 2, 1, PixelDatatype::UInt8, 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DicomError::SeriesAssemblyFailed);
}

TEST(VolumeTest, SetSliceRejectsDatatypeMismatch)
{
    Volume volume(2, 2, 2, 1, PixelDatatype::Int16);
    auto result = volume.setSlice(0, makeSlice<std::uint16_t>(2, 2, 1, PixelDatatype::UInt16, 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DicomError::UnsupportedPixelFormat);
}

TEST(VolumeTest, SetSliceRejectsTruncatedBuffer)
{
    Volume volume(2, 2, 1, 1, PixelDatatype::Int16);
    auto slice = makeSlice<std::int16_t>(2, 2, 1, PixelDatatype::Int16, 1);
    slice.pixels.pop_back();
    auto result = volume.setSlice(0, slice);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DicomError::DecodingFailed);
}

TEST(VolumeTest, AtRejectsWrongType)
{
    Volume volume(1, 1, 1, 1, PixelDatatype::Int16);
    EXPECT_THROW((void)volume.at<float>(0, 0, 0), std::invalid_argument);
}

TEST(VolumeTest, AtRejectsOutOfRangeIndex)
{
    Volume volume(2, 2, 2, 1, PixelDatatype::Int16);
    EXPECT_THROW((void)volume.at<int16_t>(50, 0, 0), std::out_of_range);
    EXPECT_THROW((void)volume.at<int16_t>(2, 0, 0), std::out_of_range);
    EXPECT_THROW((void)volume.at<int16_t>(0, 2, 0), std::out_of_range);
    EXPECT_THROW((void)volume.at<int16_t>(0, 0, 2), std::out_of_range);
    EXPECT_THROW((void)volume.at<int16_t>(0, 0, 0, 1), std::out_of_range);
    EXPECT_NO_THROW((void)volume.at<int16_t>(1, 1, 1));
}

}  // namespace dicom_stacker::core::test
