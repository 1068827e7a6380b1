#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include "../src/io/Image3D.h"

using namespace neuroqap::io;

TEST(Image3DTest, AllocatesZeroedVoxels) {
    Image3D<float> image(16, 8, 4);

    EXPECT_TRUE(image.IsValid());
    EXPECT_EQ(image.GetSize(), (Image3D<float>::SizeType{{16, 8, 4}}));
    EXPECT_EQ(image.GetNumberOfVoxels(), 16u * 8u * 4u);
    EXPECT_EQ(image(10, 5, 3), 0.0f);

    image.Fill(42.0f);
    image(10, 5, 3) = 100.0f;
    EXPECT_EQ(image(0, 0, 0), 42.0f);
    EXPECT_EQ(image(10, 5, 3), 100.0f);
}

TEST(Image3DTest, LinearOrderIsXFastest) {
    Image3D<double> image(2, 3, 2);
    image(1, 0, 0) = 1.0;
    image(0, 1, 0) = 2.0;
    image(0, 0, 1) = 4.0;

    EXPECT_EQ(image[1], 1.0);
    EXPECT_EQ(image[2], 2.0);
    EXPECT_EQ(image[6], 4.0);
    EXPECT_EQ(image.GetDataVector().size(), 12u);

    EXPECT_EQ(image.LinearToIndex(0), (Image3D<double>::IndexType{{0, 0, 0}}));
    EXPECT_EQ(image.LinearToIndex(11), (Image3D<double>::IndexType{{1, 2, 1}}));
}

TEST(Image3DTest, OutOfBoundsAccessThrows) {
    Image3D<uint8_t> image(2, 2, 2);

    EXPECT_THROW(image(2, 0, 0), std::out_of_range);
    EXPECT_THROW(image(0, 0, 2), std::out_of_range);
    EXPECT_THROW(image[8], std::out_of_range);
    EXPECT_THROW(image.LinearToIndex(8), std::out_of_range);
}

TEST(Image3DTest, SizeComparisonAcrossPixelTypes) {
    Image3D<float> volume(3, 4, 5);
    Image3D<uint8_t> mask(3, 4, 5);
    Image3D<uint8_t> other(3, 4, 6);

    EXPECT_TRUE(volume.HasSameSize(mask));
    EXPECT_FALSE(volume.HasSameSize(other));
}

TEST(Image3DTest, EmptyImageIsInvalid) {
    Image3D<float> empty;
    EXPECT_FALSE(empty.IsValid());
    EXPECT_EQ(empty.GetNumberOfVoxels(), 0u);

    Image3D<float> zero_extent(0, 4, 4);
    EXPECT_FALSE(zero_extent.IsValid());
}
