#include <gtest/gtest.h>

#include <operations/Crop.hpp>
#include <operations/OperationError.hpp>
#include <string>

#include "TestImages.hpp"

using imageless::Coordinate;
using imageless::Crop;
using imageless::CropOrigin;
using imageless::CropRegion;
using imageless::IsOperationError;
using imageless::PixelPoint;

class CropOriginTest : public testing::Test {
   protected:
    static constexpr std::uint32_t kCanvasWidth = 100;
    static constexpr std::uint32_t kCanvasHeight = 100;
    const PixelPoint kNear{5, 5};

    PixelPoint resolveFar(const CropOrigin& origin) const {
        auto corner = origin.farCorner(kNear, kCanvasWidth, kCanvasHeight);
        EXPECT_TRUE(corner.ok()) << corner.status();
        return corner.value_or(PixelPoint{});
    }
};

TEST_F(CropOriginTest, MinimumPixel) {
    EXPECT_EQ(resolveFar(CropOrigin::minimum({px(10), px(10)})),
              (PixelPoint{10, 10}));
}

TEST_F(CropOriginTest, MinimumPercent) {
    EXPECT_EQ(resolveFar(CropOrigin::minimum({pct(0.8F), pct(0.8F)})),
              (PixelPoint{80, 80}));
}

TEST_F(CropOriginTest, MinimumMixed) {
    EXPECT_EQ(resolveFar(CropOrigin::minimum({pct(0.8F), px(50)})),
              (PixelPoint{80, 50}));
}

TEST_F(CropOriginTest, MaximumPixel) {
    EXPECT_EQ(resolveFar(CropOrigin::maximum({px(10), px(10)})),
              (PixelPoint{90, 90}));
}

TEST_F(CropOriginTest, MaximumPercent) {
    EXPECT_EQ(resolveFar(CropOrigin::maximum({pct(0.2F), pct(0.2F)})),
              (PixelPoint{80, 80}));
}

TEST_F(CropOriginTest, MaximumMixed) {
    EXPECT_EQ(resolveFar(CropOrigin::maximum({pct(0.2F), px(50)})),
              (PixelPoint{80, 50}));
}

TEST_F(CropOriginTest, MaximumWholeImageInsetIsZero) {
    EXPECT_EQ(resolveFar(CropOrigin::maximum({pct(1.0F), px(100)})),
              (PixelPoint{0, 0}));
    EXPECT_EQ(resolveFar(CropOrigin::maximum({px(0), pct(0.0F)})),
              (PixelPoint{100, 100}));
}

TEST_F(CropOriginTest, MaximumInsetPastEdgeFails) {
    auto corner = CropOrigin::maximum({px(10), px(101)})
                      .farCorner(kNear, kCanvasWidth, kCanvasHeight);
    ASSERT_FALSE(corner.ok());
    EXPECT_EQ(corner.status().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_NE(corner.status().message().find("height"), std::string::npos);
}

TEST_F(CropOriginTest, CropStartPixel) {
    EXPECT_EQ(resolveFar(CropOrigin::cropStart({px(10), px(10)})),
              (PixelPoint{15, 15}));
}

TEST_F(CropOriginTest, CropStartPercent) {
    EXPECT_EQ(resolveFar(CropOrigin::cropStart({pct(0.2F), pct(0.2F)})),
              (PixelPoint{25, 25}));
}

TEST_F(CropOriginTest, CropStartMixed) {
    EXPECT_EQ(resolveFar(CropOrigin::cropStart({pct(0.2F), px(50)})),
              (PixelPoint{25, 55}));
}

TEST(CropRegionTest, CropStartRegion) {
    const Crop crop{{px(10), px(20)}, CropOrigin::cropStart({px(30), px(40)})};
    auto region = crop.region(100, 100);
    ASSERT_TRUE(region.ok()) << region.status();
    EXPECT_EQ(*region, (CropRegion{10, 20, 30, 40}));
}

TEST(CropRegionTest, AxesFollowTheirOwnDimensionOnNonSquareImage) {
    // Near corner: 10% of 200 wide, 10% of 100 high
    const Crop crop{{pct(0.1F), pct(0.1F)},
                    CropOrigin::minimum({pct(0.5F), pct(0.5F)})};
    auto region = crop.region(200, 100);
    ASSERT_TRUE(region.ok()) << region.status();
    EXPECT_EQ(*region, (CropRegion{20, 10, 80, 40}));
}

TEST(CropRegionTest, MaximumRegionOnNonSquareImage) {
    const Crop crop{{pct(0.25F), pct(0.25F)},
                    CropOrigin::maximum({pct(0.25F), pct(0.25F)})};
    auto region = crop.region(400, 100);
    ASSERT_TRUE(region.ok()) << region.status();
    EXPECT_EQ(*region, (CropRegion{100, 25, 200, 50}));
}

TEST(CropRegionTest, BottomAboveTopFails) {
    const Crop crop{{px(10), px(50)}, CropOrigin::minimum({px(60), px(20)})};
    auto region = crop.region(100, 100);
    ASSERT_FALSE(region.ok());
    EXPECT_TRUE(IsOperationError(region.status())) << region.status();
    EXPECT_NE(region.status().message().find("Bottom cannot be less than top"),
              std::string::npos);
    EXPECT_NE(region.status().message().find("Crop{"), std::string::npos);
}

TEST(CropRegionTest, RightLeftOfLeftFails) {
    const Crop crop{{px(50), px(10)}, CropOrigin::minimum({px(20), px(60)})};
    auto region = crop.region(100, 100);
    ASSERT_FALSE(region.ok());
    EXPECT_TRUE(IsOperationError(region.status())) << region.status();
    EXPECT_NE(region.status().message().find("Right cannot be less than left"),
              std::string::npos);
}

TEST(CropRegionTest, InsetPastEdgeIsOperationError) {
    const Crop crop{{px(0), px(0)}, CropOrigin::maximum({px(150), px(0)})};
    auto region = crop.region(100, 100);
    ASSERT_FALSE(region.ok());
    EXPECT_TRUE(IsOperationError(region.status())) << region.status();
}

TEST(CropRegionTest, EqualCornersGiveEmptyRegion) {
    const Crop crop{{px(10), px(10)}, CropOrigin::minimum({px(10), px(10)})};
    auto region = crop.region(100, 100);
    ASSERT_TRUE(region.ok()) << region.status();
    EXPECT_EQ(*region, (CropRegion{10, 10, 0, 0}));
}

TEST(CropProcessTest, KeepsRequestedPixels) {
    const cv::Mat source = makeGradient(100, 80);
    const Crop crop{{px(10), px(20)}, CropOrigin::cropStart({px(30), px(40)})};

    auto cropped = crop.process(source);
    ASSERT_TRUE(cropped.ok()) << cropped.status();
    EXPECT_EQ(cropped->cols, 30);
    EXPECT_EQ(cropped->rows, 40);
    EXPECT_EQ(cropped->at<cv::Vec3b>(0, 0), source.at<cv::Vec3b>(20, 10));
    EXPECT_EQ(cropped->at<cv::Vec3b>(39, 29), source.at<cv::Vec3b>(59, 39));
    // The source image is left alone
    EXPECT_EQ(source.cols, 100);
    EXPECT_EQ(source.rows, 80);
}

TEST(CropProcessTest, ClampsToImageBounds) {
    const Crop crop{{px(90), px(90)}, CropOrigin::cropStart({px(50), px(50)})};
    auto cropped = crop.process(makeGradient(100, 100));
    ASSERT_TRUE(cropped.ok()) << cropped.status();
    EXPECT_EQ(cropped->cols, 10);
    EXPECT_EQ(cropped->rows, 10);
}

TEST(CropProcessTest, InvalidRegionIsNotCropped) {
    const Crop crop{{px(10), px(50)}, CropOrigin::minimum({px(60), px(20)})};
    auto cropped = crop.process(makeGradient(100, 100));
    ASSERT_FALSE(cropped.ok());
    EXPECT_TRUE(IsOperationError(cropped.status()));
}
