#include <gtest/gtest.h>

#include <operations/Resize.hpp>

#include "TestImages.hpp"

using imageless::CropMode;
using imageless::FilterType;
using imageless::Resize;
using imageless::ResizeTarget;

TEST(ResizeTest, TargetResolvesEachAxisAgainstItsDimension) {
    const Resize resize{pct(0.5F), px(50), FilterType::kNearest,
                        CropMode::kExact};
    EXPECT_EQ(resize.target(200, 100), (ResizeTarget{100, 50}));

    const Resize relative{pct(0.5F), pct(0.5F), FilterType::kNearest,
                          CropMode::kExact};
    EXPECT_EQ(relative.target(200, 100), (ResizeTarget{100, 50}));
}

TEST(ResizeTest, DefaultsToNearestPreserve) {
    const Resize resize{};
    EXPECT_EQ(resize.filter, FilterType::kNearest);
    EXPECT_EQ(resize.cropMode, CropMode::kPreserve);
    EXPECT_EQ(resize.target(30, 40), (ResizeTarget{0, 0}));
}

TEST(ResizeTest, ExactIgnoresAspectRatio) {
    const Resize resize{pct(0.5F), px(50), FilterType::kTriangle,
                        CropMode::kExact};
    auto resized = resize.process(makeGradient(200, 100));
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_EQ(resized->cols, 100);
    EXPECT_EQ(resized->rows, 50);

    const Resize squash{px(30), px(90), FilterType::kTriangle,
                        CropMode::kExact};
    resized = squash.process(makeGradient(200, 100));
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_EQ(resized->cols, 30);
    EXPECT_EQ(resized->rows, 90);
}

TEST(ResizeTest, PreserveFitsInsideBox) {
    const Resize resize{px(50), px(50), FilterType::kCatmullRom,
                        CropMode::kPreserve};
    auto resized = resize.process(makeGradient(200, 100));
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_EQ(resized->cols, 50);
    EXPECT_EQ(resized->rows, 25);
}

TEST(ResizeTest, PreserveCanUpscale) {
    const Resize resize{px(400), px(400), FilterType::kLanczos3,
                        CropMode::kPreserve};
    auto resized = resize.process(makeGradient(100, 50));
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_EQ(resized->cols, 400);
    EXPECT_EQ(resized->rows, 200);
}

TEST(ResizeTest, PreserveAtCurrentSizeKeepsPixels) {
    const cv::Mat source = makeGradient(64, 32);
    const Resize resize{pct(1.0F), pct(1.0F), FilterType::kGaussian,
                        CropMode::kPreserve};
    auto resized = resize.process(source);
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_TRUE(sameImage(*resized, source));
}

TEST(ResizeTest, FillCoversAndCropsOverflow) {
    const Resize resize{px(50), px(50), FilterType::kTriangle,
                        CropMode::kFill};
    auto resized = resize.process(makeGradient(200, 100));
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_EQ(resized->cols, 50);
    EXPECT_EQ(resized->rows, 50);

    const Resize banner{px(80), px(20), FilterType::kTriangle,
                        CropMode::kFill};
    resized = banner.process(makeGradient(100, 100));
    ASSERT_TRUE(resized.ok()) << resized.status();
    EXPECT_EQ(resized->cols, 80);
    EXPECT_EQ(resized->rows, 20);
}

TEST(ResizeTest, EveryFilterProducesRequestedSize) {
    for (const auto filter :
         {FilterType::kNearest, FilterType::kTriangle, FilterType::kCatmullRom,
          FilterType::kGaussian, FilterType::kLanczos3}) {
        const Resize resize{px(64), px(48), filter, CropMode::kExact};
        auto resized = resize.process(makeGradient(100, 100));
        ASSERT_TRUE(resized.ok()) << filter << ": " << resized.status();
        EXPECT_EQ(resized->size(), cv::Size(64, 48)) << filter;
    }
}

TEST(ResizeTest, ZeroDimensionIsLeftToOpenCV) {
    const Resize resize{px(0), px(10), FilterType::kNearest,
                        CropMode::kExact};
    auto resized = resize.process(makeGradient(20, 20));
    ASSERT_FALSE(resized.ok());
    EXPECT_EQ(resized.status().code(), absl::StatusCode::kInternal);
}
