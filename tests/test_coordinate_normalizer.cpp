#include <gtest/gtest.h>

#include "coordinate_normalizer.hpp"

using namespace roadvlm;

static std::vector<DetectedObject> one_car() {
    return {DetectedObject(ObjectType::Car, BoundingBox(100, 100, 500, 500), 0.9)};
}

TEST(CoordinateNormalizerTest, RescalesToImageSize) {
    auto out = normalize_coordinates(one_car(), cv::Size(640, 480));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].bbox, BoundingBox(64, 48, 320, 240));
    EXPECT_EQ(out[0].space, CoordinateSpace::Pixel);
}

TEST(CoordinateNormalizerTest, NoTargetLeavesMillirange) {
    auto out = normalize_coordinates(one_car(), std::nullopt);
    EXPECT_EQ(out[0].bbox, BoundingBox(100, 100, 500, 500));
    EXPECT_EQ(out[0].space, CoordinateSpace::Millirange);
}

TEST(CoordinateNormalizerTest, SecondPassIsNoOp) {
    auto once  = normalize_coordinates(one_car(), cv::Size(640, 480));
    auto twice = normalize_coordinates(once, cv::Size(640, 480));
    EXPECT_EQ(twice[0].bbox, once[0].bbox);
}

TEST(CoordinateNormalizerTest, NonPositiveTargetIgnored) {
    auto out = normalize_coordinates(one_car(), cv::Size(0, 480));
    EXPECT_EQ(out[0].bbox, BoundingBox(100, 100, 500, 500));
    EXPECT_EQ(out[0].space, CoordinateSpace::Millirange);
}

TEST(CoordinateNormalizerTest, TruncatesTowardZero) {
    // 333 * 100 / 1000 = 33.3, 667 * 100 / 1000 = 66.7
    EXPECT_EQ(rescale_box(BoundingBox(333, 333, 667, 667), cv::Size(100, 100)),
              BoundingBox(33, 33, 66, 66));
}

TEST(CoordinateNormalizerTest, CollapsedBoxWidenedToOnePixel) {
    BoundingBox b = rescale_box(BoundingBox(100, 100, 105, 500), cv::Size(10, 10));
    EXPECT_EQ(b.x_min, 1);
    EXPECT_EQ(b.x_max, 2);
    EXPECT_EQ(b.y_min, 1);
    EXPECT_EQ(b.y_max, 5);
}

TEST(CoordinateNormalizerTest, EmptyList) {
    EXPECT_TRUE(normalize_coordinates({}, cv::Size(640, 480)).empty());
}
