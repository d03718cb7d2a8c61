#include <gtest/gtest.h>
#include <cmath>
#include "FaceDetectionModel.hpp"

namespace flm {
namespace testing {

class FaceDetectionDecodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        anchors_ = generateFaceDetectionAnchors(128);
        boxes_.assign(anchors_.size() * 16, 0.0f);
        scores_.assign(anchors_.size(), -100.0f);
    }

    void setFace(size_t anchor, float logit, float sizePixels) {
        scores_[anchor] = logit;
        boxes_[anchor * 16 + 2] = sizePixels;
        boxes_[anchor * 16 + 3] = sizePixels;
    }

    std::vector<SsdAnchor> anchors_;
    std::vector<float> boxes_;
    std::vector<float> scores_;
};

TEST(FaceDetectionAnchorsTest, ShortRangeLayout) {
    auto anchors = generateFaceDetectionAnchors(128);
    ASSERT_EQ(anchors.size(), 896u);

    // 16x16 grid, 2 anchors per cell
    EXPECT_FLOAT_EQ(anchors[0].xCenter, 0.5f / 16.0f);
    EXPECT_FLOAT_EQ(anchors[0].yCenter, 0.5f / 16.0f);
    EXPECT_FLOAT_EQ(anchors[1].xCenter, anchors[0].xCenter);
    EXPECT_FLOAT_EQ(anchors[2].xCenter, 1.5f / 16.0f);

    // 8x8 grid, 6 anchors per cell
    EXPECT_FLOAT_EQ(anchors[512].xCenter, 0.5f / 8.0f);
    EXPECT_FLOAT_EQ(anchors[517].xCenter, 0.5f / 8.0f);
    EXPECT_FLOAT_EQ(anchors[518].xCenter, 1.5f / 8.0f);
    EXPECT_FLOAT_EQ(anchors.back().xCenter, 7.5f / 8.0f);
    EXPECT_FLOAT_EQ(anchors.back().yCenter, 7.5f / 8.0f);
    EXPECT_FLOAT_EQ(anchors.back().width, 1.0f);
}

TEST_F(FaceDetectionDecodeTest, DecodesBoxAndKeypoints) {
    setFace(0, 10.0f, 32.0f);
    boxes_[4] = 6.4f;  // first keypoint x offset, in input pixels

    auto detections = decodeFaceDetections(boxes_.data(), scores_.data(), anchors_, 0.5f, 128);
    ASSERT_EQ(detections.size(), 1u);

    const auto& face = detections[0];
    EXPECT_NEAR(face.score, 1.0f / (1.0f + std::exp(-10.0f)), 1e-6f);
    EXPECT_NEAR(face.box.width, 0.25f, 1e-6f);
    EXPECT_NEAR(face.box.x + face.box.width / 2.0f, anchors_[0].xCenter, 1e-6f);
    ASSERT_EQ(face.keypoints.size(), 6u);
    EXPECT_NEAR(face.keypoints[0].x, anchors_[0].xCenter + 0.05f, 1e-6f);
    EXPECT_NEAR(face.keypoints[1].y, anchors_[0].yCenter, 1e-6f);
}

TEST_F(FaceDetectionDecodeTest, ScoreThresholdAndClipping) {
    setFace(10, 1000.0f, 20.0f);
    setFace(20, -1.0f, 20.0f);

    auto detections = decodeFaceDetections(boxes_.data(), scores_.data(), anchors_, 0.5f, 128);
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_NEAR(detections[0].score, 1.0f, 1e-6f);
    EXPECT_FALSE(std::isnan(detections[0].score));

    auto permissive = decodeFaceDetections(boxes_.data(), scores_.data(), anchors_, 0.2f, 128);
    EXPECT_EQ(permissive.size(), 2u);
}

TEST(FaceDetectionNmsTest, SuppressesOverlaps) {
    FaceDetection strong{0.9f, cv::Rect2f(0.1f, 0.1f, 0.3f, 0.3f), {}};
    FaceDetection overlapping{0.8f, cv::Rect2f(0.12f, 0.1f, 0.3f, 0.3f), {}};
    FaceDetection separate{0.7f, cv::Rect2f(0.6f, 0.6f, 0.2f, 0.2f), {}};

    auto kept = suppressOverlapping({overlapping, separate, strong}, 0.3f, 0);
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_FLOAT_EQ(kept[0].score, 0.9f);
    EXPECT_FLOAT_EQ(kept[1].score, 0.7f);

    auto limited = suppressOverlapping({overlapping, separate, strong}, 0.3f, 1);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_FLOAT_EQ(limited[0].score, 0.9f);

    EXPECT_TRUE(suppressOverlapping({}, 0.3f, 1).empty());
}

TEST(FaceDetectionNmsTest, BlendsSuppressedDetectionsByScore) {
    FaceDetection strong{0.75f, cv::Rect2f(0.1f, 0.1f, 0.4f, 0.4f), {{0.2f, 0.2f}, {0.4f, 0.2f}}};
    FaceDetection shifted{0.25f, cv::Rect2f(0.14f, 0.1f, 0.4f, 0.4f), {{0.24f, 0.2f}, {0.44f, 0.2f}}};
    FaceDetection separate{0.6f, cv::Rect2f(0.7f, 0.7f, 0.2f, 0.2f), {{0.75f, 0.75f}, {0.85f, 0.75f}}};

    auto kept = suppressOverlapping({shifted, separate, strong}, 0.3f, 0);
    ASSERT_EQ(kept.size(), 2u);

    EXPECT_FLOAT_EQ(kept[0].score, 0.75f);
    EXPECT_NEAR(kept[0].box.x, 0.11f, 1e-5f);
    EXPECT_NEAR(kept[0].box.y, 0.1f, 1e-5f);
    EXPECT_NEAR(kept[0].box.width, 0.4f, 1e-5f);
    ASSERT_EQ(kept[0].keypoints.size(), 2u);
    EXPECT_NEAR(kept[0].keypoints[0].x, 0.21f, 1e-5f);
    EXPECT_NEAR(kept[0].keypoints[1].x, 0.41f, 1e-5f);

    // Nothing overlaps the separate face
    EXPECT_NEAR(kept[1].box.x, 0.7f, 1e-6f);
    EXPECT_NEAR(kept[1].keypoints[0].x, 0.75f, 1e-6f);
}

TEST(FaceDetectionLetterboxTest, PadsAndMapsBack) {
    cv::Mat wide(100, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::Mat input;
    LetterboxInfo info = letterbox(wide, input, cv::Size(128, 128));

    ASSERT_EQ(input.size(), cv::Size(128, 128));
    EXPECT_FLOAT_EQ(info.scale, 0.64f);
    EXPECT_FLOAT_EQ(info.padX, 0.0f);
    EXPECT_FLOAT_EQ(info.padY, 32.0f);
    EXPECT_EQ(input.at<cv::Vec3b>(10, 64), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(input.at<cv::Vec3b>(64, 64), cv::Vec3b(255, 255, 255));

    // The whole image area of the input maps back to the whole image
    FaceDetection detection{0.9f, cv::Rect2f(0.0f, 0.25f, 1.0f, 0.5f), {{0.5f, 0.5f}}};
    removeLetterbox(detection, info, cv::Size(128, 128), wide.size());
    EXPECT_NEAR(detection.box.x, 0.0f, 1e-5f);
    EXPECT_NEAR(detection.box.y, 0.0f, 1e-5f);
    EXPECT_NEAR(detection.box.width, 1.0f, 1e-5f);
    EXPECT_NEAR(detection.box.height, 1.0f, 1e-5f);
    EXPECT_NEAR(detection.keypoints[0].x, 0.5f, 1e-5f);
    EXPECT_NEAR(detection.keypoints[0].y, 0.5f, 1e-5f);
}

} // namespace testing
} // namespace flm
