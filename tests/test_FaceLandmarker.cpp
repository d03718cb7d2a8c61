#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include "FaceLandmarker.hpp"
#include "FakeLandmarkEngine.hpp"

namespace fs = std::filesystem;

namespace flm {
namespace testing {

namespace {

// Collects live stream callbacks
struct CallbackLog {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int64_t> timestamps;
    std::vector<bool> succeeded;
    std::vector<cv::Size> imageSizes;

    ResultCallback callback() {
        return [this](const Result<FaceLandmarkerResult>& result, const Image& image, int64_t timestampMs) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                timestamps.push_back(timestampMs);
                succeeded.push_back(result.ok());
                imageSizes.push_back(image.pixels().size());
            }
            cv.notify_all();
        };
    }

    bool waitFor(size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(2), [&] { return timestamps.size() >= count; });
    }
};

} // namespace

class FaceLandmarkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeEngineState>();
        options_.baseOptions.modelAssetPath = "unused";
    }

    std::unique_ptr<FaceLandmarker> make(RunningMode mode) {
        options_.runningMode = mode;
        auto landmarker = FaceLandmarker::create(options_, std::make_unique<FakeLandmarkEngine>(state_));
        EXPECT_TRUE(landmarker.ok());
        return landmarker.ok() ? std::move(landmarker).value() : nullptr;
    }

    std::shared_ptr<FakeEngineState> state_;
    FaceLandmarkerOptions options_;
};

TEST_F(FaceLandmarkerTest, CreateRejectsInvalidOptions) {
    options_.numFaces = 0;
    auto landmarker = FaceLandmarker::create(options_, std::make_unique<FakeLandmarkEngine>(state_));
    ASSERT_FALSE(landmarker.ok());
    EXPECT_EQ(landmarker.error().code, ErrorCode::InitializationError);

    options_.numFaces = 1;
    auto noEngine = FaceLandmarker::create(options_, nullptr);
    ASSERT_FALSE(noEngine.ok());
    EXPECT_EQ(noEngine.error().code, ErrorCode::InitializationError);
}

TEST_F(FaceLandmarkerTest, CreateFailsOnMissingModelAsset) {
    auto missing = FaceLandmarker::create("/nonexistent/face_landmarker");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::InitializationError);

    auto empty = FaceLandmarker::create(std::string());
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error().code, ErrorCode::InitializationError);

    // Directory without the model files
    fs::path dir = fs::path(::testing::TempDir()) / "flm_empty_asset";
    fs::create_directories(dir);
    auto incomplete = FaceLandmarker::create(dir.string());
    ASSERT_FALSE(incomplete.ok());
    EXPECT_EQ(incomplete.error().code, ErrorCode::InitializationError);
    EXPECT_NE(incomplete.error().message.find("face_detector.onnx"), std::string::npos);
}

TEST_F(FaceLandmarkerTest, DetectImageReturnsLandmarks) {
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);

    auto result = landmarker->detectImage(makeImage());
    ASSERT_TRUE(result.ok()) << result.error().toString();
    ASSERT_EQ(result.value().faceLandmarks.size(), 1u);
    EXPECT_EQ(result.value().faceLandmarks[0].size(), 478u);
    EXPECT_FLOAT_EQ(result.value().faceLandmarks[0][0].x, 0.25f);
    EXPECT_FLOAT_EQ(result.value().faceLandmarks[0][0].y, 0.75f);
    EXPECT_TRUE(result.value().faceBlendshapes.empty());
    EXPECT_TRUE(result.value().facialTransformationMatrixes.empty());

    ASSERT_EQ(state_->calls(), 1u);
    EXPECT_FALSE(state_->trackingFlags[0]);
    EXPECT_EQ(state_->frameSizes[0], cv::Size(64, 48));
}

TEST_F(FaceLandmarkerTest, OptionalOutputsFollowOptions) {
    options_.outputFaceBlendshapes = true;
    options_.outputFacialTransformationMatrixes = true;
    state_->facesPerFrame = 2;
    options_.numFaces = 2;
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);

    auto result = landmarker->detectImage(makeImage());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().faceLandmarks.size(), 2u);
    EXPECT_EQ(result.value().faceBlendshapes.size(), 2u);
    ASSERT_EQ(result.value().facialTransformationMatrixes.size(), 2u);
    EXPECT_EQ(result.value().facialTransformationMatrixes[0].rows, 4);
}

TEST_F(FaceLandmarkerTest, NoFaceIsNotAnError) {
    state_->facesPerFrame = 0;
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);

    auto result = landmarker->detectImage(makeImage());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().faceLandmarks.empty());
}

TEST_F(FaceLandmarkerTest, DetectImageIsRepeatable) {
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);
    Image image = makeImage();

    auto first = landmarker->detectImage(image);
    auto second = landmarker->detectImage(image);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(toJson(first.value()), toJson(second.value()));
}

TEST_F(FaceLandmarkerTest, WrongModeCallsFail) {
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);

    auto video = landmarker->detectVideoFrame(makeImage(), 0);
    ASSERT_FALSE(video.ok());
    EXPECT_EQ(video.error().code, ErrorCode::InvalidModeError);
    EXPECT_EQ(video.error().message,
              "The vision task is not initialized with video mode. Current Running Mode: Image");

    auto async = landmarker->detectAsync(makeImage(), 0);
    ASSERT_FALSE(async.ok());
    EXPECT_EQ(async.error().code, ErrorCode::InvalidModeError);

    auto videoLandmarker = make(RunningMode::Video);
    ASSERT_NE(videoLandmarker, nullptr);
    auto image = videoLandmarker->detectImage(makeImage());
    ASSERT_FALSE(image.ok());
    EXPECT_EQ(image.error().code, ErrorCode::InvalidModeError);

    EXPECT_EQ(state_->calls(), 0u);
}

TEST_F(FaceLandmarkerTest, InvalidImageIsRejectedBeforeInference) {
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);

    Image gray(cv::Mat(8, 8, CV_8UC1, cv::Scalar(0)), PixelFormat::Gray8, ImageSourceType::PixelBuffer);
    auto result = landmarker->detectImage(gray);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInputError);
    EXPECT_EQ(state_->calls(), 0u);

    // Still usable
    EXPECT_TRUE(landmarker->detectImage(makeImage()).ok());
}

TEST_F(FaceLandmarkerTest, VideoTimestampsMustIncrease) {
    auto landmarker = make(RunningMode::Video);
    ASSERT_NE(landmarker, nullptr);
    Image image = makeImage();

    for (int64_t ts : {0, 33, 66}) {
        auto result = landmarker->detectVideoFrame(image, ts);
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result.value().timestampMs, ts);
    }

    auto stale = landmarker->detectVideoFrame(image, 33);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error().code, ErrorCode::SequencingError);
    EXPECT_EQ(stale.error().message, "Input timestamp must be monotonically increasing.");

    auto repeated = landmarker->detectVideoFrame(image, 66);
    ASSERT_FALSE(repeated.ok());
    EXPECT_EQ(repeated.error().code, ErrorCode::SequencingError);

    EXPECT_EQ(state_->calls(), 3u);
    EXPECT_TRUE(landmarker->detectVideoFrame(image, 100).ok());
    EXPECT_TRUE(state_->trackingFlags.back());
}

TEST_F(FaceLandmarkerTest, RejectedFrameDoesNotConsumeTimestamp) {
    auto landmarker = make(RunningMode::Video);
    ASSERT_NE(landmarker, nullptr);

    Image gray(cv::Mat(8, 8, CV_8UC1, cv::Scalar(0)), PixelFormat::Gray8);
    EXPECT_EQ(landmarker->detectVideoFrame(gray, 10).error().code, ErrorCode::InvalidInputError);
    EXPECT_TRUE(landmarker->detectVideoFrame(makeImage(), 10).ok());
}

TEST_F(FaceLandmarkerTest, EngineFailureLeavesInstanceUsable) {
    auto landmarker = make(RunningMode::Video);
    ASSERT_NE(landmarker, nullptr);

    state_->failure = Error{ErrorCode::InternalError, "session failed"};
    auto failed = landmarker->detectVideoFrame(makeImage(), 1);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::InternalError);

    state_->failure.reset();
    EXPECT_TRUE(landmarker->detectVideoFrame(makeImage(), 2).ok());
}

TEST_F(FaceLandmarkerTest, LandmarksFollowBufferOrientation) {
    auto landmarker = make(RunningMode::Image);
    ASSERT_NE(landmarker, nullptr);

    auto result = landmarker->detectImage(makeImage(64, 48, ImageOrientation::Right));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(state_->frameSizes[0], cv::Size(48, 64));

    // Upright (0.25, 0.75) lands at (v, 1 - u) in a buffer turned clockwise
    const auto& landmark = result.value().faceLandmarks[0][0];
    EXPECT_NEAR(landmark.x, 0.75f, 1e-6f);
    EXPECT_NEAR(landmark.y, 0.75f, 1e-6f);

    auto mirrored = landmarker->detectImage(makeImage(64, 48, ImageOrientation::LeftMirrored));
    ASSERT_FALSE(mirrored.ok());
    EXPECT_EQ(mirrored.error().code, ErrorCode::InvalidInputError);
}

TEST_F(FaceLandmarkerTest, LiveStreamRequiresCallback) {
    options_.runningMode = RunningMode::LiveStream;
    auto landmarker = FaceLandmarker::create(options_, std::make_unique<FakeLandmarkEngine>(state_));
    ASSERT_FALSE(landmarker.ok());
    EXPECT_EQ(landmarker.error().code, ErrorCode::InitializationError);
}

TEST_F(FaceLandmarkerTest, LiveStreamDeliversResultsInOrder) {
    CallbackLog log;
    options_.resultCallback = log.callback();
    auto landmarker = make(RunningMode::LiveStream);
    ASSERT_NE(landmarker, nullptr);

    ASSERT_TRUE(landmarker->detectAsync(makeImage(), 10).ok());
    ASSERT_TRUE(log.waitFor(1));
    ASSERT_TRUE(landmarker->detectAsync(makeImage(32, 16), 20).ok());
    ASSERT_TRUE(log.waitFor(2));

    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_EQ(log.timestamps, (std::vector<int64_t>{10, 20}));
    EXPECT_EQ(log.succeeded, (std::vector<bool>{true, true}));
    EXPECT_EQ(log.imageSizes[1], cv::Size(32, 16));
}

TEST_F(FaceLandmarkerTest, LiveStreamDropsStalePendingFrame) {
    CallbackLog log;
    options_.resultCallback = log.callback();
    auto landmarker = make(RunningMode::LiveStream);
    ASSERT_NE(landmarker, nullptr);

    state_->closeGate();
    ASSERT_TRUE(landmarker->detectAsync(makeImage(), 1).ok());
    ASSERT_TRUE(state_->waitForCalls(1));

    // Frame 2 waits behind frame 1 and is replaced by frame 3
    ASSERT_TRUE(landmarker->detectAsync(makeImage(), 2).ok());
    ASSERT_TRUE(landmarker->detectAsync(makeImage(), 3).ok());
    state_->openGate();

    ASSERT_TRUE(log.waitFor(2));
    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_EQ(log.timestamps, (std::vector<int64_t>{1, 3}));
    EXPECT_EQ(state_->calls(), 2u);
}

TEST_F(FaceLandmarkerTest, LiveStreamChecksTimestampsSynchronously) {
    CallbackLog log;
    options_.resultCallback = log.callback();
    auto landmarker = make(RunningMode::LiveStream);
    ASSERT_NE(landmarker, nullptr);

    ASSERT_TRUE(landmarker->detectAsync(makeImage(), 5).ok());
    auto stale = landmarker->detectAsync(makeImage(), 5);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error().code, ErrorCode::SequencingError);

    auto wrongMode = landmarker->detectVideoFrame(makeImage(), 6);
    EXPECT_EQ(wrongMode.error().code, ErrorCode::InvalidModeError);

    ASSERT_TRUE(log.waitFor(1));
}

TEST_F(FaceLandmarkerTest, LiveStreamReportsEngineErrors) {
    CallbackLog log;
    options_.resultCallback = log.callback();
    state_->failure = Error{ErrorCode::InternalError, "session failed"};
    auto landmarker = make(RunningMode::LiveStream);
    ASSERT_NE(landmarker, nullptr);

    ASSERT_TRUE(landmarker->detectAsync(makeImage(), 1).ok());
    ASSERT_TRUE(log.waitFor(1));
    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_FALSE(log.succeeded[0]);
}

} // namespace testing
} // namespace flm
