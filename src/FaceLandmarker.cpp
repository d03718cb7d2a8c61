#include "FaceLandmarker.hpp"
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include "ONNXLandmarkEngine.hpp"
#include "VisionTaskRunner.hpp"

namespace flm {

namespace {

struct PendingFrame {
    Image image;
    cv::Mat rgb;
    int64_t timestampMs;
};

} // namespace

class FaceLandmarker::Impl {
public:
    Impl(const FaceLandmarkerOptions& opts, std::unique_ptr<LandmarkEngine> eng)
        : options(opts), engine(std::move(eng)), runner(opts.runningMode) {}

    ~Impl() {
        stop();
    }

    void start();
    void stop();
    void workerThread();

    // Runs the engine and shapes its output for the caller's buffer
    Result<FaceLandmarkerResult> infer(const cv::Mat& rgb, const Image& image, bool tracking, int64_t timestampMs);

    FaceLandmarkerOptions options;
    std::unique_ptr<LandmarkEngine> engine;
    VisionTaskRunner runner;

    // Serializes the public entry points
    std::mutex callMutex;

    // Live stream worker
    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::optional<PendingFrame> pending;
    bool stopping = false;
    std::thread worker;
};

void FaceLandmarker::Impl::start() {
    worker = std::thread(&FaceLandmarker::Impl::workerThread, this);
}

void FaceLandmarker::Impl::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopping = true;
        pending.reset();
    }
    queueCv.notify_all();

    if (worker.joinable()) worker.join();
}

void FaceLandmarker::Impl::workerThread() {
    while (true) {
        PendingFrame frame{Image(cv::Mat(), PixelFormat::RGBA32), cv::Mat(), 0};

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCv.wait(lock, [this] { return pending.has_value() || stopping; });

            if (stopping) break;

            frame = std::move(*pending);
            pending.reset();
        }

        auto result = infer(frame.rgb, frame.image, true, frame.timestampMs);
        try {
            options.resultCallback(result, frame.image, frame.timestampMs);
        } catch (const std::exception& e) {
            std::cerr << "Result callback threw at timestamp " << frame.timestampMs << ": " << e.what()
                      << std::endl;
        }
    }
}

Result<FaceLandmarkerResult> FaceLandmarker::Impl::infer(const cv::Mat& rgb, const Image& image,
                                                         bool tracking, int64_t timestampMs) {
    Result<FaceLandmarkerResult> processed = Error{ErrorCode::InternalError, "Engine did not run"};
    try {
        processed = engine->process(rgb, tracking);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Landmark engine failed: ") + e.what()};
    }
    if (!processed) {
        return processed;
    }

    FaceLandmarkerResult result = std::move(processed).value();
    for (auto& landmarks : result.faceLandmarks) {
        VisionTaskRunner::mapToBuffer(landmarks, image.orientation(), image.pixels().size());
    }
    if (!options.outputFaceBlendshapes) {
        result.faceBlendshapes.clear();
    }
    if (!options.outputFacialTransformationMatrixes) {
        result.facialTransformationMatrixes.clear();
    }
    result.timestampMs = timestampMs;
    return result;
}

FaceLandmarker::FaceLandmarker(std::unique_ptr<Impl> impl) : pImpl_(std::move(impl)) {}

FaceLandmarker::~FaceLandmarker() = default;

Result<std::unique_ptr<FaceLandmarker>> FaceLandmarker::create(const std::string& modelPath) {
    FaceLandmarkerOptions options;
    options.baseOptions.modelAssetPath = modelPath;
    options.runningMode = RunningMode::Image;
    return create(options);
}

Result<std::unique_ptr<FaceLandmarker>> FaceLandmarker::create(const FaceLandmarkerOptions& options) {
    auto valid = validateOptions(options);
    if (!valid) {
        return valid.error();
    }

    auto engine = ONNXLandmarkEngine::create(options);
    if (!engine) {
        std::cerr << "Failed to create face landmarker: " << engine.error().toString() << std::endl;
        return engine.error();
    }
    return create(options, std::move(engine).value());
}

Result<std::unique_ptr<FaceLandmarker>> FaceLandmarker::create(const FaceLandmarkerOptions& options,
                                                               std::unique_ptr<LandmarkEngine> engine) {
    auto valid = validateOptions(options);
    if (!valid) {
        return valid.error();
    }
    if (!engine) {
        return Error{ErrorCode::InitializationError, "Landmark engine must not be null"};
    }

    auto impl = std::make_unique<Impl>(options, std::move(engine));
    if (options.runningMode == RunningMode::LiveStream) {
        impl->start();
    }

    std::cout << "Face landmarker created in " << runningModeName(options.runningMode)
              << " mode, up to " << options.numFaces << " face(s)" << std::endl;
    return std::unique_ptr<FaceLandmarker>(new FaceLandmarker(std::move(impl)));
}

Result<FaceLandmarkerResult> FaceLandmarker::detectImage(const Image& image) {
    std::lock_guard<std::mutex> lock(pImpl_->callMutex);

    auto mode = pImpl_->runner.checkMode(RunningMode::Image);
    if (!mode) {
        return mode.error();
    }
    auto rgb = VisionTaskRunner::prepareImage(image);
    if (!rgb) {
        return rgb.error();
    }
    return pImpl_->infer(rgb.value(), image, false, 0);
}

Result<FaceLandmarkerResult> FaceLandmarker::detectVideoFrame(const Image& image, int64_t timestampMs) {
    std::lock_guard<std::mutex> lock(pImpl_->callMutex);

    auto mode = pImpl_->runner.checkMode(RunningMode::Video);
    if (!mode) {
        return mode.error();
    }
    auto sequenced = pImpl_->runner.checkTimestamp(timestampMs);
    if (!sequenced) {
        return sequenced.error();
    }
    auto rgb = VisionTaskRunner::prepareImage(image);
    if (!rgb) {
        return rgb.error();
    }
    pImpl_->runner.acceptTimestamp(timestampMs);

    return pImpl_->infer(rgb.value(), image, true, timestampMs);
}

Result<void> FaceLandmarker::detectAsync(const Image& image, int64_t timestampMs) {
    std::lock_guard<std::mutex> lock(pImpl_->callMutex);

    auto mode = pImpl_->runner.checkMode(RunningMode::LiveStream);
    if (!mode) {
        return mode.error();
    }
    auto sequenced = pImpl_->runner.checkTimestamp(timestampMs);
    if (!sequenced) {
        return sequenced.error();
    }
    auto rgb = VisionTaskRunner::prepareImage(image);
    if (!rgb) {
        return rgb.error();
    }
    pImpl_->runner.acceptTimestamp(timestampMs);

    {
        std::lock_guard<std::mutex> queueLock(pImpl_->queueMutex);
        if (pImpl_->pending) {
            std::cout << "Dropping live stream frame at " << pImpl_->pending->timestampMs << " ms" << std::endl;
        }
        pImpl_->pending = PendingFrame{image.clone(), std::move(rgb).value(), timestampMs};
    }
    pImpl_->queueCv.notify_one();
    return {};
}

const FaceLandmarkerOptions& FaceLandmarker::options() const {
    return pImpl_->options;
}

} // namespace flm
