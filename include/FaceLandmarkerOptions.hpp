#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "FaceLandmarkerResult.hpp"
#include "Image.hpp"
#include "Status.hpp"

namespace flm {

enum class RunningMode {
    Image,
    Video,
    LiveStream
};

enum class Delegate {
    CPU,
    GPU
};

const char* runningModeName(RunningMode mode);

struct BaseOptions {
    // Model asset directory, or any file inside it.
    std::string modelAssetPath;
    Delegate delegate = Delegate::CPU;
    int numThreads = 1;
};

// Receives live-stream results on the worker thread.
using ResultCallback =
    std::function<void(const Result<FaceLandmarkerResult>& result, const Image& image, int64_t timestampMs)>;

struct FaceLandmarkerOptions {
    BaseOptions baseOptions;
    RunningMode runningMode = RunningMode::Image;

    int numFaces = 1;
    float minFaceDetectionConfidence = 0.5f;
    float minFacePresenceConfidence = 0.5f;
    float minTrackingConfidence = 0.5f;

    bool outputFaceBlendshapes = false;
    bool outputFacialTransformationMatrixes = false;

    // Required in LiveStream mode, must be empty otherwise.
    ResultCallback resultCallback;
};

Result<void> validateOptions(const FaceLandmarkerOptions& options);

// Reads the snake_case keys of a landmarker configuration object.
// Missing keys keep their defaults, unknown keys are ignored.
Result<FaceLandmarkerOptions> loadOptionsFromJson(const nlohmann::json& config);
Result<FaceLandmarkerOptions> loadOptionsFromFile(const std::string& path);

nlohmann::json toJson(const FaceLandmarkerOptions& options);

} // namespace flm
