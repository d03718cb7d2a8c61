#include "FaceLandmarkerOptions.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace flm {

namespace {

bool inUnitRange(float value) {
    return value >= 0.0f && value <= 1.0f;
}

Error configError(const std::string& message) {
    return Error{ErrorCode::InitializationError, message};
}

} // namespace

const char* runningModeName(RunningMode mode) {
    switch (mode) {
        case RunningMode::Image:      return "Image";
        case RunningMode::Video:      return "Video";
        case RunningMode::LiveStream: return "Live Stream";
    }
    return "Unknown";
}

Result<void> validateOptions(const FaceLandmarkerOptions& options) {
    if (options.baseOptions.modelAssetPath.empty()) {
        return configError("Model asset path must not be empty");
    }
    if (options.baseOptions.numThreads < 1) {
        return configError("num_threads must be at least 1");
    }
    if (options.numFaces < 1) {
        return configError("num_faces must be at least 1, got " + std::to_string(options.numFaces));
    }
    if (!inUnitRange(options.minFaceDetectionConfidence)) {
        return configError("min_face_detection_confidence must be in [0, 1]");
    }
    if (!inUnitRange(options.minFacePresenceConfidence)) {
        return configError("min_face_presence_confidence must be in [0, 1]");
    }
    if (!inUnitRange(options.minTrackingConfidence)) {
        return configError("min_tracking_confidence must be in [0, 1]");
    }

    if (options.runningMode == RunningMode::LiveStream) {
        if (!options.resultCallback) {
            return configError("The vision task is in live stream mode. A result callback must be set "
                               "in the task's options to receive results asynchronously.");
        }
    } else if (options.resultCallback) {
        return configError("The vision task is in image or video mode. A result callback must not be set "
                           "in the task's options.");
    }
    return {};
}

Result<FaceLandmarkerOptions> loadOptionsFromJson(const json& config) {
    if (!config.is_object()) {
        return configError("Landmarker configuration must be a JSON object");
    }

    FaceLandmarkerOptions options;
    try {
        options.baseOptions.modelAssetPath = config.value("model_asset_path", std::string());
        options.baseOptions.numThreads = config.value("num_threads", options.baseOptions.numThreads);

        std::string delegate = config.value("delegate", std::string("cpu"));
        if (delegate == "cpu") {
            options.baseOptions.delegate = Delegate::CPU;
        } else if (delegate == "gpu") {
            options.baseOptions.delegate = Delegate::GPU;
        } else {
            return configError("Unknown delegate: " + delegate);
        }

        std::string mode = config.value("running_mode", std::string("image"));
        if (mode == "image") {
            options.runningMode = RunningMode::Image;
        } else if (mode == "video") {
            options.runningMode = RunningMode::Video;
        } else if (mode == "live_stream") {
            options.runningMode = RunningMode::LiveStream;
        } else {
            return configError("Unknown running mode: " + mode);
        }

        options.numFaces = config.value("num_faces", options.numFaces);
        options.minFaceDetectionConfidence =
            config.value("min_face_detection_confidence", options.minFaceDetectionConfidence);
        options.minFacePresenceConfidence =
            config.value("min_face_presence_confidence", options.minFacePresenceConfidence);
        options.minTrackingConfidence =
            config.value("min_tracking_confidence", options.minTrackingConfidence);
        options.outputFaceBlendshapes =
            config.value("output_face_blendshapes", options.outputFaceBlendshapes);
        options.outputFacialTransformationMatrixes =
            config.value("output_facial_transformation_matrixes", options.outputFacialTransformationMatrixes);
    }
    catch (const json::exception& e) {
        return configError(std::string("Invalid landmarker configuration: ") + e.what());
    }

    return options;
}

Result<FaceLandmarkerOptions> loadOptionsFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "Failed to open configuration file: " << path << std::endl;
        return configError("Failed to open configuration file: " + path);
    }

    json config = json::parse(ifs, nullptr, false);
    if (config.is_discarded()) {
        return configError("Configuration file is not valid JSON: " + path);
    }
    return loadOptionsFromJson(config);
}

json toJson(const FaceLandmarkerOptions& options) {
    std::string mode = "image";
    if (options.runningMode == RunningMode::Video) {
        mode = "video";
    } else if (options.runningMode == RunningMode::LiveStream) {
        mode = "live_stream";
    }

    return {
        {"model_asset_path", options.baseOptions.modelAssetPath},
        {"delegate", options.baseOptions.delegate == Delegate::GPU ? "gpu" : "cpu"},
        {"num_threads", options.baseOptions.numThreads},
        {"running_mode", mode},
        {"num_faces", options.numFaces},
        {"min_face_detection_confidence", options.minFaceDetectionConfidence},
        {"min_face_presence_confidence", options.minFacePresenceConfidence},
        {"min_tracking_confidence", options.minTrackingConfidence},
        {"output_face_blendshapes", options.outputFaceBlendshapes},
        {"output_facial_transformation_matrixes", options.outputFacialTransformationMatrixes}
    };
}

} // namespace flm
