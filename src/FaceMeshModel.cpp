#include "FaceMeshModel.hpp"
#include <cmath>
#include <iostream>

namespace flm {

namespace {

constexpr int kMeshLandmarks = 468;
constexpr int kMeshWithIrisLandmarks = 478;

} // namespace

int meshLandmarkCount(const std::vector<std::vector<int64_t>>& outputShapes) {
    int numLandmarks = 0;
    bool hasPresence = false;
    for (const auto& shape : outputShapes) {
        int64_t count = shapeElementCount(shape);
        if (count == kMeshLandmarks * 3 || count == kMeshWithIrisLandmarks * 3) {
            numLandmarks = static_cast<int>(count / 3);
        } else if (count == 1) {
            hasPresence = true;
        }
    }
    return hasPresence ? numLandmarks : 0;
}

class FaceMeshModel::Impl {
public:
    cv::Size inputSize{192, 192};
    int numLandmarks = kMeshWithIrisLandmarks;
};

FaceMeshModel::FaceMeshModel()
    : ONNXInferenceEngine("face_landmarks_detector"), pImpl_(std::make_unique<Impl>()) {}

FaceMeshModel::~FaceMeshModel() = default;

Result<void> FaceMeshModel::loadModel(const std::string& modelPath, const BaseOptions& baseOptions) {
    Result<void> loaded = ONNXInferenceEngine::loadModel(modelPath, baseOptions);
    if (!loaded) {
        return loaded;
    }

    cv::Size inputSize = inputImageSize();
    if (inputSize.empty()) {
        return Error{ErrorCode::InitializationError,
                     "Face landmarks detector must take a 4D image input: " + modelPath};
    }
    pImpl_->inputSize = inputSize;

    int numLandmarks = meshLandmarkCount(output_shapes_);
    if (numLandmarks == 0) {
        return Error{ErrorCode::InitializationError,
                     "Face landmarks detector must output 468 or 478 landmarks and a presence score: " + modelPath};
    }
    pImpl_->numLandmarks = numLandmarks;

    std::cout << "Face landmarks detector input " << inputSize.width << "x" << inputSize.height
              << ", " << pImpl_->numLandmarks << " landmarks" << std::endl;
    return {};
}

cv::Size FaceMeshModel::inputSize() const {
    return pImpl_->inputSize;
}

int FaceMeshModel::landmarkCount() const {
    return pImpl_->numLandmarks;
}

FaceMeshOutput FaceMeshModel::run(const cv::Mat& crop) {
    if (!isLoaded()) {
        throw std::runtime_error("Face landmarks detector not loaded");
    }

    // Input range [0, 1]
    std::vector<float> input = imageToTensor(crop, 1.0f / 255.0f, 0.0f);
    auto outputs = runSingleInput(input, resolvedInputShape());

    const size_t landmarkValues = static_cast<size_t>(pImpl_->numLandmarks) * 3;
    const float* rawLandmarks = nullptr;
    const float* rawPresence = nullptr;
    for (auto& output : outputs) {
        size_t count = elementCount(output);
        if (count == landmarkValues) {
            rawLandmarks = output.GetTensorData<float>();
        } else if (count == 1 && !rawPresence) {
            rawPresence = output.GetTensorData<float>();
        }
    }
    if (!rawLandmarks || !rawPresence) {
        throw std::runtime_error("Unexpected face landmarks detector output shapes");
    }

    FaceMeshOutput result;
    result.presence = 1.0f / (1.0f + std::exp(-rawPresence[0]));
    result.landmarks.resize(pImpl_->numLandmarks);

    const float width = static_cast<float>(pImpl_->inputSize.width);
    const float height = static_cast<float>(pImpl_->inputSize.height);
    for (int i = 0; i < pImpl_->numLandmarks; ++i) {
        result.landmarks[i].x = rawLandmarks[i * 3] / width;
        result.landmarks[i].y = rawLandmarks[i * 3 + 1] / height;
        result.landmarks[i].z = rawLandmarks[i * 3 + 2] / width;
    }
    return result;
}

} // namespace flm
