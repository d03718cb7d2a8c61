#include "BlendshapesModel.hpp"
#include <iostream>
#include <stdexcept>

namespace flm {

BlendshapesModel::BlendshapesModel() : ONNXInferenceEngine("face_blendshapes") {
}

BlendshapesModel::~BlendshapesModel() {
}

const std::vector<std::string>& BlendshapesModel::categoryNames() {
    static const std::vector<std::string> names = {
        "_neutral", "browDownLeft", "browDownRight", "browInnerUp",
        "browOuterUpLeft", "browOuterUpRight", "cheekPuff", "cheekSquintLeft",
        "cheekSquintRight", "eyeBlinkLeft", "eyeBlinkRight", "eyeLookDownLeft",
        "eyeLookDownRight", "eyeLookInLeft", "eyeLookInRight", "eyeLookOutLeft",
        "eyeLookOutRight", "eyeLookUpLeft", "eyeLookUpRight", "eyeSquintLeft",
        "eyeSquintRight", "eyeWideLeft", "eyeWideRight", "jawForward",
        "jawLeft", "jawOpen", "jawRight", "mouthClose",
        "mouthDimpleLeft", "mouthDimpleRight", "mouthFrownLeft", "mouthFrownRight",
        "mouthFunnel", "mouthLeft", "mouthLowerDownLeft", "mouthLowerDownRight",
        "mouthPressLeft", "mouthPressRight", "mouthPucker", "mouthRight",
        "mouthRollLower", "mouthRollUpper", "mouthShrugLower", "mouthShrugUpper",
        "mouthSmileLeft", "mouthSmileRight", "mouthStretchLeft", "mouthStretchRight",
        "mouthUpperUpLeft", "mouthUpperUpRight", "noseSneerLeft", "noseSneerRight"
    };
    return names;
}

const std::vector<int>& BlendshapesModel::landmarkSubset() {
    static const std::vector<int> indices = {
        0,   1,   4,   5,   6,   7,   8,   10,  13,  14,  17,  21,  33,  37,  39,
        40,  46,  52,  53,  54,  55,  58,  61,  63,  65,  66,  67,  70,  78,  80,
        81,  82,  84,  87,  88,  91,  93,  95,  103, 105, 107, 109, 127, 132, 133,
        136, 144, 145, 146, 148, 149, 150, 152, 153, 154, 155, 157, 158, 159, 160,
        161, 162, 163, 168, 172, 173, 176, 178, 181, 185, 191, 195, 197, 234, 246,
        249, 251, 263, 267, 269, 270, 276, 282, 283, 284, 285, 288, 291, 293, 295,
        296, 297, 300, 308, 310, 311, 312, 314, 317, 318, 321, 323, 324, 332, 334,
        336, 338, 356, 361, 362, 365, 373, 374, 375, 377, 378, 379, 380, 381, 382,
        384, 385, 386, 387, 388, 389, 390, 397, 398, 400, 402, 405, 409, 415, 454,
        466, 468, 469, 470, 471, 472, 473, 474, 475, 476, 477
    };
    return indices;
}

std::vector<float> BlendshapesModel::buildInput(const std::vector<NormalizedLandmark>& landmarks,
                                                const cv::Size& imageSize) {
    const auto& subset = landmarkSubset();
    if (landmarks.size() <= static_cast<size_t>(subset.back())) {
        throw std::invalid_argument("Blendshapes need " + std::to_string(subset.back() + 1) +
                                    " landmarks, got " + std::to_string(landmarks.size()));
    }

    std::vector<float> input;
    input.reserve(subset.size() * 2);
    for (int index : subset) {
        input.push_back(landmarks[index].x * imageSize.width);
        input.push_back(landmarks[index].y * imageSize.height);
    }
    return input;
}

Result<void> BlendshapesModel::loadModel(const std::string& modelPath, const BaseOptions& baseOptions) {
    Result<void> loaded = ONNXInferenceEngine::loadModel(modelPath, baseOptions);
    if (!loaded) {
        return loaded;
    }

    if (output_shapes_.empty() || output_shapes_[0].empty() ||
        output_shapes_[0].back() != static_cast<int64_t>(categoryNames().size())) {
        return Error{ErrorCode::InitializationError,
                     "Blendshapes model must output " + std::to_string(categoryNames().size()) +
                         " scores: " + modelPath};
    }

    std::cout << "Successfully loaded blendshapes model" << std::endl;
    return {};
}

Classifications BlendshapesModel::predict(const std::vector<NormalizedLandmark>& landmarks,
                                          const cv::Size& imageSize) {
    std::vector<float> input = buildInput(landmarks, imageSize);
    std::vector<int64_t> shape = {1, static_cast<int64_t>(landmarkSubset().size()), 2};

    auto outputs = runSingleInput(input, shape);
    if (outputs.empty() || elementCount(outputs[0]) != categoryNames().size()) {
        throw std::runtime_error("Unexpected blendshapes output shape");
    }
    const float* scores = outputs[0].GetTensorData<float>();

    Classifications classifications;
    classifications.headIndex = 0;
    const auto& names = categoryNames();
    for (size_t i = 0; i < names.size(); ++i) {
        Category category;
        category.index = static_cast<int>(i);
        category.score = scores[i];
        category.categoryName = names[i];
        classifications.categories.push_back(category);
    }
    return classifications;
}

} // namespace flm
