#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flm {

// x and y are normalized to [0, 1] by the image width and height.
// z uses the same scale as x, smaller is closer to the camera.
struct NormalizedLandmark {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    std::optional<float> visibility;
    std::optional<float> presence;
};

struct Category {
    int index = 0;
    float score = 0.0f;
    std::string categoryName;
    std::string displayName;
};

struct Classifications {
    int headIndex = 0;
    std::string headName;
    std::vector<Category> categories;
};

// Row-major matrix.
struct TransformMatrix {
    int rows = 0;
    int columns = 0;
    std::vector<float> data;

    float at(int row, int column) const { return data[row * columns + column]; }
};

struct FaceLandmarkerResult {
    std::vector<std::vector<NormalizedLandmark>> faceLandmarks;
    std::vector<Classifications> faceBlendshapes;
    std::vector<TransformMatrix> facialTransformationMatrixes;
    int64_t timestampMs = 0;
};

nlohmann::json toJson(const NormalizedLandmark& landmark);
nlohmann::json toJson(const Classifications& classifications);
nlohmann::json toJson(const TransformMatrix& matrix);
nlohmann::json toJson(const FaceLandmarkerResult& result);

} // namespace flm
