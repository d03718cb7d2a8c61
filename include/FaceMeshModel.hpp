#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceLandmarkerResult.hpp"
#include "ONNXInferenceEngine.hpp"

namespace flm {

struct FaceMeshOutput {
    // Normalized to the ROI crop
    std::vector<NormalizedLandmark> landmarks;
    float presence = 0.0f;
};

// Landmark count (468 or 478) of a mesh model with these output shapes, 0
// unless the outputs hold a landmark tensor and a single presence score.
int meshLandmarkCount(const std::vector<std::vector<int64_t>>& outputShapes);

// Dense face mesh regressor: 468 landmarks, or 478 with the iris refinement.
class FaceMeshModel : public ONNXInferenceEngine {
public:
    FaceMeshModel();
    ~FaceMeshModel() override;

    Result<void> loadModel(const std::string& modelPath, const BaseOptions& baseOptions) override;

    cv::Size inputSize() const;
    int landmarkCount() const;

    // Runs on an RGB crop of inputSize(). Throws on runtime failures.
    FaceMeshOutput run(const cv::Mat& crop);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace flm
