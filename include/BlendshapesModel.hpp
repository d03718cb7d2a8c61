#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceLandmarkerResult.hpp"
#include "ONNXInferenceEngine.hpp"

namespace flm {

// Scores the 52 blendshape coefficients of a face from a subset of its
// 478 mesh landmarks.
class BlendshapesModel : public ONNXInferenceEngine {
public:
    BlendshapesModel();
    ~BlendshapesModel() override;

    Result<void> loadModel(const std::string& modelPath, const BaseOptions& baseOptions) override;

    // Landmarks normalized to an image of imageSize. Throws on runtime failures.
    Classifications predict(const std::vector<NormalizedLandmark>& landmarks, const cv::Size& imageSize);

    // Blendshape names in model output order
    static const std::vector<std::string>& categoryNames();

    // Mesh landmark indices fed to the model
    static const std::vector<int>& landmarkSubset();

    // [landmarkSubset().size(), 2] input in pixel units
    static std::vector<float> buildInput(const std::vector<NormalizedLandmark>& landmarks,
                                         const cv::Size& imageSize);
};

} // namespace flm
