#pragma once

#include <memory>
#include <string>
#include "FaceLandmarkerOptions.hpp"
#include "LandmarkEngine.hpp"

namespace flm {

// Face detector, face mesh and the optional blendshapes and geometry stages,
// all backed by ONNX Runtime sessions.
class ONNXLandmarkEngine : public LandmarkEngine {
public:
    // Loads the models of the asset directory named by options.baseOptions.
    static Result<std::unique_ptr<LandmarkEngine>> create(const FaceLandmarkerOptions& options);

    ~ONNXLandmarkEngine() override;

    Result<FaceLandmarkerResult> process(const cv::Mat& rgb, bool tracking) override;

private:
    ONNXLandmarkEngine();

    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Directory holding the model files: the path itself, or the parent of a file.
Result<std::string> resolveModelAssetDirectory(const std::string& modelAssetPath);

} // namespace flm
