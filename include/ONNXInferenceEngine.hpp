#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <onnxruntime_cxx_api.h>
#include "FaceLandmarkerOptions.hpp"
#include "Status.hpp"

namespace flm {

// Base class for the ONNX models of the landmarker pipeline
class ONNXInferenceEngine {
public:
    explicit ONNXInferenceEngine(const std::string& name);
    virtual ~ONNXInferenceEngine();

    ONNXInferenceEngine(const ONNXInferenceEngine&) = delete;
    ONNXInferenceEngine& operator=(const ONNXInferenceEngine&) = delete;

    // Initialize and load an ONNX model
    virtual Result<void> loadModel(const std::string& modelPath, const BaseOptions& baseOptions);

    // Get inference session options (CPU/GPU)
    Ort::SessionOptions createSessionOptions(const BaseOptions& baseOptions);

    // Check if GPU is available
    bool isGPUAvailable() const;

    bool isLoaded() const { return session_ != nullptr; }
    bool usingCUDA() const { return using_cuda_; }
    const std::string& name() const { return name_; }

protected:
    // Runs the session on a single float input tensor
    std::vector<Ort::Value> runSingleInput(std::vector<float>& input, const std::vector<int64_t>& shape);

    // Input shape with dynamic dimensions replaced by 1
    std::vector<int64_t> resolvedInputShape(size_t index = 0) const;

    // Spatial size of a 4D image input, NHWC or NCHW
    cv::Size inputImageSize(size_t index = 0) const;

    // Converts an 8-bit RGB image of the input size to a float tensor laid out
    // like the model input, each value mapped to pixel * scale + offset
    std::vector<float> imageToTensor(const cv::Mat& rgb, float scale, float offset, size_t index = 0) const;

    std::string name_;

    // ONNX Runtime environment
    std::shared_ptr<Ort::Env> env_;

    // ONNX Runtime session
    std::unique_ptr<Ort::Session> session_;

    // ONNX Runtime memory info
    Ort::MemoryInfo memory_info_{nullptr};

    // Model input/output names
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;

    // Model input/output shapes
    std::vector<std::vector<int64_t>> input_shapes_;
    std::vector<std::vector<int64_t>> output_shapes_;

    // Flag indicating if model is using GPU
    bool using_cuda_ = false;

    // Extract input/output node information
    void getModelInfo();

    // Convert names to Ort format
    std::vector<const char*> getInputNames() const;
    std::vector<const char*> getOutputNames() const;
};

// Number of elements of a tensor value
size_t elementCount(const Ort::Value& value);

// Shape with dynamic dimensions replaced by 1
std::vector<int64_t> resolveDynamicDimensions(std::vector<int64_t> shape);

// Number of elements of a model shape, dynamic dimensions counted as 1
int64_t shapeElementCount(const std::vector<int64_t>& shape);

} // namespace flm
