#include "ONNXInferenceEngine.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace flm {

ONNXInferenceEngine::ONNXInferenceEngine(const std::string& name)
    : name_(name),
      env_(std::make_shared<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, name.c_str())),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
}

ONNXInferenceEngine::~ONNXInferenceEngine() = default;

Result<void> ONNXInferenceEngine::loadModel(const std::string& modelPath, const BaseOptions& baseOptions) {
    if (!fs::is_regular_file(modelPath)) {
        std::cerr << "Model file not found: " << modelPath << std::endl;
        return Error{ErrorCode::InitializationError, "Model file not found: " + modelPath};
    }

    try {
        auto sessionOptions = createSessionOptions(baseOptions);

        // Create session
        session_ = std::make_unique<Ort::Session>(*env_, modelPath.c_str(), sessionOptions);

        // Extract input/output node information
        getModelInfo();

        std::cout << "Loaded " << name_ << " model from " << modelPath
                  << " (" << input_names_.size() << " inputs, " << output_names_.size() << " outputs)" << std::endl;
        return {};
    }
    catch (const Ort::Exception& e) {
        std::cerr << "ONNX Runtime error during model loading: " << e.what() << std::endl;
        session_.reset();
        return Error{ErrorCode::InitializationError,
                     "Failed to load " + name_ + " model " + modelPath + ": " + e.what()};
    }
    catch (const std::exception& e) {
        std::cerr << "Error loading ONNX model: " << e.what() << std::endl;
        session_.reset();
        return Error{ErrorCode::InitializationError,
                     "Failed to load " + name_ + " model " + modelPath + ": " + e.what()};
    }
}

Ort::SessionOptions ONNXInferenceEngine::createSessionOptions(const BaseOptions& baseOptions) {
    Ort::SessionOptions sessionOptions;
    sessionOptions.SetIntraOpNumThreads(baseOptions.numThreads);
    sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    if (baseOptions.delegate == Delegate::GPU && isGPUAvailable()) {
        // Use CUDA provider if available
        OrtCUDAProviderOptions cuda_options;
        sessionOptions.AppendExecutionProvider_CUDA(cuda_options);
        using_cuda_ = true;
        std::cout << "Using CUDA provider for " << name_ << std::endl;
    } else {
        if (baseOptions.delegate == Delegate::GPU) {
            std::cout << "CUDA provider not available for " << name_ << ", falling back to CPU" << std::endl;
        }
        using_cuda_ = false;
    }

    return sessionOptions;
}

bool ONNXInferenceEngine::isGPUAvailable() const {
    // Check if CUDA provider is available in this build
    try {
        auto providers = Ort::GetAvailableProviders();
        for (const auto& provider : providers) {
            if (provider == "CUDAExecutionProvider") {
                return true;
            }
        }
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "Error checking CUDA availability: " << e.what() << std::endl;
        return false;
    }
}

std::vector<Ort::Value> ONNXInferenceEngine::runSingleInput(std::vector<float>& input,
                                                            const std::vector<int64_t>& shape) {
    if (!session_) {
        throw std::runtime_error(name_ + " session not initialized");
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info_,
        input.data(),
        input.size(),
        shape.data(),
        shape.size()
    );

    auto inputNames = getInputNames();
    auto outputNames = getOutputNames();
    return session_->Run(
        Ort::RunOptions{nullptr},
        inputNames.data(),
        &input_tensor,
        1,
        outputNames.data(),
        outputNames.size()
    );
}

std::vector<int64_t> ONNXInferenceEngine::resolvedInputShape(size_t index) const {
    if (index >= input_shapes_.size()) {
        return {};
    }
    return resolveDynamicDimensions(input_shapes_[index]);
}

namespace {

bool isChannelsFirst(const std::vector<int64_t>& shape) {
    return shape.size() == 4 && shape[1] == 3 && shape[3] != 3;
}

} // namespace

cv::Size ONNXInferenceEngine::inputImageSize(size_t index) const {
    std::vector<int64_t> shape = resolvedInputShape(index);
    if (shape.size() != 4) {
        return cv::Size();
    }
    if (isChannelsFirst(shape)) {
        return cv::Size(static_cast<int>(shape[3]), static_cast<int>(shape[2]));
    }
    return cv::Size(static_cast<int>(shape[2]), static_cast<int>(shape[1]));
}

std::vector<float> ONNXInferenceEngine::imageToTensor(const cv::Mat& rgb, float scale, float offset,
                                                      size_t index) const {
    cv::Mat floatImage;
    rgb.convertTo(floatImage, CV_32FC3, scale, offset);
    if (!floatImage.isContinuous()) {
        floatImage = floatImage.clone();
    }

    const size_t hw = static_cast<size_t>(rgb.rows) * rgb.cols;
    std::vector<float> tensor(hw * 3);

    if (!isChannelsFirst(resolvedInputShape(index))) {
        const float* data = floatImage.ptr<float>();
        std::copy(data, data + hw * 3, tensor.begin());
        return tensor;
    }

    // HWC to CHW conversion
    std::vector<cv::Mat> channels(3);
    cv::split(floatImage, channels);
    for (int c = 0; c < 3; c++) {
        const float* data = channels[c].ptr<float>();
        std::copy(data, data + hw, tensor.begin() + c * hw);
    }
    return tensor;
}

void ONNXInferenceEngine::getModelInfo() {
    if (!session_) {
        throw std::runtime_error("Session not initialized");
    }

    Ort::AllocatorWithDefaultOptions allocator;

    // Get input info
    size_t num_input_nodes = session_->GetInputCount();
    input_names_.resize(num_input_nodes);
    input_shapes_.resize(num_input_nodes);

    for (size_t i = 0; i < num_input_nodes; i++) {
        auto input_name = session_->GetInputNameAllocated(i, allocator);
        input_names_[i] = input_name.get();

        auto type_info = session_->GetInputTypeInfo(i);
        auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
        input_shapes_[i] = tensor_info.GetShape();
    }

    // Get output info
    size_t num_output_nodes = session_->GetOutputCount();
    output_names_.resize(num_output_nodes);
    output_shapes_.resize(num_output_nodes);

    for (size_t i = 0; i < num_output_nodes; i++) {
        auto output_name = session_->GetOutputNameAllocated(i, allocator);
        output_names_[i] = output_name.get();

        auto type_info = session_->GetOutputTypeInfo(i);
        auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
        output_shapes_[i] = tensor_info.GetShape();
    }
}

std::vector<const char*> ONNXInferenceEngine::getInputNames() const {
    std::vector<const char*> result;
    result.reserve(input_names_.size());
    for (const auto& name : input_names_) {
        result.push_back(name.c_str());
    }
    return result;
}

std::vector<const char*> ONNXInferenceEngine::getOutputNames() const {
    std::vector<const char*> result;
    result.reserve(output_names_.size());
    for (const auto& name : output_names_) {
        result.push_back(name.c_str());
    }
    return result;
}

size_t elementCount(const Ort::Value& value) {
    return value.GetTensorTypeAndShapeInfo().GetElementCount();
}

std::vector<int64_t> resolveDynamicDimensions(std::vector<int64_t> shape) {
    for (auto& dim : shape) {
        if (dim < 0) {
            dim = 1;
        }
    }
    return shape;
}

int64_t shapeElementCount(const std::vector<int64_t>& shape) {
    int64_t count = 1;
    for (int64_t dim : resolveDynamicDimensions(shape)) {
        count *= dim;
    }
    return count;
}

} // namespace flm
