#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "FaceLandmarkerOptions.hpp"
#include "FaceLandmarkerResult.hpp"
#include "Image.hpp"
#include "LandmarkEngine.hpp"
#include "Status.hpp"

namespace flm {

// Detects face landmarks in still images, video frames or a live stream.
// Calls on one instance are serialized.
class FaceLandmarker {
public:
    // Image mode with default options
    static Result<std::unique_ptr<FaceLandmarker>> create(const std::string& modelPath);

    static Result<std::unique_ptr<FaceLandmarker>> create(const FaceLandmarkerOptions& options);

    // Uses the given engine instead of loading the ONNX models
    static Result<std::unique_ptr<FaceLandmarker>> create(const FaceLandmarkerOptions& options,
                                                          std::unique_ptr<LandmarkEngine> engine);

    ~FaceLandmarker();

    FaceLandmarker(const FaceLandmarker&) = delete;
    FaceLandmarker& operator=(const FaceLandmarker&) = delete;

    // Image mode. Each call is independent of the previous ones.
    Result<FaceLandmarkerResult> detectImage(const Image& image);

    // Video mode. Timestamps must increase strictly from call to call.
    Result<FaceLandmarkerResult> detectVideoFrame(const Image& image, int64_t timestampMs);

    // Live stream mode. Returns once the frame is queued; the result is passed
    // to the options' callback. A queued frame not yet started is replaced by
    // the next one.
    Result<void> detectAsync(const Image& image, int64_t timestampMs);

    const FaceLandmarkerOptions& options() const;

private:
    class Impl;
    explicit FaceLandmarker(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pImpl_;
};

} // namespace flm
