#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceLandmarkerOptions.hpp"
#include "FaceLandmarkerResult.hpp"
#include "Image.hpp"
#include "Status.hpp"

namespace flm {

// Running-mode and timestamp bookkeeping shared by the detection entry points,
// plus the conversion between caller buffers and upright RGB frames.
class VisionTaskRunner {
public:
    explicit VisionTaskRunner(RunningMode mode);

    RunningMode runningMode() const { return mode_; }

    Result<void> checkMode(RunningMode expected) const;

    // Fails unless timestampMs is greater than the last accepted one.
    Result<void> checkTimestamp(int64_t timestampMs) const;
    void acceptTimestamp(int64_t timestampMs);

    // Validates the image and returns it upright as 8-bit RGB.
    static Result<cv::Mat> prepareImage(const Image& image);

    // Maps landmarks normalized to the upright frame back to the stored buffer.
    static void mapToBuffer(std::vector<NormalizedLandmark>& landmarks,
                            ImageOrientation orientation,
                            const cv::Size& bufferSize);

private:
    RunningMode mode_;
    std::optional<int64_t> lastTimestampMs_;
};

} // namespace flm
