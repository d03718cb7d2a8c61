#pragma once

#include <opencv2/core.hpp>
#include "FaceLandmarkerResult.hpp"
#include "Status.hpp"

namespace flm {

// Runs the landmark pipeline on one upright frame.
class LandmarkEngine {
public:
    virtual ~LandmarkEngine() = default;

    // rgb is an upright 8-bit RGB image. Landmarks come back normalized to it.
    // With tracking set, faces found on the previous call seed this one.
    virtual Result<FaceLandmarkerResult> process(const cv::Mat& rgb, bool tracking) = 0;
};

} // namespace flm
