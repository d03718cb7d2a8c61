#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceRoi.hpp"
#include "ONNXInferenceEngine.hpp"

namespace flm {

struct SsdAnchor {
    float xCenter;
    float yCenter;
    float width;
    float height;
};

// Letterbox placement of the source image inside the model input, in input pixels
struct LetterboxInfo {
    float scale = 1.0f;
    float padX = 0.0f;
    float padY = 0.0f;
};

// Anchors of the short-range BlazeFace detector: 128x128 input, strides
// 8/16/16/16, fixed anchor size. 896 anchors in total.
std::vector<SsdAnchor> generateFaceDetectionAnchors(int inputSize = 128);

// Decodes raw regressors ([numAnchors, 16]) and score logits ([numAnchors])
// into detections normalized to the model input.
std::vector<FaceDetection> decodeFaceDetections(const float* rawBoxes,
                                                const float* rawScores,
                                                const std::vector<SsdAnchor>& anchors,
                                                float minScore,
                                                int inputSize = 128);

// Weighted non-maximum suppression, highest score first. Boxes and keypoints
// of the suppressed detections are averaged into the kept one by score.
std::vector<FaceDetection> suppressOverlapping(std::vector<FaceDetection> detections,
                                               float iouThreshold,
                                               int maxDetections);

// Resizes src into a target-size canvas keeping the aspect ratio
LetterboxInfo letterbox(const cv::Mat& src, cv::Mat& dst, const cv::Size& target);

// Maps a detection from the letterboxed input back to the source image
void removeLetterbox(FaceDetection& detection, const LetterboxInfo& info,
                     const cv::Size& inputSize, const cv::Size& imageSize);

class FaceDetectionModel : public ONNXInferenceEngine {
public:
    FaceDetectionModel();
    ~FaceDetectionModel() override;

    Result<void> loadModel(const std::string& modelPath, const BaseOptions& baseOptions) override;

    // Detects faces in an upright RGB image. Throws on runtime failures.
    std::vector<FaceDetection> detect(const cv::Mat& rgb, float minScore, int maxFaces);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace flm
