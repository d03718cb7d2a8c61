#include "FaceDetectionModel.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

namespace flm {

namespace {

constexpr int kNumCoords = 16;
constexpr int kNumKeypoints = 6;
constexpr float kScoreClippingThreshold = 100.0f;
constexpr float kMinSuppressionThreshold = 0.3f;

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

} // namespace

std::vector<SsdAnchor> generateFaceDetectionAnchors(int inputSize) {
    const std::vector<int> strides = {8, 16, 16, 16};
    const float anchorOffset = 0.5f;

    std::vector<SsdAnchor> anchors;
    size_t layer = 0;
    while (layer < strides.size()) {
        // Consecutive layers with the same stride share one feature map
        size_t last = layer;
        int anchorsPerCell = 0;
        while (last < strides.size() && strides[last] == strides[layer]) {
            // Aspect ratio 1.0 plus the interpolated scale
            anchorsPerCell += 2;
            ++last;
        }

        int featureMapSize = static_cast<int>(std::ceil(static_cast<float>(inputSize) / strides[layer]));
        for (int y = 0; y < featureMapSize; ++y) {
            for (int x = 0; x < featureMapSize; ++x) {
                for (int n = 0; n < anchorsPerCell; ++n) {
                    SsdAnchor anchor;
                    anchor.xCenter = (x + anchorOffset) / featureMapSize;
                    anchor.yCenter = (y + anchorOffset) / featureMapSize;
                    anchor.width = 1.0f;
                    anchor.height = 1.0f;
                    anchors.push_back(anchor);
                }
            }
        }
        layer = last;
    }
    return anchors;
}

std::vector<FaceDetection> decodeFaceDetections(const float* rawBoxes,
                                                const float* rawScores,
                                                const std::vector<SsdAnchor>& anchors,
                                                float minScore,
                                                int inputSize) {
    std::vector<FaceDetection> detections;
    const float scale = static_cast<float>(inputSize);

    for (size_t i = 0; i < anchors.size(); ++i) {
        float logit = std::clamp(rawScores[i], -kScoreClippingThreshold, kScoreClippingThreshold);
        float score = sigmoid(logit);
        if (score < minScore) {
            continue;
        }

        const SsdAnchor& anchor = anchors[i];
        const float* raw = rawBoxes + i * kNumCoords;

        float xCenter = raw[0] / scale * anchor.width + anchor.xCenter;
        float yCenter = raw[1] / scale * anchor.height + anchor.yCenter;
        float width = raw[2] / scale * anchor.width;
        float height = raw[3] / scale * anchor.height;
        if (width <= 0.0f || height <= 0.0f) {
            continue;
        }

        FaceDetection detection;
        detection.score = score;
        detection.box = cv::Rect2f(xCenter - width / 2.0f, yCenter - height / 2.0f, width, height);
        for (int k = 0; k < kNumKeypoints; ++k) {
            float kx = raw[4 + 2 * k] / scale * anchor.width + anchor.xCenter;
            float ky = raw[4 + 2 * k + 1] / scale * anchor.height + anchor.yCenter;
            detection.keypoints.emplace_back(kx, ky);
        }
        detections.push_back(detection);
    }
    return detections;
}

std::vector<FaceDetection> suppressOverlapping(std::vector<FaceDetection> detections,
                                               float iouThreshold,
                                               int maxDetections) {
    // Create index array sorted by score
    std::vector<size_t> sortedIndices(detections.size());
    std::iota(sortedIndices.begin(), sortedIndices.end(), 0);
    std::sort(sortedIndices.begin(), sortedIndices.end(),
              [&detections](size_t a, size_t b) { return detections[a].score > detections[b].score; });

    std::vector<bool> suppressed(detections.size(), false);
    std::vector<FaceDetection> kept;

    for (size_t i = 0; i < sortedIndices.size(); ++i) {
        size_t idx = sortedIndices[i];
        if (suppressed[idx]) {
            continue;
        }
        if (maxDetections > 0 && static_cast<int>(kept.size()) >= maxDetections) {
            break;
        }
        const FaceDetection& best = detections[idx];

        // Suppress boxes with sufficient overlap and blend them into the best one
        float totalScore = best.score;
        float keypointScore = best.score;
        cv::Point2f topLeft = best.box.tl() * best.score;
        cv::Point2f bottomRight = best.box.br() * best.score;
        std::vector<cv::Point2f> keypoints;
        for (const auto& point : best.keypoints) {
            keypoints.push_back(point * best.score);
        }

        for (size_t j = i + 1; j < sortedIndices.size(); ++j) {
            size_t other = sortedIndices[j];
            if (suppressed[other] || boxIoU(best.box, detections[other].box) <= iouThreshold) {
                continue;
            }
            suppressed[other] = true;

            const FaceDetection& member = detections[other];
            totalScore += member.score;
            topLeft += member.box.tl() * member.score;
            bottomRight += member.box.br() * member.score;
            if (member.keypoints.size() == keypoints.size()) {
                keypointScore += member.score;
                for (size_t k = 0; k < keypoints.size(); ++k) {
                    keypoints[k] += member.keypoints[k] * member.score;
                }
            }
        }

        FaceDetection blended = best;
        if (totalScore > 0.0f) {
            blended.box = cv::Rect2f(topLeft / totalScore, bottomRight / totalScore);
            for (size_t k = 0; k < keypoints.size(); ++k) {
                blended.keypoints[k] = keypoints[k] / keypointScore;
            }
        }
        kept.push_back(blended);
    }
    return kept;
}

LetterboxInfo letterbox(const cv::Mat& src, cv::Mat& dst, const cv::Size& target) {
    LetterboxInfo info;
    info.scale = std::min(static_cast<float>(target.height) / src.rows,
                          static_cast<float>(target.width) / src.cols);

    int newW = std::max(1, static_cast<int>(std::round(src.cols * info.scale)));
    int newH = std::max(1, static_cast<int>(std::round(src.rows * info.scale)));
    newW = std::min(newW, target.width);
    newH = std::min(newH, target.height);

    int padX = (target.width - newW) / 2;
    int padY = (target.height - newH) / 2;
    info.padX = static_cast<float>(padX);
    info.padY = static_cast<float>(padY);

    dst.create(target, src.type());
    dst.setTo(cv::Scalar::all(0));

    cv::Mat roi = dst(cv::Rect(padX, padY, newW, newH));
    cv::resize(src, roi, roi.size(), 0, 0, cv::INTER_LINEAR);
    return info;
}

void removeLetterbox(FaceDetection& detection, const LetterboxInfo& info,
                     const cv::Size& inputSize, const cv::Size& imageSize) {
    auto mapX = [&](float x) { return (x * inputSize.width - info.padX) / info.scale / imageSize.width; };
    auto mapY = [&](float y) { return (y * inputSize.height - info.padY) / info.scale / imageSize.height; };

    float x = mapX(detection.box.x);
    float y = mapY(detection.box.y);
    float width = detection.box.width * inputSize.width / info.scale / imageSize.width;
    float height = detection.box.height * inputSize.height / info.scale / imageSize.height;
    detection.box = cv::Rect2f(x, y, width, height);

    for (auto& keypoint : detection.keypoints) {
        keypoint = cv::Point2f(mapX(keypoint.x), mapY(keypoint.y));
    }
}

class FaceDetectionModel::Impl {
public:
    std::vector<SsdAnchor> anchors;
    cv::Size inputSize{128, 128};
};

FaceDetectionModel::FaceDetectionModel()
    : ONNXInferenceEngine("face_detector"), pImpl_(std::make_unique<Impl>()) {}

FaceDetectionModel::~FaceDetectionModel() = default;

Result<void> FaceDetectionModel::loadModel(const std::string& modelPath, const BaseOptions& baseOptions) {
    Result<void> loaded = ONNXInferenceEngine::loadModel(modelPath, baseOptions);
    if (!loaded) {
        return loaded;
    }

    cv::Size inputSize = inputImageSize();
    if (inputSize.empty() || inputSize.width != inputSize.height) {
        return Error{ErrorCode::InitializationError,
                     "Face detector must take a square 4D image input: " + modelPath};
    }
    if (output_shapes_.size() < 2) {
        return Error{ErrorCode::InitializationError,
                     "Face detector must have box and score outputs: " + modelPath};
    }

    pImpl_->inputSize = inputSize;
    pImpl_->anchors = generateFaceDetectionAnchors(inputSize.width);

    std::cout << "Face detector input " << inputSize.width << "x" << inputSize.height
              << ", " << pImpl_->anchors.size() << " anchors" << std::endl;
    return {};
}

std::vector<FaceDetection> FaceDetectionModel::detect(const cv::Mat& rgb, float minScore, int maxFaces) {
    if (!isLoaded()) {
        throw std::runtime_error("Face detector not loaded");
    }

    cv::Mat letterboxed;
    LetterboxInfo info = letterbox(rgb, letterboxed, pImpl_->inputSize);

    // Input range [-1, 1]
    std::vector<float> input = imageToTensor(letterboxed, 1.0f / 127.5f, -1.0f);
    auto outputs = runSingleInput(input, resolvedInputShape());

    const size_t numAnchors = pImpl_->anchors.size();
    const float* rawBoxes = nullptr;
    const float* rawScores = nullptr;
    for (auto& output : outputs) {
        size_t count = elementCount(output);
        if (count == numAnchors * kNumCoords) {
            rawBoxes = output.GetTensorData<float>();
        } else if (count == numAnchors) {
            rawScores = output.GetTensorData<float>();
        }
    }
    if (!rawBoxes || !rawScores) {
        throw std::runtime_error("Unexpected face detector output shapes");
    }

    auto detections = decodeFaceDetections(rawBoxes, rawScores, pImpl_->anchors, minScore,
                                           pImpl_->inputSize.width);
    detections = suppressOverlapping(std::move(detections), kMinSuppressionThreshold, maxFaces);

    for (auto& detection : detections) {
        removeLetterbox(detection, info, pImpl_->inputSize, rgb.size());
    }
    return detections;
}

} // namespace flm
