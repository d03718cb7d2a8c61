#include "FaceRoi.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace flm {

namespace {

constexpr float kRoiScale = 1.5f;

// Outer eye corners of the face mesh topology
constexpr int kLeftEyeOuterCorner = 33;
constexpr int kRightEyeOuterCorner = 263;

} // namespace

float normalizeRadians(float angle) {
    const float twoPi = 2.0f * static_cast<float>(CV_PI);
    return angle - twoPi * std::floor((angle + static_cast<float>(CV_PI)) / twoPi);
}

float computeRotation(const cv::Point2f& start, const cv::Point2f& end, const cv::Size& imageSize) {
    float x0 = start.x * imageSize.width;
    float y0 = start.y * imageSize.height;
    float x1 = end.x * imageSize.width;
    float y1 = end.y * imageSize.height;
    return normalizeRadians(-std::atan2(-(y1 - y0), x1 - x0));
}

NormalizedRect transformRect(const NormalizedRect& rect, const cv::Size& imageSize, float scale) {
    NormalizedRect out = rect;
    float longSide = std::max(rect.width * imageSize.width, rect.height * imageSize.height);
    out.width = longSide / imageSize.width * scale;
    out.height = longSide / imageSize.height * scale;
    return out;
}

NormalizedRect roiFromDetection(const FaceDetection& detection, const cv::Size& imageSize) {
    NormalizedRect rect;
    rect.xCenter = detection.box.x + detection.box.width / 2.0f;
    rect.yCenter = detection.box.y + detection.box.height / 2.0f;
    rect.width = detection.box.width;
    rect.height = detection.box.height;
    if (detection.keypoints.size() >= 2) {
        rect.rotation = computeRotation(detection.keypoints[0], detection.keypoints[1], imageSize);
    }
    return transformRect(rect, imageSize, kRoiScale);
}

NormalizedRect roiFromLandmarks(const std::vector<NormalizedLandmark>& landmarks, const cv::Size& imageSize) {
    float xMin = std::numeric_limits<float>::max();
    float yMin = std::numeric_limits<float>::max();
    float xMax = std::numeric_limits<float>::lowest();
    float yMax = std::numeric_limits<float>::lowest();
    for (const auto& landmark : landmarks) {
        xMin = std::min(xMin, landmark.x);
        yMin = std::min(yMin, landmark.y);
        xMax = std::max(xMax, landmark.x);
        yMax = std::max(yMax, landmark.y);
    }

    NormalizedRect rect;
    if (landmarks.empty()) {
        return rect;
    }
    rect.xCenter = (xMin + xMax) / 2.0f;
    rect.yCenter = (yMin + yMax) / 2.0f;
    rect.width = xMax - xMin;
    rect.height = yMax - yMin;

    if (landmarks.size() > static_cast<size_t>(kRightEyeOuterCorner)) {
        const auto& left = landmarks[kLeftEyeOuterCorner];
        const auto& right = landmarks[kRightEyeOuterCorner];
        rect.rotation = computeRotation({left.x, left.y}, {right.x, right.y}, imageSize);
    }
    return transformRect(rect, imageSize, kRoiScale);
}

float boxIoU(const cv::Rect2f& a, const cv::Rect2f& b) {
    float intersection = (a & b).area();
    float unionArea = a.area() + b.area() - intersection;
    return unionArea > 0.0f ? intersection / unionArea : 0.0f;
}

float rectIoU(const NormalizedRect& a, const NormalizedRect& b) {
    cv::Rect2f boxA(a.xCenter - a.width / 2.0f, a.yCenter - a.height / 2.0f, a.width, a.height);
    cv::Rect2f boxB(b.xCenter - b.width / 2.0f, b.yCenter - b.height / 2.0f, b.width, b.height);
    return boxIoU(boxA, boxB);
}

std::vector<RoiCandidate> selectRois(const std::vector<NormalizedRect>& tracked,
                                     const std::vector<NormalizedRect>& detected,
                                     int maxFaces,
                                     float overlapThreshold) {
    std::vector<RoiCandidate> kept;

    auto consider = [&](const NormalizedRect& rect, bool isTracked) {
        if (static_cast<int>(kept.size()) >= maxFaces) {
            return;
        }
        for (const auto& roi : kept) {
            if (rectIoU(roi.rect, rect) >= overlapThreshold) {
                return;
            }
        }
        kept.push_back({rect, isTracked});
    };

    for (const auto& rect : tracked) {
        consider(rect, true);
    }
    for (const auto& rect : detected) {
        consider(rect, false);
    }
    return kept;
}

bool needsDetection(const std::vector<RoiCandidate>& rois, int maxFaces) {
    return static_cast<int>(rois.size()) < maxFaces;
}

float presenceThreshold(const RoiCandidate& roi, float minFacePresenceConfidence, float minTrackingConfidence) {
    return roi.tracked ? minTrackingConfidence : minFacePresenceConfidence;
}

std::vector<NormalizedRect> RoiTracker::carriedRois(bool tracking) const {
    if (!tracking) {
        return {};
    }
    return rois_;
}

void RoiTracker::update(bool tracking, std::vector<NormalizedRect> rois) {
    if (tracking) {
        rois_ = std::move(rois);
    } else {
        rois_.clear();
    }
}

void RoiTracker::reset() {
    rois_.clear();
}

cv::Mat cropRoi(const cv::Mat& image, const NormalizedRect& roi, const cv::Size& outputSize) {
    const float cx = roi.xCenter * image.cols;
    const float cy = roi.yCenter * image.rows;
    const float halfW = roi.width * image.cols / 2.0f;
    const float halfH = roi.height * image.rows / 2.0f;
    const float c = std::cos(roi.rotation);
    const float s = std::sin(roi.rotation);

    auto corner = [&](float dx, float dy) {
        return cv::Point2f(cx + c * dx - s * dy, cy + s * dx + c * dy);
    };

    cv::Point2f src[3] = {corner(-halfW, -halfH), corner(halfW, -halfH), corner(-halfW, halfH)};
    cv::Point2f dst[3] = {
        cv::Point2f(0.0f, 0.0f),
        cv::Point2f(static_cast<float>(outputSize.width), 0.0f),
        cv::Point2f(0.0f, static_cast<float>(outputSize.height))
    };

    cv::Mat transform = cv::getAffineTransform(src, dst);
    cv::Mat crop;
    cv::warpAffine(image, crop, transform, outputSize, cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0));
    return crop;
}

void projectLandmarks(std::vector<NormalizedLandmark>& landmarks,
                      const NormalizedRect& roi,
                      const cv::Size& imageSize) {
    const float roiW = roi.width * imageSize.width;
    const float roiH = roi.height * imageSize.height;
    const float c = std::cos(roi.rotation);
    const float s = std::sin(roi.rotation);

    for (auto& landmark : landmarks) {
        float x = (landmark.x - 0.5f) * roiW;
        float y = (landmark.y - 0.5f) * roiH;
        float px = c * x - s * y + roi.xCenter * imageSize.width;
        float py = s * x + c * y + roi.yCenter * imageSize.height;

        landmark.x = px / imageSize.width;
        landmark.y = py / imageSize.height;
        landmark.z = landmark.z * roiW / imageSize.width;
    }
}

} // namespace flm
