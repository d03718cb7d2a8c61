#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "FaceLandmarkerResult.hpp"

namespace flm {

// Rotated rectangle in normalized image coordinates. Rotation is in radians,
// clockwise in image space.
struct NormalizedRect {
    float xCenter = 0.0f;
    float yCenter = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float rotation = 0.0f;
};

// Face detector output, normalized to the image it ran on.
struct FaceDetection {
    float score = 0.0f;
    cv::Rect2f box;
    std::vector<cv::Point2f> keypoints;
};

// Wraps an angle into [-pi, pi).
float normalizeRadians(float angle);

// Angle that brings the start->end vector onto the horizontal axis.
float computeRotation(const cv::Point2f& start, const cv::Point2f& end, const cv::Size& imageSize);

// Makes the rect square on its long side (in pixels) and scales it.
NormalizedRect transformRect(const NormalizedRect& rect, const cv::Size& imageSize, float scale);

// Landmark-model ROI for a fresh detection, aligned on the eye keypoints.
NormalizedRect roiFromDetection(const FaceDetection& detection, const cv::Size& imageSize);

// Landmark-model ROI for the next frame, aligned on the outer eye corners.
NormalizedRect roiFromLandmarks(const std::vector<NormalizedLandmark>& landmarks, const cv::Size& imageSize);

// Intersection over union of the unrotated rects
float rectIoU(const NormalizedRect& a, const NormalizedRect& b);
float boxIoU(const cv::Rect2f& a, const cv::Rect2f& b);

// ROI queued for the face mesh on one frame
struct RoiCandidate {
    NormalizedRect rect;
    // Carried over from the previous frame rather than freshly detected
    bool tracked = false;
};

// Merges tracked ROIs and new detections into at most maxFaces ROIs. Tracked
// ROIs are considered first; an ROI whose IoU with any ROI already kept is at
// least overlapThreshold is the same face and is dropped.
std::vector<RoiCandidate> selectRois(const std::vector<NormalizedRect>& tracked,
                                     const std::vector<NormalizedRect>& detected,
                                     int maxFaces,
                                     float overlapThreshold);

// True when fewer than maxFaces faces are already covered
bool needsDetection(const std::vector<RoiCandidate>& rois, int maxFaces);

// Minimum face presence for keeping a mesh run on this ROI
float presenceThreshold(const RoiCandidate& roi, float minFacePresenceConfidence, float minTrackingConfidence);

// ROIs of the faces kept on the last tracked frame
class RoiTracker {
public:
    // Tracked ROIs for the next frame; none when the frame is not tracked
    std::vector<NormalizedRect> carriedRois(bool tracking) const;

    // Remembers the frame's faces when tracking, forgets them otherwise
    void update(bool tracking, std::vector<NormalizedRect> rois);

    void reset();

    size_t size() const { return rois_.size(); }

private:
    std::vector<NormalizedRect> rois_;
};

// Samples the rotated ROI into an outputSize image, zero outside the source.
cv::Mat cropRoi(const cv::Mat& image, const NormalizedRect& roi, const cv::Size& outputSize);

// Maps landmarks normalized to the ROI crop back to the full image.
void projectLandmarks(std::vector<NormalizedLandmark>& landmarks,
                      const NormalizedRect& roi,
                      const cv::Size& imageSize);

} // namespace flm
