#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include "FaceLandmarkerResult.hpp"
#include "Status.hpp"

namespace flm {

struct ProcrustesBasisEntry {
    int landmarkId = 0;
    float weight = 0.0f;
};

// Canonical face mesh in its own metric space, with the landmark weights used
// to fit it onto observed faces.
struct CanonicalFaceModel {
    std::vector<cv::Point3f> vertices;
    std::vector<ProcrustesBasisEntry> procrustesBasis;
};

// Reads "canonical_vertices" ([[x, y, z], ...]) and "procrustes_landmark_basis"
// ([{"landmark_id": i, "weight": w}, ...]).
Result<CanonicalFaceModel> parseCanonicalFaceModel(const nlohmann::json& config);
Result<CanonicalFaceModel> loadCanonicalFaceModel(const std::string& path);

// Similarity transform target ~ scale * rotation * source + translation
struct SimilarityTransform {
    double scale = 1.0;
    cv::Matx33d rotation = cv::Matx33d::eye();
    cv::Vec3d translation;
};

// Weighted orthogonal Procrustes with reflection correction. Throws
// std::invalid_argument on mismatched or degenerate input.
SimilarityTransform solveWeightedProcrustes(const std::vector<cv::Point3d>& source,
                                            const std::vector<cv::Point3d>& target,
                                            const std::vector<double>& weights);

class FaceGeometry {
public:
    explicit FaceGeometry(CanonicalFaceModel model);

    // 4x4 row-major pose of the canonical face: rotation with the translation
    // expressed in canonical units, last row (0, 0, 0, 1).
    TransformMatrix estimatePose(const std::vector<NormalizedLandmark>& landmarks,
                                 const cv::Size& imageSize) const;

    const CanonicalFaceModel& model() const { return model_; }

private:
    CanonicalFaceModel model_;
};

} // namespace flm
