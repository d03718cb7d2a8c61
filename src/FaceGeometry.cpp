#include "FaceGeometry.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace flm {

Result<CanonicalFaceModel> parseCanonicalFaceModel(const nlohmann::json& config) {
    try {
        CanonicalFaceModel model;
        for (const auto& vertex : config.at("canonical_vertices")) {
            if (!vertex.is_array() || vertex.size() != 3) {
                return Error{ErrorCode::InitializationError, "Canonical vertices must be [x, y, z] triples"};
            }
            model.vertices.emplace_back(vertex[0].get<float>(), vertex[1].get<float>(), vertex[2].get<float>());
        }

        for (const auto& entry : config.at("procrustes_landmark_basis")) {
            ProcrustesBasisEntry basis;
            basis.landmarkId = entry.at("landmark_id").get<int>();
            basis.weight = entry.at("weight").get<float>();
            if (basis.landmarkId < 0 || basis.landmarkId >= static_cast<int>(model.vertices.size())) {
                return Error{ErrorCode::InitializationError,
                             "Procrustes landmark id out of range: " + std::to_string(basis.landmarkId)};
            }
            if (basis.weight < 0.0f) {
                return Error{ErrorCode::InitializationError, "Procrustes weights must be non-negative"};
            }
            model.procrustesBasis.push_back(basis);
        }

        if (model.procrustesBasis.size() < 3) {
            return Error{ErrorCode::InitializationError, "Procrustes basis needs at least 3 landmarks"};
        }
        return model;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InitializationError, std::string("Invalid face geometry: ") + e.what()};
    }
}

Result<CanonicalFaceModel> loadCanonicalFaceModel(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Error{ErrorCode::InitializationError, "Cannot open face geometry file: " + path};
    }
    nlohmann::json config = nlohmann::json::parse(ifs, nullptr, false);
    if (config.is_discarded()) {
        return Error{ErrorCode::InitializationError, "Face geometry file is not valid JSON: " + path};
    }

    auto model = parseCanonicalFaceModel(config);
    if (model) {
        std::cout << "Loaded canonical face model with " << model.value().vertices.size() << " vertices and "
                  << model.value().procrustesBasis.size() << " Procrustes landmarks" << std::endl;
    }
    return model;
}

SimilarityTransform solveWeightedProcrustes(const std::vector<cv::Point3d>& source,
                                            const std::vector<cv::Point3d>& target,
                                            const std::vector<double>& weights) {
    if (source.size() != target.size() || source.size() != weights.size()) {
        throw std::invalid_argument("Procrustes inputs differ in size");
    }

    double totalWeight = 0.0;
    for (double w : weights) {
        totalWeight += w;
    }
    if (source.size() < 3 || totalWeight <= 0.0) {
        throw std::invalid_argument("Procrustes needs at least 3 weighted points");
    }

    cv::Vec3d sourceMean;
    cv::Vec3d targetMean;
    for (size_t i = 0; i < source.size(); ++i) {
        double w = weights[i] / totalWeight;
        sourceMean += w * cv::Vec3d(source[i].x, source[i].y, source[i].z);
        targetMean += w * cv::Vec3d(target[i].x, target[i].y, target[i].z);
    }

    cv::Matx33d covariance = cv::Matx33d::zeros();
    double sourceVariance = 0.0;
    for (size_t i = 0; i < source.size(); ++i) {
        double w = weights[i] / totalWeight;
        cv::Vec3d s = cv::Vec3d(source[i].x, source[i].y, source[i].z) - sourceMean;
        cv::Vec3d t = cv::Vec3d(target[i].x, target[i].y, target[i].z) - targetMean;
        covariance += w * (cv::Matx31d(t) * cv::Matx13d(s[0], s[1], s[2]));
        sourceVariance += w * s.dot(s);
    }
    if (sourceVariance <= 1e-12) {
        throw std::invalid_argument("Procrustes source points are degenerate");
    }

    cv::Mat singular;
    cv::Mat u;
    cv::Mat vt;
    cv::SVD::compute(cv::Mat(covariance), singular, u, vt);

    // Flip the weakest axis when the best fit would be a reflection
    cv::Matx33d correction = cv::Matx33d::eye();
    if (cv::determinant(u) * cv::determinant(vt) < 0.0) {
        correction(2, 2) = -1.0;
    }

    SimilarityTransform transform;
    transform.rotation = cv::Matx33d(u) * correction * cv::Matx33d(vt);

    double trace = 0.0;
    for (int i = 0; i < 3; ++i) {
        trace += singular.at<double>(i) * correction(i, i);
    }
    transform.scale = trace / sourceVariance;
    transform.translation = targetMean - transform.scale * (transform.rotation * sourceMean);
    return transform;
}

FaceGeometry::FaceGeometry(CanonicalFaceModel model) : model_(std::move(model)) {
}

TransformMatrix FaceGeometry::estimatePose(const std::vector<NormalizedLandmark>& landmarks,
                                           const cv::Size& imageSize) const {
    std::vector<cv::Point3d> source;
    std::vector<cv::Point3d> target;
    std::vector<double> weights;
    for (const auto& basis : model_.procrustesBasis) {
        if (basis.landmarkId >= static_cast<int>(landmarks.size())) {
            throw std::invalid_argument("Face has too few landmarks for the canonical model");
        }
        const cv::Point3f& vertex = model_.vertices[basis.landmarkId];
        const NormalizedLandmark& landmark = landmarks[basis.landmarkId];

        source.emplace_back(vertex.x, vertex.y, vertex.z);
        // Right-handed: y up, z towards the camera
        target.emplace_back(landmark.x * imageSize.width,
                            (1.0 - landmark.y) * imageSize.height,
                            -landmark.z * imageSize.width);
        weights.push_back(basis.weight);
    }

    SimilarityTransform transform = solveWeightedProcrustes(source, target, weights);

    TransformMatrix matrix;
    matrix.rows = 4;
    matrix.columns = 4;
    matrix.data.assign(16, 0.0f);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            matrix.data[r * 4 + c] = static_cast<float>(transform.rotation(r, c));
        }
        matrix.data[r * 4 + 3] = static_cast<float>(transform.translation[r] / transform.scale);
    }
    matrix.data[15] = 1.0f;
    return matrix;
}

} // namespace flm
