#include "FaceLandmarkerResult.hpp"

using json = nlohmann::json;

namespace flm {

json toJson(const NormalizedLandmark& landmark) {
    json out = {
        {"x", landmark.x},
        {"y", landmark.y},
        {"z", landmark.z}
    };
    if (landmark.visibility) {
        out["visibility"] = *landmark.visibility;
    }
    if (landmark.presence) {
        out["presence"] = *landmark.presence;
    }
    return out;
}

json toJson(const Classifications& classifications) {
    json categories = json::array();
    for (const auto& category : classifications.categories) {
        categories.push_back({
            {"index", category.index},
            {"score", category.score},
            {"category_name", category.categoryName},
            {"display_name", category.displayName}
        });
    }
    return {
        {"head_index", classifications.headIndex},
        {"head_name", classifications.headName},
        {"categories", categories}
    };
}

json toJson(const TransformMatrix& matrix) {
    return {
        {"rows", matrix.rows},
        {"columns", matrix.columns},
        {"data", matrix.data}
    };
}

json toJson(const FaceLandmarkerResult& result) {
    json faces = json::array();
    for (const auto& face : result.faceLandmarks) {
        json landmarks = json::array();
        for (const auto& landmark : face) {
            landmarks.push_back(toJson(landmark));
        }
        faces.push_back(landmarks);
    }

    json blendshapes = json::array();
    for (const auto& classifications : result.faceBlendshapes) {
        blendshapes.push_back(toJson(classifications));
    }

    json matrixes = json::array();
    for (const auto& matrix : result.facialTransformationMatrixes) {
        matrixes.push_back(toJson(matrix));
    }

    return {
        {"timestamp_ms", result.timestampMs},
        {"face_landmarks", faces},
        {"face_blendshapes", blendshapes},
        {"facial_transformation_matrixes", matrixes}
    };
}

} // namespace flm
