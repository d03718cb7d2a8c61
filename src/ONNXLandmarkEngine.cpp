#include "ONNXLandmarkEngine.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include "BlendshapesModel.hpp"
#include "FaceDetectionModel.hpp"
#include "FaceGeometry.hpp"
#include "FaceMeshModel.hpp"
#include "FaceRoi.hpp"

namespace fs = std::filesystem;

namespace flm {

namespace {

constexpr const char* kFaceDetectorFile = "face_detector.onnx";
constexpr const char* kFaceLandmarksFile = "face_landmarks_detector.onnx";
constexpr const char* kBlendshapesFile = "face_blendshapes.onnx";
constexpr const char* kGeometryFile = "face_geometry.json";

// ROIs overlapping a kept face this much are the same face
constexpr float kTrackedOverlapThreshold = 0.5f;

constexpr int kLandmarksWithIris = 478;

Result<std::string> requireFile(const fs::path& directory, const char* fileName) {
    fs::path path = directory / fileName;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::InitializationError, "Model asset is missing " + path.string()};
    }
    return path.string();
}

} // namespace

Result<std::string> resolveModelAssetDirectory(const std::string& modelAssetPath) {
    if (modelAssetPath.empty()) {
        return Error{ErrorCode::InitializationError, "Model asset path must not be empty"};
    }

    std::error_code ec;
    fs::path path(modelAssetPath);
    if (fs::is_directory(path, ec)) {
        return path.string();
    }
    if (fs::is_regular_file(path, ec)) {
        fs::path parent = path.parent_path();
        return parent.empty() ? std::string(".") : parent.string();
    }
    return Error{ErrorCode::InitializationError, "Model asset path does not exist: " + modelAssetPath};
}

class ONNXLandmarkEngine::Impl {
public:
    FaceLandmarkerOptions options;

    FaceDetectionModel detector;
    FaceMeshModel mesh;
    std::unique_ptr<BlendshapesModel> blendshapes;
    std::optional<FaceGeometry> geometry;

    // Faces found on the previous tracked frame
    RoiTracker tracker;

    FaceLandmarkerResult run(const cv::Mat& rgb, bool tracking);
};

FaceLandmarkerResult ONNXLandmarkEngine::Impl::run(const cv::Mat& rgb, bool tracking) {
    const cv::Size imageSize = rgb.size();

    const std::vector<NormalizedRect> tracked = tracker.carriedRois(tracking);
    std::vector<RoiCandidate> rois = selectRois(tracked, {}, options.numFaces, kTrackedOverlapThreshold);

    if (needsDetection(rois, options.numFaces)) {
        std::vector<NormalizedRect> detected;
        for (const auto& detection : detector.detect(rgb, options.minFaceDetectionConfidence, options.numFaces)) {
            detected.push_back(roiFromDetection(detection, imageSize));
        }
        rois = selectRois(tracked, detected, options.numFaces, kTrackedOverlapThreshold);
    }

    FaceLandmarkerResult result;
    std::vector<NormalizedRect> nextRois;
    for (const auto& roi : rois) {
        cv::Mat crop = cropRoi(rgb, roi.rect, mesh.inputSize());
        FaceMeshOutput face = mesh.run(crop);

        if (face.presence < presenceThreshold(roi, options.minFacePresenceConfidence, options.minTrackingConfidence)) {
            continue;
        }

        projectLandmarks(face.landmarks, roi.rect, imageSize);
        nextRois.push_back(roiFromLandmarks(face.landmarks, imageSize));

        if (blendshapes) {
            result.faceBlendshapes.push_back(blendshapes->predict(face.landmarks, imageSize));
        }
        if (geometry) {
            result.facialTransformationMatrixes.push_back(geometry->estimatePose(face.landmarks, imageSize));
        }
        result.faceLandmarks.push_back(std::move(face.landmarks));
    }

    tracker.update(tracking, std::move(nextRois));
    return result;
}

ONNXLandmarkEngine::ONNXLandmarkEngine() : pImpl_(std::make_unique<Impl>()) {}

ONNXLandmarkEngine::~ONNXLandmarkEngine() = default;

Result<std::unique_ptr<LandmarkEngine>> ONNXLandmarkEngine::create(const FaceLandmarkerOptions& options) {
    auto directory = resolveModelAssetDirectory(options.baseOptions.modelAssetPath);
    if (!directory) {
        return directory.error();
    }
    const fs::path assetDir(directory.value());

    std::unique_ptr<ONNXLandmarkEngine> engine(new ONNXLandmarkEngine());
    Impl& impl = *engine->pImpl_;
    impl.options = options;

    auto detectorPath = requireFile(assetDir, kFaceDetectorFile);
    if (!detectorPath) {
        return detectorPath.error();
    }
    auto loaded = impl.detector.loadModel(detectorPath.value(), options.baseOptions);
    if (!loaded) {
        return loaded.error();
    }

    auto meshPath = requireFile(assetDir, kFaceLandmarksFile);
    if (!meshPath) {
        return meshPath.error();
    }
    loaded = impl.mesh.loadModel(meshPath.value(), options.baseOptions);
    if (!loaded) {
        return loaded.error();
    }

    if (options.outputFaceBlendshapes) {
        if (impl.mesh.landmarkCount() < kLandmarksWithIris) {
            return Error{ErrorCode::InitializationError,
                         "Blendshapes require a face landmarks detector with " +
                             std::to_string(kLandmarksWithIris) + " landmarks"};
        }
        auto blendshapesPath = requireFile(assetDir, kBlendshapesFile);
        if (!blendshapesPath) {
            return blendshapesPath.error();
        }
        impl.blendshapes = std::make_unique<BlendshapesModel>();
        loaded = impl.blendshapes->loadModel(blendshapesPath.value(), options.baseOptions);
        if (!loaded) {
            return loaded.error();
        }
    }

    if (options.outputFacialTransformationMatrixes) {
        auto geometryPath = requireFile(assetDir, kGeometryFile);
        if (!geometryPath) {
            return geometryPath.error();
        }
        auto model = loadCanonicalFaceModel(geometryPath.value());
        if (!model) {
            return model.error();
        }
        impl.geometry.emplace(std::move(model).value());
    }

    std::cout << "Face landmarker engine ready (" << assetDir.string() << ", "
              << (impl.detector.usingCUDA() ? "CUDA" : "CPU") << ")" << std::endl;
    return std::unique_ptr<LandmarkEngine>(std::move(engine));
}

Result<FaceLandmarkerResult> ONNXLandmarkEngine::process(const cv::Mat& rgb, bool tracking) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        return Error{ErrorCode::InternalError, "Landmark engine expects an 8-bit RGB image"};
    }

    try {
        return pImpl_->run(rgb, tracking);
    } catch (const Ort::Exception& e) {
        pImpl_->tracker.reset();
        return Error{ErrorCode::InternalError, std::string("ONNX Runtime error: ") + e.what()};
    } catch (const cv::Exception& e) {
        pImpl_->tracker.reset();
        return Error{ErrorCode::InternalError, std::string("OpenCV error: ") + e.what()};
    } catch (const std::exception& e) {
        pImpl_->tracker.reset();
        return Error{ErrorCode::InternalError, e.what()};
    }
}

} // namespace flm
