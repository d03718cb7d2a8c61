#include "VisionTaskRunner.hpp"
#include <algorithm>
#include <cctype>
#include <opencv2/imgproc.hpp>

namespace flm {

namespace {

std::string lowerModeName(RunningMode mode) {
    std::string name = runningModeName(mode);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

bool isMirrored(ImageOrientation orientation) {
    return orientation == ImageOrientation::UpMirrored || orientation == ImageOrientation::DownMirrored ||
           orientation == ImageOrientation::LeftMirrored || orientation == ImageOrientation::RightMirrored;
}

} // namespace

VisionTaskRunner::VisionTaskRunner(RunningMode mode) : mode_(mode) {}

Result<void> VisionTaskRunner::checkMode(RunningMode expected) const {
    if (mode_ != expected) {
        return Error{ErrorCode::InvalidModeError,
                     "The vision task is not initialized with " + lowerModeName(expected) +
                         " mode. Current Running Mode: " + runningModeName(mode_)};
    }
    return {};
}

Result<void> VisionTaskRunner::checkTimestamp(int64_t timestampMs) const {
    if (lastTimestampMs_ && timestampMs <= *lastTimestampMs_) {
        return Error{ErrorCode::SequencingError, "Input timestamp must be monotonically increasing."};
    }
    return {};
}

void VisionTaskRunner::acceptTimestamp(int64_t timestampMs) {
    lastTimestampMs_ = timestampMs;
}

Result<cv::Mat> VisionTaskRunner::prepareImage(const Image& image) {
    auto valid = image.validate();
    if (!valid) {
        return valid.error();
    }
    if (isMirrored(image.orientation())) {
        return Error{ErrorCode::InvalidInputError,
                     std::string("Mirrored image orientations are not supported: ") +
                         orientationName(image.orientation())};
    }

    cv::Mat converted;
    int code = image.format() == PixelFormat::BGRA32 ? cv::COLOR_BGRA2RGB : cv::COLOR_RGBA2RGB;
    cv::cvtColor(image.pixels(), converted, code);

    cv::Mat rgb;
    switch (image.orientation()) {
        case ImageOrientation::Down:
            cv::rotate(converted, rgb, cv::ROTATE_180);
            break;
        case ImageOrientation::Left:
            cv::rotate(converted, rgb, cv::ROTATE_90_COUNTERCLOCKWISE);
            break;
        case ImageOrientation::Right:
            cv::rotate(converted, rgb, cv::ROTATE_90_CLOCKWISE);
            break;
        default:
            rgb = converted;
            break;
    }
    return rgb;
}

void VisionTaskRunner::mapToBuffer(std::vector<NormalizedLandmark>& landmarks,
                                   ImageOrientation orientation,
                                   const cv::Size& bufferSize) {
    // z is normalized by the upright width, which is the buffer height after a quarter turn
    const float quarterTurnZScale =
        bufferSize.width > 0 ? static_cast<float>(bufferSize.height) / bufferSize.width : 1.0f;

    for (auto& landmark : landmarks) {
        const float u = landmark.x;
        const float v = landmark.y;
        switch (orientation) {
            case ImageOrientation::Down:
                landmark.x = 1.0f - u;
                landmark.y = 1.0f - v;
                break;
            case ImageOrientation::Left:
                landmark.x = 1.0f - v;
                landmark.y = u;
                landmark.z *= quarterTurnZScale;
                break;
            case ImageOrientation::Right:
                landmark.x = v;
                landmark.y = 1.0f - u;
                landmark.z *= quarterTurnZScale;
                break;
            default:
                break;
        }
    }
}

} // namespace flm
