#include "Image.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace flm {

namespace {

bool isRgbaFamily(PixelFormat format) {
    return format == PixelFormat::BGRA32 || format == PixelFormat::RGBA32;
}

int expectedMatType(PixelFormat format) {
    switch (format) {
        case PixelFormat::BGRA32:
        case PixelFormat::RGBA32: return CV_8UC4;
        case PixelFormat::BGR24:
        case PixelFormat::RGB24:  return CV_8UC3;
        case PixelFormat::Gray8:  return CV_8UC1;
    }
    return -1;
}

Result<Image> toBitmap(cv::Mat decoded, ImageOrientation orientation) {
    if (decoded.depth() == CV_16U) {
        decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
    } else if (decoded.depth() != CV_8U) {
        return Error{ErrorCode::InvalidInputError, "Unsupported image bit depth"};
    }

    cv::Mat bgra;
    switch (decoded.channels()) {
        case 1: cv::cvtColor(decoded, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(decoded, bgra, cv::COLOR_BGR2BGRA); break;
        case 4: bgra = decoded; break;
        default:
            return Error{ErrorCode::InvalidInputError,
                         "Unsupported number of channels: " + std::to_string(decoded.channels())};
    }
    return Image(bgra, PixelFormat::BGRA32, ImageSourceType::Image, orientation);
}

} // namespace

const char* pixelFormatName(PixelFormat format) {
    switch (format) {
        case PixelFormat::BGRA32: return "BGRA32";
        case PixelFormat::RGBA32: return "RGBA32";
        case PixelFormat::BGR24:  return "BGR24";
        case PixelFormat::RGB24:  return "RGB24";
        case PixelFormat::Gray8:  return "Gray8";
    }
    return "Unknown";
}

const char* orientationName(ImageOrientation orientation) {
    switch (orientation) {
        case ImageOrientation::Up:            return "up";
        case ImageOrientation::Down:          return "down";
        case ImageOrientation::Left:          return "left";
        case ImageOrientation::Right:         return "right";
        case ImageOrientation::UpMirrored:    return "up_mirrored";
        case ImageOrientation::DownMirrored:  return "down_mirrored";
        case ImageOrientation::LeftMirrored:  return "left_mirrored";
        case ImageOrientation::RightMirrored: return "right_mirrored";
    }
    return "unknown";
}

Result<ImageOrientation> parseOrientation(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const ImageOrientation all[] = {
        ImageOrientation::Up, ImageOrientation::Down,
        ImageOrientation::Left, ImageOrientation::Right,
        ImageOrientation::UpMirrored, ImageOrientation::DownMirrored,
        ImageOrientation::LeftMirrored, ImageOrientation::RightMirrored
    };
    for (ImageOrientation orientation : all) {
        if (lower == orientationName(orientation)) {
            return orientation;
        }
    }
    return Error{ErrorCode::InvalidInputError, "Unknown image orientation: " + name};
}

Image::Image(cv::Mat pixels, PixelFormat format, ImageSourceType sourceType, ImageOrientation orientation)
    : pixels_(std::move(pixels)),
      format_(format),
      sourceType_(sourceType),
      orientation_(orientation) {}

Result<Image> Image::fromFile(const std::string& path, ImageOrientation orientation) {
    if (!fs::exists(path)) {
        return Error{ErrorCode::InvalidInputError, "Image file not found: " + path};
    }

    cv::Mat decoded = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
        return Error{ErrorCode::InvalidInputError, "Failed to decode image file: " + path};
    }
    return toBitmap(decoded, orientation);
}

Result<Image> Image::fromEncoded(const std::vector<unsigned char>& data, ImageOrientation orientation) {
    if (data.empty()) {
        return Error{ErrorCode::InvalidInputError, "Encoded image buffer is empty"};
    }

    cv::Mat decoded = cv::imdecode(data, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
        return Error{ErrorCode::InvalidInputError, "Failed to decode image data"};
    }
    return toBitmap(decoded, orientation);
}

Result<void> Image::validate() const {
    if (pixels_.empty()) {
        return Error{ErrorCode::InvalidInputError, "Image has no pixel data"};
    }

    if (!isRgbaFamily(format_)) {
        if (sourceType_ == ImageSourceType::Image) {
            return Error{ErrorCode::InvalidInputError,
                         std::string("Bitmap images must be RGB with an alpha channel, got ") +
                             pixelFormatName(format_)};
        }
        return Error{ErrorCode::InvalidInputError,
                     std::string("Unsupported pixel format for pixel buffer: ") + pixelFormatName(format_) +
                         ". Supported pixel formats are BGRA32 and RGBA32"};
    }

    if (pixels_.type() != expectedMatType(format_)) {
        return Error{ErrorCode::InvalidInputError,
                     std::string("Pixel data does not match the declared format ") + pixelFormatName(format_)};
    }
    return {};
}

Image Image::clone() const {
    return Image(pixels_.clone(), format_, sourceType_, orientation_);
}

} // namespace flm
