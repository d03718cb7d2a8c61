#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "Status.hpp"

namespace flm {

// Where the pixels came from. Buffer sources carry camera/decoder frames,
// Image is an in-memory bitmap.
enum class ImageSourceType {
    Image,
    PixelBuffer,
    SampleBuffer
};

enum class PixelFormat {
    BGRA32,
    RGBA32,
    BGR24,
    RGB24,
    Gray8
};

// How the stored buffer has to be rotated to appear upright.
enum class ImageOrientation {
    Up,
    Down,
    Left,
    Right,
    UpMirrored,
    DownMirrored,
    LeftMirrored,
    RightMirrored
};

const char* pixelFormatName(PixelFormat format);
const char* orientationName(ImageOrientation orientation);

// Parses "up", "down", "left", "right" and the "*_mirrored" variants.
Result<ImageOrientation> parseOrientation(const std::string& name);

class Image {
public:
    Image(cv::Mat pixels,
          PixelFormat format,
          ImageSourceType sourceType = ImageSourceType::Image,
          ImageOrientation orientation = ImageOrientation::Up);

    // Decodes an image file into a BGRA32 bitmap.
    static Result<Image> fromFile(const std::string& path,
                                  ImageOrientation orientation = ImageOrientation::Up);

    // Decodes an encoded (JPEG, PNG, ...) buffer into a BGRA32 bitmap.
    static Result<Image> fromEncoded(const std::vector<unsigned char>& data,
                                     ImageOrientation orientation = ImageOrientation::Up);

    const cv::Mat& pixels() const { return pixels_; }
    PixelFormat format() const { return format_; }
    ImageSourceType sourceType() const { return sourceType_; }
    ImageOrientation orientation() const { return orientation_; }

    int width() const { return pixels_.cols; }
    int height() const { return pixels_.rows; }

    // Checks the pixel format against the source type and the matrix layout.
    Result<void> validate() const;

    // Deep copy, detached from the caller's buffer.
    Image clone() const;

private:
    cv::Mat pixels_;
    PixelFormat format_;
    ImageSourceType sourceType_;
    ImageOrientation orientation_;
};

} // namespace flm
