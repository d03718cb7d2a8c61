#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ModelManager.hpp"
#include "Status.hpp"

namespace flm {

struct ServiceResponse {
    int status = 200;
    nlohmann::json body;
};

// Shared memory image header, pixel rows follow it.
// 4 channels are BGRA, 3 are BGR, 1 is grayscale.
struct SharedMemoryImage {
    int width;
    int height;
    int channels;
    int step;
    size_t dataSize;
};

// Largest width or height accepted from shared memory
constexpr int kMaxSharedMemoryImageSide = 16384;

// True when the header describes pixel rows that fit in a segment of segmentSize bytes
bool isValidSharedMemoryImage(const SharedMemoryImage& header, size_t segmentSize);

// HTTP status for a detection error
int httpStatusFor(ErrorCode code);

std::vector<unsigned char> base64Decode(const std::string& input);

// Routes one request to the registered landmarkers. Used by the HTTP sessions,
// callable without a socket.
ServiceResponse handleServiceRequest(const std::string& method,
                                     const std::string& target,
                                     const std::string& body);

class RESTServer {
public:
    RESTServer(const std::string& host, int port);
    ~RESTServer();

    // Blocks until stop() is called
    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace flm
