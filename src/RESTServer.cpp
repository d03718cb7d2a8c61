#include "RESTServer.hpp"
#include "FaceLandmarker.hpp"
#include "Image.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <opencv2/imgproc.hpp>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
// For shared memory support
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;
using flm::ServiceResponse;

namespace {
    // Base64 decoding table
    const unsigned char base64_table[256] = {
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 62, 64, 64, 64, 63,
        52, 53, 54, 55, 56, 57, 58, 59, 60, 61, 64, 64, 64, 64, 64, 64,
        64,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
        15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 64, 64, 64, 64, 64,
        64, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
        41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64
    };


    cv::Mat getImageFromSharedMemory(const std::string& sharedMemoryKey) {
        int fd = shm_open(sharedMemoryKey.c_str(), O_RDONLY, 0);
        if (fd == -1) {
            throw std::runtime_error("Failed to open shared memory: " + std::string(strerror(errno)));
        }

        struct stat sb;
        if (fstat(fd, &sb) == -1) {
            close(fd);
            throw std::runtime_error("Failed to get shared memory size: " + std::string(strerror(errno)));
        }
        if (static_cast<size_t>(sb.st_size) < sizeof(flm::SharedMemoryImage)) {
            close(fd);
            throw std::runtime_error("Shared memory segment is smaller than the image header");
        }

        void* addr = mmap(NULL, sb.st_size, PROT_READ, MAP_SHARED, fd, 0);
        if (addr == MAP_FAILED) {
            close(fd);
            throw std::runtime_error("Failed to map shared memory: " + std::string(strerror(errno)));
        }

        const flm::SharedMemoryImage header = *static_cast<const flm::SharedMemoryImage*>(addr);
        const int width = header.width;
        const int height = header.height;
        const int channels = header.channels;
        const size_t step = static_cast<size_t>(header.step);

        if (!flm::isValidSharedMemoryImage(header, static_cast<size_t>(sb.st_size))) {
            munmap(addr, sb.st_size);
            close(fd);
            throw std::runtime_error("Invalid image dimensions in shared memory");
        }

        const unsigned char* dataStart = static_cast<const unsigned char*>(addr) + sizeof(flm::SharedMemoryImage);
        cv::Mat image(height, width, CV_8UC(channels));

        // Copy row by row
        for (int i = 0; i < height; ++i) {
            memcpy(image.data + i * image.step, dataStart + static_cast<size_t>(i) * step,
                   static_cast<size_t>(width) * channels);
        }

        munmap(addr, sb.st_size);
        close(fd);

        return image;
    }

    ServiceResponse errorResponse(const flm::Error& error) {
        ServiceResponse response;
        response.status = flm::httpStatusFor(error.code);
        response.body = {{"error", flm::errorCodeName(error.code)}, {"message", error.message}};
        return response;
    }

    flm::Result<flm::Image> imageFromRequest(const json& request) {
        flm::ImageOrientation orientation = flm::ImageOrientation::Up;
        if (request.contains("orientation")) {
            if (!request["orientation"].is_string()) {
                return flm::Error{flm::ErrorCode::InvalidInputError, "orientation must be a string"};
            }
            auto parsed = flm::parseOrientation(request["orientation"].get<std::string>());
            if (!parsed) {
                return parsed.error();
            }
            orientation = parsed.value();
        }

        bool useSharedMemory = false;
        if (request.contains("use_shared_memory") && request["use_shared_memory"].is_boolean()) {
            useSharedMemory = request["use_shared_memory"].get<bool>();
        }

        if (useSharedMemory) {
            if (!request.contains("shared_memory_key") || !request["shared_memory_key"].is_string()) {
                return flm::Error{flm::ErrorCode::InvalidInputError, "Shared memory key not provided"};
            }
            std::string sharedMemoryKey = request["shared_memory_key"].get<std::string>();

            cv::Mat pixels;
            try {
                pixels = getImageFromSharedMemory(sharedMemoryKey);
            } catch (const std::exception& e) {
                return flm::Error{flm::ErrorCode::InvalidInputError,
                                  std::string("Failed to load image from shared memory: ") + e.what()};
            }

            cv::Mat bgra;
            if (pixels.channels() == 4) {
                bgra = pixels;
            } else if (pixels.channels() == 3) {
                cv::cvtColor(pixels, bgra, cv::COLOR_BGR2BGRA);
            } else {
                cv::cvtColor(pixels, bgra, cv::COLOR_GRAY2BGRA);
            }
            std::cout << "Loaded image from shared memory " << sharedMemoryKey << ": " << bgra.cols << "x"
                      << bgra.rows << std::endl;
            return flm::Image(bgra, flm::PixelFormat::BGRA32, flm::ImageSourceType::PixelBuffer, orientation);
        }

        if (!request.contains("image") || !request["image"].is_string()) {
            return flm::Error{flm::ErrorCode::InvalidInputError, "Base64 image not provided"};
        }
        std::string image_base64 = request["image"].get<std::string>();

        // Remove data URL prefix if present
        size_t comma_pos = image_base64.find(',');
        if (comma_pos != std::string::npos) {
            image_base64 = image_base64.substr(comma_pos + 1);
        }

        std::vector<unsigned char> image_data = flm::base64Decode(image_base64);
        if (image_data.empty()) {
            return flm::Error{flm::ErrorCode::InvalidInputError, "Failed to decode base64 image"};
        }
        return flm::Image::fromEncoded(image_data, orientation);
    }

    ServiceResponse handleDetect(const std::string& body, bool videoFrame) {
        json request = json::parse(body, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            return errorResponse({flm::ErrorCode::InvalidInputError, "Request body must be a JSON object"});
        }
        if (!request.contains("model_id") || !request["model_id"].is_string()) {
            return errorResponse({flm::ErrorCode::InvalidInputError, "model_id not provided"});
        }
        std::string model_id = request["model_id"].get<std::string>();

        int64_t timestampMs = 0;
        if (videoFrame) {
            if (!request.contains("timestamp_ms") || !request["timestamp_ms"].is_number_integer()) {
                return errorResponse({flm::ErrorCode::InvalidInputError, "timestamp_ms not provided"});
            }
            const json& timestamp = request["timestamp_ms"];
            if (timestamp.is_number_unsigned() &&
                timestamp.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return errorResponse({flm::ErrorCode::InvalidInputError, "timestamp_ms out of range"});
            }
            timestampMs = timestamp.get<int64_t>();
        }

        auto landmarker = flm::ModelManager::getInstance().getLandmarker(model_id);
        if (!landmarker) {
            ServiceResponse response;
            response.status = 404;
            response.body = {{"error", "NOT_FOUND"}, {"message", "Model not found: " + model_id}};
            return response;
        }

        auto image = imageFromRequest(request);
        if (!image) {
            return errorResponse(image.error());
        }

        auto result = videoFrame ? landmarker->detectVideoFrame(image.value(), timestampMs)
                                 : landmarker->detectImage(image.value());
        if (!result) {
            std::cerr << "Detection with " << model_id << " failed: " << result.error().toString() << std::endl;
            return errorResponse(result.error());
        }

        ServiceResponse response;
        response.body = flm::toJson(result.value());
        return response;
    }

    ServiceResponse handleModuleHealth() {
        json response_json;
        response_json["status"] = "ok";
        response_json["service"] = "face_landmarker";

        json models = json::array();
        for (const auto& model_id : flm::ModelManager::getInstance().listLandmarkers()) {
            auto landmarker = flm::ModelManager::getInstance().getLandmarker(model_id);
            if (!landmarker) {
                continue;
            }
            json model_info = flm::toJson(landmarker->options());
            model_info["id"] = model_id;
            model_info["status"] = "loaded";
            model_info["type"] = "face_landmarker";
            models.push_back(model_info);
        }
        response_json["models"] = models;

        ServiceResponse response;
        response.body = response_json;
        return response;
    }
}

namespace flm {

bool isValidSharedMemoryImage(const SharedMemoryImage& header, size_t segmentSize) {
    if (header.width <= 0 || header.height <= 0 ||
        header.width > kMaxSharedMemoryImageSide || header.height > kMaxSharedMemoryImageSide) {
        return false;
    }
    if (header.channels != 1 && header.channels != 3 && header.channels != 4) {
        return false;
    }
    if (header.step <= 0 || segmentSize < sizeof(SharedMemoryImage)) {
        return false;
    }

    const size_t rowBytes = static_cast<size_t>(header.width) * static_cast<size_t>(header.channels);
    const size_t step = static_cast<size_t>(header.step);
    const size_t pixelBytes = step * static_cast<size_t>(header.height);
    return step >= rowBytes &&
           header.dataSize >= pixelBytes &&
           header.dataSize <= segmentSize - sizeof(SharedMemoryImage);
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::InitializationError:
        case ErrorCode::InvalidInputError:
            return 400;
        case ErrorCode::InvalidModeError:
        case ErrorCode::SequencingError:
            return 409;
        case ErrorCode::InternalError:
            return 500;
    }
    return 500;
}

std::vector<unsigned char> base64Decode(const std::string& input) {
    // Ignore trailing padding, reject anything outside the alphabet
    size_t length = input.size();
    while (length > 0 && input[length - 1] == '=') {
        --length;
    }
    if (length % 4 == 1) {
        return {};
    }

    std::vector<unsigned char> decoded;
    decoded.reserve(length * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < length; ++i) {
        unsigned char value = base64_table[static_cast<unsigned char>(input[i])];
        if (value == 64) {
            return {};
        }
        buffer = (buffer << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<unsigned char>((buffer >> bits) & 0xFF));
        }
    }
    return decoded;
}

ServiceResponse handleServiceRequest(const std::string& method,
                                     const std::string& target,
                                     const std::string& body) {
    try {
        if (target == "/health" && (method == "GET" || method == "HEAD")) {
            ServiceResponse response;
            response.body = {{"status", "ok"}, {"service", "face_landmarker"}};
            return response;
        }
        if (target == "/module_health" && method == "GET") {
            return handleModuleHealth();
        }
        if (method == "POST" && target == "/detect") {
            return handleDetect(body, false);
        }
        if (method == "POST" && target == "/detect_video_frame") {
            return handleDetect(body, true);
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error processing request: " << e.what() << std::endl;
        return errorResponse({ErrorCode::InternalError, e.what()});
    }

    ServiceResponse response;
    response.status = 404;
    response.body = {{"error", "NOT_FOUND"}, {"message", "Endpoint not found"}};
    return response;
}

class RESTServer::Impl {
public:
    Impl(const std::string& host, int port)
        : host_(host), port_(port), ioc_(), acceptor_(ioc_) {}

    void start() {
        try {
            auto const address = net::ip::make_address(host_);
            tcp::endpoint endpoint{address, static_cast<unsigned short>(port_)};

            acceptor_.open(endpoint.protocol());
            acceptor_.set_option(net::socket_base::reuse_address(true));
            acceptor_.bind(endpoint);
            acceptor_.listen(net::socket_base::max_listen_connections);

            std::cout << "Starting server on http://" << host_ << ":" << port_ << std::endl;
            std::cout << "Available endpoints:" << std::endl;
            std::cout << "  GET/HEAD /health" << std::endl;
            std::cout << "  GET /module_health" << std::endl;
            std::cout << "  POST /detect" << std::endl;
            std::cout << "    Request body: {" << std::endl;
            std::cout << "      \"model_id\": \"<landmarker id>\"," << std::endl;
            std::cout << "      \"image\": \"<base64_encoded_image>\"" << std::endl;
            std::cout << "      OR" << std::endl;
            std::cout << "      \"use_shared_memory\": true," << std::endl;
            std::cout << "      \"shared_memory_key\": \"<shared_memory_key>\"," << std::endl;
            std::cout << "      \"orientation\": \"up\" | \"down\" | \"left\" | \"right\" (optional)" << std::endl;
            std::cout << "    }" << std::endl;
            std::cout << "  POST /detect_video_frame" << std::endl;
            std::cout << "    Same body as /detect plus \"timestamp_ms\"" << std::endl;

            accept();
            ioc_.run();
        }
        catch(const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
    }

    void stop() {
        ioc_.stop();
    }

private:
    void accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if(!ec) {
                    std::make_shared<Session>(std::move(socket))->start();
                }
                if(acceptor_.is_open()) {
                    accept();
                }
            });
    }

    class Session : public std::enable_shared_from_this<Session> {
    public:
        explicit Session(tcp::socket socket) : socket_(std::move(socket)) {}

        void start() {
            read_request();
        }

    private:
        void read_request() {
            auto self = shared_from_this();

            http::async_read(
                socket_,
                buffer_,
                request_,
                [self](beast::error_code ec, std::size_t) {
                    if(!ec) {
                        self->process_request();
                    }
                });
        }

        void process_request() {
            response_.version(request_.version());
            response_.keep_alive(false);

            std::string method(request_.method_string());
            std::string target(request_.target());
            ServiceResponse reply = handleServiceRequest(method, target, request_.body());

            response_.result(static_cast<http::status>(reply.status));
            response_.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            response_.set(http::field::content_type, "application/json");
            if(request_.method() != http::verb::head) {
                response_.body() = reply.body.dump();
            }

            write_response();
        }

        void write_response() {
            auto self = shared_from_this();

            response_.set(http::field::content_length, std::to_string(response_.body().size()));

            http::async_write(
                socket_,
                response_,
                [self](beast::error_code ec, std::size_t) {
                    self->socket_.shutdown(tcp::socket::shutdown_send, ec);
                });
        }

        tcp::socket socket_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
    };

    std::string host_;
    int port_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
};

RESTServer::RESTServer(const std::string& host, int port)
    : pImpl_(std::make_unique<Impl>(host, port)) {}

RESTServer::~RESTServer() = default;

void RESTServer::start() {
    pImpl_->start();
}

void RESTServer::stop() {
    pImpl_->stop();
}

} // namespace flm
