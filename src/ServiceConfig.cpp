#include "ServiceConfig.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace flm {

Result<ServiceConfig> parseServiceConfig(const json& config, const std::string& baseDirectory) {
    if (!config.is_object()) {
        return Error{ErrorCode::InitializationError, "Service configuration must be a JSON object"};
    }

    ServiceConfig service;
    try {
        if (config.contains("server")) {
            const json& server = config.at("server");
            service.host = server.value("host", service.host);
            service.port = server.value("port", service.port);
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InitializationError, std::string("Invalid server section: ") + e.what()};
    }
    if (service.port <= 0 || service.port > 65535) {
        return Error{ErrorCode::InitializationError, "Server port out of range: " + std::to_string(service.port)};
    }

    if (!config.contains("landmarkers") || !config.at("landmarkers").is_array()) {
        return Error{ErrorCode::InitializationError, "Service configuration needs a \"landmarkers\" array"};
    }

    std::set<std::string> ids;
    for (const auto& entry : config.at("landmarkers")) {
        if (!entry.is_object() || !entry.contains("id") || !entry.at("id").is_string()) {
            return Error{ErrorCode::InitializationError, "Every landmarker needs a string \"id\""};
        }

        LandmarkerConfig landmarker;
        landmarker.id = entry.at("id").get<std::string>();
        if (!ids.insert(landmarker.id).second) {
            return Error{ErrorCode::InitializationError, "Duplicate landmarker id: " + landmarker.id};
        }

        auto options = loadOptionsFromJson(entry);
        if (!options) {
            return Error{ErrorCode::InitializationError, landmarker.id + ": " + options.error().message};
        }
        landmarker.options = std::move(options).value();

        if (landmarker.options.runningMode == RunningMode::LiveStream) {
            return Error{ErrorCode::InitializationError,
                         landmarker.id + ": live_stream landmarkers cannot be served over HTTP"};
        }

        fs::path assetPath(landmarker.options.baseOptions.modelAssetPath);
        if (!assetPath.empty() && assetPath.is_relative() && !baseDirectory.empty()) {
            landmarker.options.baseOptions.modelAssetPath = (fs::path(baseDirectory) / assetPath).string();
        }

        service.landmarkers.push_back(std::move(landmarker));
    }
    return service;
}

Result<ServiceConfig> loadServiceConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Error{ErrorCode::InitializationError, "Cannot open configuration file: " + path};
    }

    json config = json::parse(ifs, nullptr, false);
    if (config.is_discarded()) {
        return Error{ErrorCode::InitializationError, "Configuration file is not valid JSON: " + path};
    }

    std::cout << "Loading service configuration from " << path << std::endl;
    return parseServiceConfig(config, fs::path(path).parent_path().string());
}

} // namespace flm
