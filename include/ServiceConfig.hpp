#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "FaceLandmarkerOptions.hpp"
#include "Status.hpp"

namespace flm {

struct LandmarkerConfig {
    std::string id;
    FaceLandmarkerOptions options;
};

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::vector<LandmarkerConfig> landmarkers;
};

// Relative model asset paths are resolved against baseDirectory.
Result<ServiceConfig> parseServiceConfig(const nlohmann::json& config, const std::string& baseDirectory);

// Reads a service configuration file, resolving paths against its directory.
Result<ServiceConfig> loadServiceConfig(const std::string& path);

} // namespace flm
