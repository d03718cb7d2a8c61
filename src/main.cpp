#include "FaceLandmarker.hpp"
#include "ModelManager.hpp"
#include "RESTServer.hpp"
#include "ServiceConfig.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <opencv2/core.hpp>

bool loadLandmarker(const flm::LandmarkerConfig& config) {
    auto landmarker = flm::FaceLandmarker::create(config.options);
    if (!landmarker) {
        std::cerr << "Failed to load " << config.id << " from " << config.options.baseOptions.modelAssetPath
                  << ": " << landmarker.error().toString() << std::endl;
        return false;
    }

    std::shared_ptr<flm::FaceLandmarker> shared = std::move(landmarker).value();
    if (!flm::ModelManager::getInstance().registerLandmarker(config.id, shared)) {
        std::cerr << "Landmarker id already registered: " << config.id << std::endl;
        return false;
    }
    std::cout << "Successfully loaded " << config.id << " ("
              << flm::runningModeName(config.options.runningMode) << ")" << std::endl;
    return true;
}

int main(int argc, char** argv) {
    try {
        std::cout << "OpenCV Version: " << CV_VERSION << std::endl;

        std::string configPath = argc > 1 ? argv[1] : "config/landmarker.json";
        auto config = flm::loadServiceConfig(configPath);
        if (!config) {
            std::cerr << "Error: " << config.error().toString() << std::endl;
            return 1;
        }

        size_t loaded = 0;
        for (const auto& landmarker : config.value().landmarkers) {
            if (loadLandmarker(landmarker)) {
                ++loaded;
            }
        }
        if (loaded == 0) {
            std::cerr << "Error: no landmarker could be loaded" << std::endl;
            return 1;
        }
        std::cout << loaded << " of " << config.value().landmarkers.size() << " landmarker(s) loaded" << std::endl;

        flm::RESTServer server(config.value().host, config.value().port);
        server.start();
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
