#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flm {

class FaceLandmarker;

// Process-wide registry of the landmarkers served by the REST endpoints
class ModelManager {
public:
    static ModelManager& getInstance() {
        static ModelManager instance;
        return instance;
    }

    std::shared_ptr<FaceLandmarker> getLandmarker(const std::string& modelId) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = landmarkers_.find(modelId);
        if (it != landmarkers_.end()) {
            return it->second;
        }
        return nullptr;
    }

    // Fails on a null landmarker or an id that is already taken
    bool registerLandmarker(const std::string& modelId, std::shared_ptr<FaceLandmarker> landmarker) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!landmarker || landmarkers_.find(modelId) != landmarkers_.end()) {
            return false;
        }

        landmarkers_[modelId] = std::move(landmarker);
        return true;
    }

    bool unregisterLandmarker(const std::string& modelId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return landmarkers_.erase(modelId) > 0;
    }

    // Sorted ids
    std::vector<std::string> listLandmarkers() {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> ids;
        for (const auto& entry : landmarkers_) {
            ids.push_back(entry.first);
        }
        return ids;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        landmarkers_.clear();
    }

private:
    ModelManager() = default;
    ~ModelManager() = default;
    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    std::map<std::string, std::shared_ptr<FaceLandmarker>> landmarkers_;
    std::mutex mutex_;
};

} // namespace flm
