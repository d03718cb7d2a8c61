#include <gtest/gtest.h>
#include "FaceLandmarker.hpp"
#include "FakeLandmarkEngine.hpp"
#include "ModelManager.hpp"

namespace flm {
namespace testing {

class ModelManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        ModelManager::getInstance().clear();
    }

    std::shared_ptr<FaceLandmarker> makeLandmarker() {
        FaceLandmarkerOptions options;
        options.baseOptions.modelAssetPath = "unused";
        auto landmarker = FaceLandmarker::create(
            options, std::make_unique<FakeLandmarkEngine>(std::make_shared<FakeEngineState>()));
        EXPECT_TRUE(landmarker.ok());
        return landmarker.ok() ? std::shared_ptr<FaceLandmarker>(std::move(landmarker).value()) : nullptr;
    }
};

TEST_F(ModelManagerTest, RegisterAndLookup) {
    auto& manager = ModelManager::getInstance();
    auto landmarker = makeLandmarker();

    EXPECT_TRUE(manager.registerLandmarker("faces", landmarker));
    EXPECT_EQ(manager.getLandmarker("faces"), landmarker);
    EXPECT_EQ(manager.getLandmarker("missing"), nullptr);
}

TEST_F(ModelManagerTest, IdsAreUnique) {
    auto& manager = ModelManager::getInstance();
    auto first = makeLandmarker();
    auto second = makeLandmarker();

    EXPECT_TRUE(manager.registerLandmarker("faces", first));
    EXPECT_FALSE(manager.registerLandmarker("faces", second));
    EXPECT_EQ(manager.getLandmarker("faces"), first);
    EXPECT_FALSE(manager.registerLandmarker("empty", nullptr));
}

TEST_F(ModelManagerTest, ListsSortedIdsAndUnregisters) {
    auto& manager = ModelManager::getInstance();
    manager.registerLandmarker("video", makeLandmarker());
    manager.registerLandmarker("image", makeLandmarker());

    EXPECT_EQ(manager.listLandmarkers(), (std::vector<std::string>{"image", "video"}));
    EXPECT_TRUE(manager.unregisterLandmarker("image"));
    EXPECT_FALSE(manager.unregisterLandmarker("image"));
    EXPECT_EQ(manager.listLandmarkers(), (std::vector<std::string>{"video"}));
}

} // namespace testing
} // namespace flm
