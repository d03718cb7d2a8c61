#include <gtest/gtest.h>
#include "FaceMeshModel.hpp"
#include "ONNXInferenceEngine.hpp"

namespace flm {
namespace testing {

TEST(ModelShapeTest, DynamicDimensionsCountAsOne) {
    EXPECT_EQ(resolveDynamicDimensions({-1, 192, 192, 3}), (std::vector<int64_t>{1, 192, 192, 3}));
    EXPECT_EQ(shapeElementCount({-1, 1, 1, 1434}), 1434);
    EXPECT_EQ(shapeElementCount({1, 1434}), 1434);
    EXPECT_EQ(shapeElementCount({}), 1);
}

TEST(FaceMeshShapeTest, StaticOutputs) {
    EXPECT_EQ(meshLandmarkCount({{1, 1, 1, 1404}, {1, 1, 1, 1}}), 468);
    EXPECT_EQ(meshLandmarkCount({{1, 1, 1, 1434}, {1, 1}}), 478);
}

TEST(FaceMeshShapeTest, DynamicBatchOutputs) {
    EXPECT_EQ(meshLandmarkCount({{-1, 1, 1, 1434}, {-1, 1, 1, 1}, {-1, 1}}), 478);
}

TEST(FaceMeshShapeTest, RejectsUnknownOutputs) {
    EXPECT_EQ(meshLandmarkCount({{1, 1, 1, 1434}}), 0);
    EXPECT_EQ(meshLandmarkCount({{1, 1000}, {1, 1}}), 0);
    EXPECT_EQ(meshLandmarkCount({}), 0);
}

} // namespace testing
} // namespace flm
