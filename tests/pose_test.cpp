#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <stdexcept>

#include "posture/pose.hpp"
#include "posture/yolo_pose.hpp"
#include "test_helpers.hpp"

namespace posture {
namespace {

class ScriptedEngine : public PoseEngine {
public:
    std::optional<PoseEstimate> next;
    bool fail = false;
    int calls = 0;

    std::optional<PoseEstimate> infer(const cv::Mat&) override {
        ++calls;
        if (fail) {
            throw std::runtime_error("inference failed");
        }
        return next;
    }
    const KeypointLayout& layout() const override { return layout_; }

private:
    KeypointLayout layout_ = KeypointLayout::coco17();
};

class PoseEstimatorTest : public ::testing::Test {
protected:
    PoseEstimatorTest() {
        auto owned = std::make_unique<ScriptedEngine>();
        engine = owned.get();
        estimator = std::make_unique<PoseEstimator>(std::move(owned), 0.5);
    }

    ScriptedEngine* engine = nullptr;
    std::unique_ptr<PoseEstimator> estimator;
    cv::Mat frame = cv::Mat(120, 160, CV_8UC3, cv::Scalar(0, 0, 0));
};

TEST_F(PoseEstimatorTest, InvalidFramesNeverReachEngine) {
    EXPECT_EQ(estimator->detect(cv::Mat()).kind, DetectionKind::InvalidFrame);
    EXPECT_EQ(estimator->detect(cv::Mat(10, 10, CV_8UC1)).kind, DetectionKind::InvalidFrame);
    EXPECT_EQ(engine->calls, 0);
    PoseDetection invalid = estimator->detect(cv::Mat());
    EXPECT_FALSE(invalid.user_present);
    EXPECT_FALSE(invalid.landmarks.has_value());
}

TEST_F(PoseEstimatorTest, NobodyInView) {
    PoseDetection detection = estimator->detect(frame);
    EXPECT_EQ(detection.kind, DetectionKind::NoPerson);
    EXPECT_FALSE(detection.user_present);
    EXPECT_DOUBLE_EQ(detection.confidence, 0.0);
    EXPECT_EQ(engine->calls, 1);
}

TEST_F(PoseEstimatorTest, DetectedUsesNoseVisibilityAsConfidence) {
    PoseEstimate estimate;
    estimate.landmarks = testing::makePose();
    estimate.landmarks[0].visibility = 0.75f;
    engine->next = estimate;

    PoseDetection detection = estimator->detect(frame);
    EXPECT_EQ(detection.kind, DetectionKind::Detected);
    EXPECT_TRUE(detection.user_present);
    ASSERT_TRUE(detection.landmarks.has_value());
    EXPECT_EQ(detection.landmarks->size(), 17u);
    EXPECT_NEAR(detection.confidence, 0.75, 1e-6);
}

TEST_F(PoseEstimatorTest, EngineFailurePropagates) {
    engine->fail = true;
    EXPECT_THROW(estimator->detect(frame), std::runtime_error);
}

TEST_F(PoseEstimatorTest, OverlayDrawsOnlyTrackedLandmarks) {
    cv::Mat canvas = frame.clone();
    estimator->renderOverlay(canvas, testing::makePose(0.0, 0.0, 0.2f), Color{0, 255, 0});
    EXPECT_EQ(cv::countNonZero(canvas.reshape(1)), 0);

    estimator->renderOverlay(canvas, testing::makePose(), Color{0, 255, 0});
    EXPECT_GT(cv::countNonZero(canvas.reshape(1)), 0);

    cv::Mat untouched = frame.clone();
    estimator->renderOverlay(untouched, std::nullopt, Color{0, 255, 0});
    EXPECT_EQ(cv::countNonZero(untouched.reshape(1)), 0);
}

TEST(PoseEstimatorConstructionTest, NullEngineThrows) {
    EXPECT_THROW(PoseEstimator(nullptr), std::invalid_argument);
}

TEST(PoseModelSpecTest, LoadsYamlMetadata) {
    testing::TempDir dir;
    std::string path = (dir.path() / "pose.yaml").string();
    std::ofstream(path) << "name: test-pose\n"
                           "imgsz: [480, 640]\n"
                           "iou_threshold: 0.5\n"
                           "kpt_shape: [5, 3]\n"
                           "keypoints: [left_hip, right_hip, left_shoulder, right_shoulder, nose]\n";

    PoseModelSpec spec = PoseModelSpec::load(path);
    EXPECT_EQ(spec.name, "test-pose");
    EXPECT_EQ(spec.input_height, 480);
    EXPECT_EQ(spec.input_width, 640);
    EXPECT_FLOAT_EQ(spec.iou_threshold, 0.5f);
    EXPECT_EQ(spec.keypoint_dims, 3);
    EXPECT_EQ(spec.layout.size(), 5u);
    EXPECT_EQ(spec.layout.nose, 4);
    EXPECT_EQ(spec.layout.left_hip, 0);
}

TEST(PoseModelSpecTest, RejectsInconsistentShape) {
    testing::TempDir dir;
    std::string path = (dir.path() / "pose.yaml").string();
    std::ofstream(path) << "kpt_shape: [17, 3]\n"
                           "keypoints: [nose, left_shoulder, right_shoulder, left_hip, right_hip]\n";
    EXPECT_THROW(PoseModelSpec::load(path), std::runtime_error);
}

TEST(PoseModelSpecTest, MissingFileThrows) {
    EXPECT_THROW(PoseModelSpec::load("/nonexistent/pose.yaml"), std::runtime_error);
}

TEST(YoloPoseEngineTest, MissingModelFileThrows) {
    YoloPoseEngine engine("/nonexistent/pose.onnx", PoseModelSpec(), 0.5f);
    EXPECT_FALSE(engine.isLoaded());
    EXPECT_THROW(engine.load(), std::runtime_error);
    EXPECT_THROW(engine.infer(cv::Mat(10, 10, CV_8UC3)), std::runtime_error);
}

}  // namespace
}  // namespace posture
