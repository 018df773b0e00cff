#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "posture/classifier.hpp"
#include "test_helpers.hpp"

namespace posture {
namespace {

using testing::makePose;

TEST(PostureClassifierTest, UprightTorsoIsGood) {
    PostureClassifier classifier;
    EXPECT_EQ(classifier.classify(makePose()), Posture::Good);
}

TEST(PostureClassifierTest, SmallLeanStaysGood) {
    PostureClassifier classifier;
    // atan(0.05 / 0.4) is about 7 degrees.
    EXPECT_EQ(classifier.classify(makePose(0.05)), Posture::Good);
    EXPECT_EQ(classifier.classify(makePose(-0.05)), Posture::Good);
}

TEST(PostureClassifierTest, LeaningEitherWayIsBad) {
    PostureClassifier classifier;
    // atan(0.2 / 0.4) is about 26.6 degrees.
    EXPECT_EQ(classifier.classify(makePose(0.2)), Posture::Bad);
    EXPECT_EQ(classifier.classify(makePose(-0.2)), Posture::Bad);
}

TEST(PostureClassifierTest, ThresholdIsConfigurable) {
    PostureClassifier strict(5.0);
    PostureClassifier lenient(30.0);
    EXPECT_EQ(strict.classify(makePose(0.05)), Posture::Bad);
    EXPECT_EQ(lenient.classify(makePose(0.2)), Posture::Good);
}

TEST(PostureClassifierTest, MissingLandmarksAreUnknown) {
    PostureClassifier classifier;
    EXPECT_EQ(classifier.classify(std::nullopt), Posture::Unknown);
    EXPECT_EQ(classifier.classify(LandmarkSet{}), Posture::Unknown);
    EXPECT_EQ(classifier.classify(LandmarkSet(8)), Posture::Unknown);
}

TEST(PostureClassifierTest, NonFiniteCoordinatesAreUnknown) {
    PostureClassifier classifier;
    LandmarkSet lms = makePose();
    lms[11].y = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(classifier.classify(lms), Posture::Unknown);
}

TEST(PostureClassifierTest, MeasureReportsSignedTorsoAngle) {
    PostureClassifier classifier;
    auto right = classifier.measure(makePose(0.2));
    auto left = classifier.measure(makePose(-0.2));
    ASSERT_TRUE(right.has_value());
    ASSERT_TRUE(left.has_value());
    EXPECT_NEAR(right->torso_angle, std::atan(0.5) * 180.0 / 3.14159265358979323846, 1e-3);
    EXPECT_NEAR(left->torso_angle, -right->torso_angle, 1e-3);
    EXPECT_FALSE(right->neck_angle.has_value());
}

TEST(PostureClassifierTest, SlouchCheckUsesNeckAngle) {
    PostureClassifier plain(15.0, false);
    PostureClassifier slouch(15.0, true);
    LandmarkSet forward_head = makePose(0.0, 0.1);

    EXPECT_EQ(plain.classify(forward_head), Posture::Good);
    EXPECT_EQ(slouch.classify(forward_head), Posture::Bad);
    EXPECT_EQ(slouch.classify(makePose()), Posture::Good);

    auto measurement = slouch.measure(forward_head);
    ASSERT_TRUE(measurement.has_value());
    ASSERT_TRUE(measurement->neck_angle.has_value());
    EXPECT_GT(*measurement->neck_angle, 15.0);
}

TEST(PostureClassifierTest, CustomLayoutIndices) {
    KeypointLayout layout = KeypointLayout::fromNames(
        {"left_hip", "right_hip", "left_shoulder", "right_shoulder", "nose"});
    PostureClassifier classifier(15.0, false, layout);

    LandmarkSet lms(5);
    lms[0] = {0.4f, 0.8f, 0.0f, 1.0f, 1.0f};
    lms[1] = {0.6f, 0.8f, 0.0f, 1.0f, 1.0f};
    lms[2] = {0.4f, 0.4f, 0.0f, 1.0f, 1.0f};
    lms[3] = {0.6f, 0.4f, 0.0f, 1.0f, 1.0f};
    lms[4] = {0.5f, 0.2f, 0.0f, 1.0f, 1.0f};
    EXPECT_EQ(classifier.classify(lms), Posture::Good);
}

TEST(PostureClassifierTest, DisplayColors) {
    EXPECT_EQ(PostureClassifier::displayColor(Posture::Good), (Color{0, 255, 0}));
    EXPECT_EQ(PostureClassifier::displayColor(Posture::Bad), (Color{0, 191, 255}));
    EXPECT_EQ(PostureClassifier::displayColor(Posture::Unknown), (Color{128, 128, 128}));
    // Bad posture is amber, never red.
    EXPECT_NE(PostureClassifier::displayColor(Posture::Bad), (Color{0, 0, 255}));
}

TEST(KeypointLayoutTest, Coco17Indices) {
    KeypointLayout layout = KeypointLayout::coco17();
    EXPECT_EQ(layout.size(), 17u);
    EXPECT_EQ(layout.nose, 0);
    EXPECT_EQ(layout.left_shoulder, 5);
    EXPECT_EQ(layout.right_shoulder, 6);
    EXPECT_EQ(layout.left_hip, 11);
    EXPECT_EQ(layout.right_hip, 12);
    EXPECT_EQ(layout.indexOf("right_ankle").value_or(-1), 16);
    EXPECT_FALSE(layout.indexOf("tail").has_value());
}

TEST(KeypointLayoutTest, MissingRequiredKeypointThrows) {
    EXPECT_THROW(KeypointLayout::fromNames({"nose", "left_shoulder", "right_shoulder", "left_hip"}),
                 std::runtime_error);
}

TEST(PostureNameTest, Names) {
    EXPECT_STREQ(postureName(Posture::Good), "good");
    EXPECT_STREQ(postureName(Posture::Bad), "bad");
    EXPECT_STREQ(postureName(Posture::Unknown), "unknown");
}

}  // namespace
}  // namespace posture
