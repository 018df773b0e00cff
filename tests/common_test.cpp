#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "posture/common.hpp"

namespace posture {
namespace {

std::string encode(const std::string& text) {
    return base64Encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(encode(""), "");
    EXPECT_EQ(encode("f"), "Zg==");
    EXPECT_EQ(encode("fo"), "Zm8=");
    EXPECT_EQ(encode("foo"), "Zm9v");
    EXPECT_EQ(encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64Encode(std::vector<std::uint8_t>{0xff, 0xfe}), "//4=");
}

TEST(LetterboxTest, PadsToNetworkInput) {
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(10, 20, 30));
    PreprocessInfo info = preprocessLetterbox(frame, 640, 640);
    EXPECT_FLOAT_EQ(info.scale, 1.0f);
    EXPECT_EQ(info.pad_x, 0);
    EXPECT_EQ(info.pad_y, 80);
    EXPECT_EQ(info.input_tensor.size(), 3u * 640u * 640u);
    EXPECT_EQ(info.letterbox.rows, 640);

    // Top padding row is gray; channel 0 of the tensor is red.
    EXPECT_NEAR(info.input_tensor[0], 114.0f / 255.0f, 1e-5);
    std::size_t center = static_cast<std::size_t>(320) * 640 + 320;
    EXPECT_NEAR(info.input_tensor[center], 30.0f / 255.0f, 1e-5);
}

TEST(LetterboxTest, RejectsInvalidInput) {
    EXPECT_THROW(preprocessLetterbox(cv::Mat(), 640, 640), std::runtime_error);
    EXPECT_THROW(preprocessLetterbox(cv::Mat(10, 10, CV_8UC1), 640, 640), std::runtime_error);
}

TEST(NmsTest, SuppressesOverlapsKeepingBestFirst) {
    std::vector<cv::Rect2f> boxes{{0, 0, 10, 10}, {1, 1, 10, 10}, {50, 50, 10, 10}};
    std::vector<float> scores{0.6f, 0.9f, 0.7f};
    std::vector<int> keep = NMS(boxes, scores, 0.45f);
    ASSERT_EQ(keep.size(), 2u);
    EXPECT_EQ(keep[0], 1);
    EXPECT_EQ(keep[1], 2);
    EXPECT_FLOAT_EQ(IoU(boxes[0], boxes[2]), 0.0f);
}

TEST(JpegTest, EncodesFrame) {
    cv::Mat frame(48, 64, CV_8UC3, cv::Scalar(0, 128, 255));
    std::string encoded = encodeJpegBase64(frame, 80);
    ASSERT_FALSE(encoded.empty());
    // JPEG SOI marker 0xFFD8 encodes to "/9j/".
    EXPECT_EQ(encoded.substr(0, 4), "/9j/");
    EXPECT_EQ(encoded.size() % 4, 0u);
    EXPECT_THROW(encodeJpegBase64(cv::Mat()), std::runtime_error);
}

}  // namespace
}  // namespace posture
