#include <gtest/gtest.h>

#include <stdexcept>

#include "posture/command.hpp"

namespace posture {
namespace {

TEST(ControlCommandTest, ParsesEachAction) {
    EXPECT_EQ(parseControlPayload(R"({"action": "pause"})").action, ControlAction::Pause);
    EXPECT_EQ(parseControlPayload(R"({"action": "resume"})").action, ControlAction::Resume);
    EXPECT_EQ(parseControlPayload(R"({"action": "get_status"})").action, ControlAction::GetStatus);
    EXPECT_EQ(parseControlPayload(R"({"action": "STATUS"})").action, ControlAction::GetStatus);

    ControlCommand connect = parseControlPayload(R"({"action": "connect_viewer", "viewer_id": "tab-1"})");
    EXPECT_EQ(connect.action, ControlAction::ConnectViewer);
    EXPECT_EQ(connect.viewer_id, "tab-1");
}

TEST(ControlCommandTest, KeepsRequestId) {
    ControlCommand command = parseControlPayload(R"({"action": "pause", "request_id": "r-17"})");
    EXPECT_EQ(command.request_id, "r-17");
}

TEST(ControlCommandTest, RejectsInvalidRequests) {
    EXPECT_THROW(parseControlPayload("[]"), std::runtime_error);
    EXPECT_THROW(parseControlPayload("{}"), std::runtime_error);
    EXPECT_THROW(parseControlPayload(R"({"action": "reboot"})"), std::runtime_error);
    EXPECT_THROW(parseControlPayload(R"({"action": "disconnect_viewer"})"), std::runtime_error);
    EXPECT_THROW(parseControlPayload("not json"), std::exception);
}

TEST(ControlCommandTest, ActionNames) {
    EXPECT_STREQ(controlActionName(ControlAction::Pause), "pause");
    EXPECT_STREQ(controlActionName(ControlAction::GetStatus), "get_status");
    EXPECT_STREQ(controlActionName(ControlAction::DisconnectViewer), "disconnect_viewer");
}

}  // namespace
}  // namespace posture
