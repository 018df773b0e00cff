#pragma once

#include <string>

#include "posture/json.hpp"

namespace posture {

enum class ControlAction { Pause, Resume, GetStatus, ConnectViewer, DisconnectViewer };

const char* controlActionName(ControlAction action);

struct ControlCommand {
    ControlAction action = ControlAction::GetStatus;
    std::string viewer_id;
    std::string request_id;
};

// Throws std::runtime_error for unknown actions, missing viewer ids on viewer
// commands or non-object payloads.
ControlCommand parseControlCommand(const Json& json);
ControlCommand parseControlPayload(const std::string& payload);

}  // namespace posture
