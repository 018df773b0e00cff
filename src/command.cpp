#include "posture/command.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace posture {
namespace {

ControlAction parseAction(std::string action) {
    std::transform(action.begin(), action.end(), action.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (action == "pause") {
        return ControlAction::Pause;
    }
    if (action == "resume") {
        return ControlAction::Resume;
    }
    if (action == "get_status" || action == "status") {
        return ControlAction::GetStatus;
    }
    if (action == "connect_viewer") {
        return ControlAction::ConnectViewer;
    }
    if (action == "disconnect_viewer") {
        return ControlAction::DisconnectViewer;
    }
    throw std::runtime_error("Unknown control action: " + action);
}

}  // namespace

const char* controlActionName(ControlAction action) {
    switch (action) {
    case ControlAction::Pause:
        return "pause";
    case ControlAction::Resume:
        return "resume";
    case ControlAction::GetStatus:
        return "get_status";
    case ControlAction::ConnectViewer:
        return "connect_viewer";
    case ControlAction::DisconnectViewer:
        break;
    }
    return "disconnect_viewer";
}

ControlCommand parseControlCommand(const Json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("Control command must be a JSON object");
    }
    if (!json.contains("action")) {
        throw std::runtime_error("Control command must contain action");
    }

    ControlCommand command;
    command.action = parseAction(json.get_string("action"));
    command.viewer_id = json.get_string("viewer_id");
    command.request_id = json.get_string("request_id");

    if ((command.action == ControlAction::ConnectViewer || command.action == ControlAction::DisconnectViewer) &&
        command.viewer_id.empty()) {
        throw std::runtime_error(std::string(controlActionName(command.action)) + " requires viewer_id");
    }
    return command;
}

ControlCommand parseControlPayload(const std::string& payload) {
    return parseControlCommand(Json::parse(payload));
}

}  // namespace posture
