#include "posture/camera_health.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace posture {
namespace {

constexpr std::chrono::milliseconds kLongWaitSlice{1000};

}  // namespace

const char* cameraStateName(CameraState state) {
    switch (state) {
    case CameraState::Connected:
        return "connected";
    case CameraState::Degraded:
        return "degraded";
    case CameraState::Disconnected:
        break;
    }
    return "disconnected";
}

Sleeper threadSleeper() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

CameraHealthMonitor::CameraHealthMonitor(RecoveryPolicy policy, StatusCallback on_status, Sleeper sleeper)
    : policy_(policy), on_status_(std::move(on_status)), sleeper_(sleeper ? std::move(sleeper) : threadSleeper()) {}

void CameraHealthMonitor::setHeartbeat(Heartbeat heartbeat) {
    heartbeat_ = std::move(heartbeat);
}

void CameraHealthMonitor::setRunningCheck(RunningCheck running) {
    running_ = std::move(running);
}

bool CameraHealthMonitor::running() const {
    return !running_ || running_();
}

void CameraHealthMonitor::transition(CameraState next) {
    if (next == state_) {
        return;
    }
    std::cout << "[Camera] State " << cameraStateName(state_) << " -> " << cameraStateName(next) << std::endl;
    state_ = next;
    if (on_status_) {
        on_status_(next);
    }
}

void CameraHealthMonitor::markDisconnected() {
    transition(CameraState::Disconnected);
}

bool CameraHealthMonitor::quickRetries(const Attempt& attempt) {
    for (int i = 1; i <= policy_.quick_retries && running(); ++i) {
        sleeper_(policy_.quick_retry_delay);
        if (!running()) {
            break;
        }
        std::cout << "[Camera] Reconnect attempt " << i << "/" << policy_.quick_retries << std::endl;
        if (attempt()) {
            return true;
        }
    }
    return false;
}

CameraState CameraHealthMonitor::handleReadFailure(const Attempt& attempt) {
    if (state_ == CameraState::Connected) {
        transition(CameraState::Degraded);
    }
    if (state_ == CameraState::Disconnected) {
        // Already down; recovery continues through attemptReconnect().
        return state_;
    }

    if (quickRetries(attempt)) {
        transition(CameraState::Connected);
    } else if (running()) {
        std::cerr << "[Camera] Quick retries exhausted, waiting "
                  << std::chrono::duration_cast<std::chrono::seconds>(policy_.long_retry_interval).count()
                  << "s between reconnect rounds" << std::endl;
        transition(CameraState::Disconnected);
    }
    return state_;
}

CameraState CameraHealthMonitor::attemptReconnect(const Attempt& attempt) {
    if (state_ != CameraState::Disconnected) {
        return state_;
    }

    // Wait in slices so the supervisor heartbeat keeps flowing and shutdown
    // is noticed promptly.
    auto remaining = policy_.long_retry_interval;
    while (remaining.count() > 0 && running()) {
        auto slice = std::min(remaining, kLongWaitSlice);
        sleeper_(slice);
        remaining -= slice;
        if (heartbeat_) {
            heartbeat_();
        }
    }

    if (running() && quickRetries(attempt)) {
        transition(CameraState::Connected);
    }
    return state_;
}

void CameraHealthMonitor::reportReadSuccess() {
    transition(CameraState::Connected);
}

std::chrono::milliseconds CameraHealthMonitor::reportHardwareFault() {
    if (state_ == CameraState::Connected) {
        transition(CameraState::Degraded);
    }
    return policy_.hardware_fault_pause;
}

}  // namespace posture
