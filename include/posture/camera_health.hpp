#pragma once

#include <chrono>
#include <functional>

namespace posture {

enum class CameraState { Connected, Degraded, Disconnected };

const char* cameraStateName(CameraState state);

struct RecoveryPolicy {
    int quick_retries = 3;
    std::chrono::milliseconds quick_retry_delay{1000};
    std::chrono::milliseconds long_retry_interval{10000};
    std::chrono::milliseconds hardware_fault_pause{1000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper threadSleeper();

// Tiered reconnection for the frame source. Owned by the worker loop; none of
// its methods are thread-safe.
//
//   connected --read failure--> degraded --quick retries fail--> disconnected
//       ^                          |                                  |
//       +------ any success -------+------ long wait + quick retries -+
class CameraHealthMonitor {
public:
    // One reconnection attempt: release, reopen and read a frame. Returns
    // true when a frame was obtained.
    using Attempt = std::function<bool()>;
    using StatusCallback = std::function<void(CameraState)>;
    using Heartbeat = std::function<void()>;
    using RunningCheck = std::function<bool()>;

    explicit CameraHealthMonitor(RecoveryPolicy policy, StatusCallback on_status = {}, Sleeper sleeper = {});

    // Pinged between the slices of the long retry wait.
    void setHeartbeat(Heartbeat heartbeat);
    // Retries stop early once this returns false.
    void setRunningCheck(RunningCheck running);

    CameraState state() const { return state_; }
    const RecoveryPolicy& policy() const { return policy_; }

    // Start-up state when the device could not be opened but is retry-eligible.
    void markDisconnected();

    // Read failure on the worker: degrade (if connected) and run the quick
    // retries. Returns the resulting state.
    CameraState handleReadFailure(const Attempt& attempt);

    // While disconnected: long wait, then another round of quick retries.
    CameraState attemptReconnect(const Attempt& attempt);

    // A frame arrived through the normal read path.
    void reportReadSuccess();

    // Device I/O fault raised by the capture backend. Returns the pause the
    // worker should observe before its next cycle.
    std::chrono::milliseconds reportHardwareFault();

private:
    bool quickRetries(const Attempt& attempt);
    void transition(CameraState next);
    bool running() const;

    RecoveryPolicy policy_;
    StatusCallback on_status_;
    Sleeper sleeper_;
    Heartbeat heartbeat_;
    RunningCheck running_;
    CameraState state_ = CameraState::Connected;
};

}  // namespace posture
