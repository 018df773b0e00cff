#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace posture {

// Best-effort notifications to the process supervisor over the datagram
// socket named by NOTIFY_SOCKET. Every call is a no-op when no supervisor is
// present; send failures are logged, never thrown.
class LivenessReporter {
public:
    // socket_path empty: reporter disabled. A leading '@' selects the Linux
    // abstract namespace.
    LivenessReporter(std::string socket_path, std::chrono::milliseconds interval);
    ~LivenessReporter();

    LivenessReporter(const LivenessReporter&) = delete;
    LivenessReporter& operator=(const LivenessReporter&) = delete;

    // Reads NOTIFY_SOCKET and WATCHDOG_USEC. The interval is clamped below
    // half of the supervisor timeout.
    static std::unique_ptr<LivenessReporter> fromEnvironment(std::chrono::seconds interval);

    // Clamps interval below half of watchdog_usec (no-op when absent).
    static std::chrono::milliseconds effectiveInterval(std::chrono::milliseconds interval,
                                                       std::optional<long long> watchdog_usec);

    bool enabled() const { return !socket_path_.empty(); }
    std::chrono::milliseconds interval() const { return interval_; }

    // WATCHDOG=1, rate limited to one datagram per interval unless forced.
    bool ping(bool force = false);
    bool ready();
    bool status(const std::string& text);
    bool stopping();

private:
    bool send(const std::string& message);

    std::string socket_path_;
    std::chrono::milliseconds interval_;
    int fd_ = -1;

    std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_ping_;
};

}  // namespace posture
