#include "posture/watchdog.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace posture {

LivenessReporter::LivenessReporter(std::string socket_path, std::chrono::milliseconds interval)
    : socket_path_(std::move(socket_path)), interval_(interval) {
    if (socket_path_.empty()) {
        return;
    }
    if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
        std::cerr << "[Watchdog] NOTIFY_SOCKET path too long, notifications disabled" << std::endl;
        socket_path_.clear();
        return;
    }
    fd_ = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        std::cerr << "[Watchdog] Failed to create notify socket: " << std::strerror(errno) << std::endl;
        socket_path_.clear();
        return;
    }
    std::cout << "[Watchdog] Supervisor notifications enabled, ping interval " << interval_.count() << "ms"
              << std::endl;
}

LivenessReporter::~LivenessReporter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<LivenessReporter> LivenessReporter::fromEnvironment(std::chrono::seconds interval) {
    const char* socket_env = std::getenv("NOTIFY_SOCKET");
    std::string socket_path = socket_env ? socket_env : "";

    std::optional<long long> watchdog_usec;
    if (const char* usec_env = std::getenv("WATCHDOG_USEC")) {
        char* end = nullptr;
        long long value = std::strtoll(usec_env, &end, 10);
        if (end != usec_env && value > 0) {
            watchdog_usec = value;
        }
    }

    auto effective = effectiveInterval(std::chrono::duration_cast<std::chrono::milliseconds>(interval), watchdog_usec);
    return std::make_unique<LivenessReporter>(socket_path, effective);
}

std::chrono::milliseconds LivenessReporter::effectiveInterval(std::chrono::milliseconds interval,
                                                              std::optional<long long> watchdog_usec) {
    if (!watchdog_usec || *watchdog_usec <= 0) {
        return interval;
    }
    std::chrono::milliseconds half(*watchdog_usec / 2000);
    if (interval < half) {
        return interval;
    }
    std::chrono::milliseconds clamped = half > std::chrono::milliseconds(1000)
                                            ? half - std::chrono::milliseconds(1000)
                                            : half / 2;
    if (clamped.count() <= 0) {
        clamped = std::chrono::milliseconds(1);
    }
    return clamped;
}

bool LivenessReporter::send(const std::string& message) {
    if (!enabled() || fd_ < 0) {
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path_.data(), socket_path_.size());
    socklen_t length = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + socket_path_.size());
    if (socket_path_[0] == '@') {
        addr.sun_path[0] = '\0';
    } else {
        length += 1;
    }

    ssize_t sent = ::sendto(fd_, message.data(), message.size(), MSG_NOSIGNAL,
                            reinterpret_cast<const sockaddr*>(&addr), length);
    if (sent < 0) {
        std::cerr << "[Watchdog] Notify '" << message << "' failed: " << std::strerror(errno) << std::endl;
        return false;
    }
    return true;
}

bool LivenessReporter::ping(bool force) {
    if (!enabled()) {
        return false;
    }
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force && last_ping_ && now - *last_ping_ < interval_) {
            return false;
        }
        last_ping_ = now;
    }
    return send("WATCHDOG=1");
}

bool LivenessReporter::ready() {
    return send("READY=1");
}

bool LivenessReporter::status(const std::string& text) {
    return send("STATUS=" + text);
}

bool LivenessReporter::stopping() {
    return send("STOPPING=1");
}

}  // namespace posture
