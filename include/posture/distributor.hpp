#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "posture/events.hpp"
#include "posture/json.hpp"
#include "posture/latest_slot.hpp"

namespace posture {

// Delivery channel of one connected viewer. send() may throw; the failure is
// confined to that viewer's relay.
class ViewerChannel {
public:
    virtual ~ViewerChannel() = default;
    virtual void send(const std::string& event_name, const Json& payload) = 0;
};

// Latest-wins result buffer plus one relay thread per connected viewer.
// publish() fans each snapshot out to a capacity-one slot per viewer, so a
// slow or broken viewer only ever loses its own snapshots. A viewer whose
// channel fails kMaxDeliveryFailures times in a row is closed.
class ResultDistributor {
public:
    static constexpr int kMaxDeliveryFailures = 3;

    explicit ResultDistributor(std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(500),
                               std::chrono::milliseconds error_pause = std::chrono::milliseconds(100));
    ~ResultDistributor();

    ResultDistributor(const ResultDistributor&) = delete;
    ResultDistributor& operator=(const ResultDistributor&) = delete;

    // Producer side; never blocks.
    void publish(SnapshotPtr snapshot);

    // Latest published snapshot, for callers that consume without a viewer.
    std::optional<SnapshotPtr> take(std::chrono::milliseconds timeout);
    bool hasPending() const { return !slot_.empty(); }

    // Replaces any session already registered under the same id.
    void connect(const std::string& viewer_id, std::unique_ptr<ViewerChannel> channel);
    bool disconnect(const std::string& viewer_id);
    // Viewers whose relay is still delivering.
    std::size_t viewerCount() const;
    void stopAll();

    std::uint64_t droppedCount() const { return dropped_.load(); }

private:
    struct Session {
        std::string id;
        std::unique_ptr<ViewerChannel> channel;
        std::atomic<bool> alive{true};
        LatestSlot<SnapshotPtr> pending;
        std::thread relay;
    };

    void relayLoop(Session& session);
    static void finish(const std::shared_ptr<Session>& session);

    const std::chrono::milliseconds poll_timeout_;
    const std::chrono::milliseconds error_pause_;
    LatestSlot<SnapshotPtr> slot_;
    std::atomic<std::uint64_t> dropped_{0};

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace posture
