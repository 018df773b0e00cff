#include "posture/distributor.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace posture {

ResultDistributor::ResultDistributor(std::chrono::milliseconds poll_timeout, std::chrono::milliseconds error_pause)
    : poll_timeout_(poll_timeout), error_pause_(error_pause) {}

ResultDistributor::~ResultDistributor() {
    stopAll();
}

void ResultDistributor::publish(SnapshotPtr snapshot) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& entry : sessions_) {
            if (entry.second->alive.load()) {
                entry.second->pending.push(snapshot);
            }
        }
    }
    if (slot_.push(std::move(snapshot))) {
        ++dropped_;
    }
}

std::optional<SnapshotPtr> ResultDistributor::take(std::chrono::milliseconds timeout) {
    return slot_.take(timeout);
}

void ResultDistributor::connect(const std::string& viewer_id, std::unique_ptr<ViewerChannel> channel) {
    if (!channel) {
        throw std::invalid_argument("Viewer channel must not be null");
    }

    auto session = std::make_shared<Session>();
    session->id = viewer_id;
    session->channel = std::move(channel);

    std::vector<std::shared_ptr<Session>> retired;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->first == viewer_id || !it->second->alive.load()) {
                retired.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
        sessions_[viewer_id] = session;
        session->relay = std::thread([this, session]() { relayLoop(*session); });
    }
    for (const auto& old : retired) {
        finish(old);
    }

    std::cout << "[Viewer] " << viewer_id << " connected" << std::endl;
}

bool ResultDistributor::disconnect(const std::string& viewer_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(viewer_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }
    finish(session);
    std::cout << "[Viewer] " << viewer_id << " disconnected" << std::endl;
    return true;
}

std::size_t ResultDistributor::viewerCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::size_t count = 0;
    for (const auto& entry : sessions_) {
        if (entry.second->alive.load()) {
            ++count;
        }
    }
    return count;
}

void ResultDistributor::stopAll() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
        sessions_.clear();
    }
    // Wake every relay first so the joins below do not wait out poll timeouts
    // one after another.
    for (const auto& session : sessions) {
        session->alive.store(false);
        session->pending.close();
    }
    for (const auto& session : sessions) {
        finish(session);
    }
}

void ResultDistributor::finish(const std::shared_ptr<Session>& session) {
    if (!session) {
        return;
    }
    session->alive.store(false);
    session->pending.close();
    if (session->relay.joinable()) {
        if (session->relay.get_id() == std::this_thread::get_id()) {
            session->relay.detach();
        } else {
            session->relay.join();
        }
    }
}

void ResultDistributor::relayLoop(Session& session) {
    int failures = 0;
    try {
        session.channel->send(event::kViewerStatus,
                              viewerStatusMessage("Connected to posture monitoring", currentTimestamp()));
    } catch (const std::exception& ex) {
        ++failures;
        std::cerr << "[Viewer] " << session.id << " greeting failed: " << ex.what() << std::endl;
    }

    while (session.alive.load()) {
        auto snapshot = session.pending.take(poll_timeout_);
        if (!snapshot || !*snapshot) {
            continue;
        }
        if (!session.alive.load()) {
            break;
        }
        try {
            session.channel->send(event::kPostureSnapshot, toJson(**snapshot));
            failures = 0;
        } catch (const std::exception& ex) {
            ++failures;
            std::cerr << "[Viewer] " << session.id << " delivery failed (" << failures << "/"
                      << kMaxDeliveryFailures << "): " << ex.what() << std::endl;
            if (failures >= kMaxDeliveryFailures) {
                std::cerr << "[Viewer] " << session.id << " closed after repeated delivery failures" << std::endl;
                session.alive.store(false);
                break;
            }
            std::this_thread::sleep_for(error_pause_);
        }
    }
}

}  // namespace posture
