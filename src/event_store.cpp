#include "posture/event_store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace posture {

Json toJson(const PostureChangeRecord& record) {
    Json obj = Json::object();
    obj["timestamp"] = record.timestamp;
    obj["state"] = postureName(record.state);
    obj["user_present"] = record.user_present;
    obj["confidence"] = record.confidence;
    obj["metadata"] = record.metadata.is_null() ? Json::object() : record.metadata;
    return obj;
}

JsonLinesEventStore::JsonLinesEventStore(std::string path) : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::runtime_error("Event store path must not be empty");
    }
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create event store directory " + parent.string() + ": " +
                                     ec.message());
        }
    }
}

void JsonLinesEventStore::recordPostureChange(const PostureChangeRecord& record) {
    std::string line = toJson(record).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open event store: " + path_);
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to append to event store: " + path_);
    }
}

bool PostureChangeDetector::observe(const PostureChangeRecord& record) {
    if (record.state == Posture::Unknown || record.state == last_) {
        return false;
    }
    last_ = record.state;
    if (!sink_) {
        return false;
    }
    sink_->recordPostureChange(record);
    std::cout << "[Events] Posture changed to " << postureName(record.state) << std::endl;
    return true;
}

}  // namespace posture
