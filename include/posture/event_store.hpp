#pragma once

#include <mutex>
#include <string>

#include "posture/json.hpp"
#include "posture/landmarks.hpp"

namespace posture {

struct PostureChangeRecord {
    std::string timestamp;
    Posture state = Posture::Unknown;
    bool user_present = false;
    double confidence = 0.0;
    Json metadata = Json::object();
};

Json toJson(const PostureChangeRecord& record);

// Receives one record per posture change. Write-only from the monitor's
// point of view.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void recordPostureChange(const PostureChangeRecord& record) = 0;
};

// Appends one JSON object per line.
class JsonLinesEventStore : public EventSink {
public:
    explicit JsonLinesEventStore(std::string path);

    void recordPostureChange(const PostureChangeRecord& record) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

// Forwards good/bad transitions to a sink, skipping repeats and unknown.
class PostureChangeDetector {
public:
    explicit PostureChangeDetector(EventSink* sink) : sink_(sink) {}

    // Returns true when a record was written.
    bool observe(const PostureChangeRecord& record);

    Posture last() const { return last_; }

private:
    EventSink* sink_;
    Posture last_ = Posture::Unknown;
};

}  // namespace posture
