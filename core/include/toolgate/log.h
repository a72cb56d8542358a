#pragma once
#include "json.h"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace toolgate {

// Connection lifecycle events, one canonical JSON object per line:
//   {"event":..,"payload":{..},"pid":..,"seq":..,"server":..,"ts":..}
// A default-constructed log is disabled and drops every event.
class EventLog {
public:
    EventLog() = default;
    explicit EventLog(const std::string& path);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Opened from TOOLGATE_EVENT_LOG (append) on first use; disabled if unset.
    static EventLog& global();

    bool enabled() const { return enabled_; }
    const std::string& path() const { return path_; }

    void event(const std::string& name, const std::string& server, const json::Value& payload);
    void event(const std::string& name, const std::string& server) {
        event(name, server, json::Value::object());
    }

private:
    std::mutex mu_;
    std::string path_;
    std::ofstream out_;
    bool enabled_{false};
    uint64_t seq_{0};
};

} // namespace toolgate
