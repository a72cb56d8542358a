#include "toolgate/log.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace toolgate {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

EventLog::EventLog(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {
    enabled_ = out_.good();
    if (!enabled_) {
        std::cerr << "[warn] cannot open event log " << path << "; events disabled\n";
    }
}

EventLog& EventLog::global() {
    static EventLog* log = [] {
        const char* p = std::getenv("TOOLGATE_EVENT_LOG");
        if (p && *p) return new EventLog(std::string(p));
        return new EventLog();
    }();
    return *log;
}

void EventLog::event(const std::string& name, const std::string& server, const json::Value& payload) {
    if (!enabled_) return;

    json::Value rec = json::Value::object();
    rec.set("event", json::Value::string(name));
    rec.set("server", json::Value::string(server));
    rec.set("payload", payload ? payload : json::Value::object());
#ifndef _WIN32
    rec.set("pid", json::Value::integer(static_cast<int64_t>(::getpid())));
#endif
    rec.set("ts", json::Value::string(iso_now()));

    std::lock_guard<std::mutex> lk(mu_);
    rec.set("seq", json::Value::integer(static_cast<int64_t>(++seq_)));
    out_ << rec.dump_canonical() << "\n";
    out_.flush();
}

} // namespace toolgate
