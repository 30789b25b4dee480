#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "app_state.h"

const char* const EVENT_LOG_FILE = "pulse_events.csv";

// CSV record of everything the render loop consumed. Each row is flushed.
class EventLog {
public:
    // An empty path disables the log.
    explicit EventLog(const std::string& path);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void record(const std::string& event, const std::string& detail, const AppState& state);
    void note(const std::string& event, const std::string& detail);

    bool enabled() const { return file_.is_open(); }

    // Rows written so far, counted even when disabled. Used by tests.
    long long rows() const;

private:
    void writeRow(const std::string& event, std::string detail,
                  double progress, const char* color);

    mutable std::mutex mutex_;
    std::ofstream      file_;
    long long          seq_ = 0;
};
