#include "event_log.h"

#include <chrono>
#include <iomanip>

using namespace std;

EventLog::EventLog(const string& path) {
    if (path.empty()) return;
    file_.open(path);
    if (!file_.is_open()) return;
    file_ << "timestamp_ms,seq,event,detail,progress,color\n";
    file_.flush();
}

EventLog::~EventLog() {
    if (file_.is_open()) file_.close();
}

void EventLog::record(const string& event, const string& detail, const AppState& state) {
    writeRow(event, detail, state.progress, gaugeColorName(state.gaugeColor));
}

void EventLog::note(const string& event, const string& detail) {
    writeRow(event, detail, -1.0, "");
}

long long EventLog::rows() const {
    lock_guard<mutex> lock(mutex_);
    return seq_;
}

void EventLog::writeRow(const string& event, string detail,
                        double progress, const char* color) {
    lock_guard<mutex> lock(mutex_);
    seq_++;
    if (!file_.is_open()) return;

    auto now = chrono::system_clock::now();
    long long ms = chrono::duration_cast<chrono::milliseconds>(
        now.time_since_epoch()).count();

    for (auto& c : detail) if (c == ',' || c == '\n') c = ';';

    file_ << ms << "," << seq_ << "," << event << "," << detail << ",";
    if (progress >= 0.0) file_ << fixed << setprecision(4) << progress;
    file_ << "," << color << "\n";
    file_.flush();
}
