// tests/test_event_log.cpp
// @brief CSV event log header, rows and the disabled mode.

#include "event_log.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

static std::vector<std::string> readLines(const char* path)
{
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static int countCommas(const std::string& s)
{
    int n = 0;
    for (char c : s) if (c == ',') n++;
    return n;
}

static void writes_rows()
{
    const char* path = "test_event_log_tmp.csv";
    {
        EventLog log(path);
        assert(log.enabled());

        AppState s;
        s.progress = 0.35;
        s.gaugeColor = GaugeColor::Secondary;
        log.record("key", "c", s);
        log.note("producer_stopped", "input: a, b");
        assert(log.rows() == 2);
    }

    auto lines = readLines(path);
    assert(lines.size() == 3);
    assert(lines[0] == "timestamp_ms,seq,event,detail,progress,color");

    assert(lines[1].find(",1,key,c,0.3500,secondary") != std::string::npos);
    assert(countCommas(lines[1]) == 5);

    // commas in details must not add columns
    assert(lines[2].find(",2,producer_stopped,input: a; b,,") != std::string::npos);
    assert(countCommas(lines[2]) == 5);

    std::remove(path);
}

static void disabled_log()
{
    EventLog log("");
    assert(!log.enabled());
    log.note("start", "");
    assert(log.rows() == 1);
}

static void unwritable_path_disables()
{
    EventLog log("/nonexistent/dir/pulse_events.csv");
    assert(!log.enabled());
    assert(std::string(EVENT_LOG_FILE) == "pulse_events.csv");
}

int main()
{
    writes_rows();
    disabled_log();
    unwritable_path_disables();
    return 0;
}
