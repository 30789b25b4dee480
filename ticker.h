#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "event_channel.h"
#include "event_log.h"

const double                    MAX_PROGRESS  = 1.0;
const double                    TICK_STEP     = 0.01;
const std::chrono::milliseconds TICK_INTERVAL(100);

// One tick of the synthetic progress ramp, clamped at MAX_PROGRESS.
double nextProgress(double current, double step);

// Emits ProgressUpdate every interval on the given io_context. Once the
// ramp hits MAX_PROGRESS it keeps sending MAX_PROGRESS.
class Ticker {
public:
    Ticker(boost::asio::io_context& ioc, EventSender sender,
           std::chrono::milliseconds interval = TICK_INTERVAL, double step = TICK_STEP);

    void start();

    // Test hooks: the running program never stops or inspects its ticker.
    void stop();
    double progress() const { return progress_; }
    long long ticks() const { return ticks_; }

private:
    void schedule();
    void onTick(const boost::system::error_code& ec);

    boost::asio::steady_timer timer_;
    EventSender               sender_;
    std::chrono::milliseconds interval_;
    double                    step_;
    double                    progress_ = 0.0;
    long long                 ticks_    = 0;
    bool                      stopped_  = false;
};

// Thread body: runs a Ticker on its own io_context forever. A timer failure
// ends the producer and is noted in the log.
void runTicker(EventSender sender, std::shared_ptr<EventLog> log);
