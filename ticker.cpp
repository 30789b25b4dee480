#include "ticker.h"

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

using namespace std;
namespace net = boost::asio;

double nextProgress(double current, double step) {
    return min(current + step, MAX_PROGRESS);
}

Ticker::Ticker(net::io_context& ioc, EventSender sender,
               chrono::milliseconds interval, double step)
    : timer_(ioc),
      sender_(move(sender)),
      interval_(interval),
      step_(step) {}

void Ticker::start() {
    schedule();
}

void Ticker::stop() {
    stopped_ = true;
    timer_.cancel();
}

void Ticker::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) { onTick(ec); });
}

void Ticker::onTick(const boost::system::error_code& ec) {
    if (stopped_ || ec == net::error::operation_aborted) return;
    if (ec) throw boost::system::system_error(ec);

    progress_ = nextProgress(progress_, step_);
    ticks_++;
    sender_.send(Event::progressUpdate(progress_));
    schedule();
}

void runTicker(EventSender sender, shared_ptr<EventLog> log) {
    try {
        net::io_context ioc;
        Ticker ticker(ioc, move(sender));
        ticker.start();
        ioc.run();
    } catch (exception const& e) {
        log->note("producer_stopped", string("ticker: ") + e.what());
    }
}
