#pragma once

#include <memory>
#include <string>

#include "app_state.h"
#include "config.h"
#include "event.h"
#include "event_channel.h"
#include "event_log.h"
#include "screen.h"

const char* const EXIT_NOTICE = "Exiting application...";

// Render loop and sole owner of AppState. Runs draw -> receive -> handle
// until the quit key is seen.
class App {
public:
    App(const Config& config, std::shared_ptr<EventLog> log);

    // Throws ChannelClosed or whatever Screen::draw throws.
    void run(EventChannel& channel, Screen& screen);

    void handleEvent(const Event& ev, Screen& screen);

    const AppState& state() const { return state_; }

private:
    void onKey(int code, Screen& screen);

    Config                    config_;
    std::shared_ptr<EventLog> log_;
    AppState                  state_;
};
