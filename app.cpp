#include "app.h"

#include "input_reader.h"

using namespace std;

App::App(const Config& config, shared_ptr<EventLog> log)
    : config_(config), log_(move(log)) {}

void App::run(EventChannel& channel, Screen& screen) {
    log_->record("start", "", state_);

    while (!state_.exit) {
        screen.draw(state_);
        handleEvent(channel.receive(), screen);
    }
}

void App::handleEvent(const Event& ev, Screen& screen) {
    if (state_.exit) return;

    switch (ev.kind) {
        case Event::KeyPress:
            onKey(ev.key, screen);
            break;
        case Event::ProgressUpdate:
            state_.progress = ev.value;
            log_->record("progress", "", state_);
            break;
    }
}

void App::onKey(int code, Screen& screen) {
    if (code == config_.quitKey) {
        state_.exit = true;
        screen.notice(EXIT_NOTICE);
        log_->record("exit", describeKey(code), state_);
        return;
    }

    if (code == config_.toggleKey)
        state_.gaugeColor = toggled(state_.gaugeColor);

    log_->record("key", describeKey(code), state_);
}
