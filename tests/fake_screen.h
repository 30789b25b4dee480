// tests/fake_screen.h
// @brief Screen that records frames instead of painting a terminal.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "screen.h"

class RecordingScreen : public Screen {
public:
    void draw(const AppState& state) override { frames.push_back(state); }
    void notice(const std::string& message) override { notices.push_back(message); }

    std::vector<AppState>    frames;
    std::vector<std::string> notices;
};

class FailingScreen : public Screen {
public:
    void draw(const AppState&) override { throw std::runtime_error("terminal refresh failed"); }
    void notice(const std::string&) override {}
};
