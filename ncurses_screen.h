#pragma once

#include <cstdio>
#include <string>

#include "config.h"
#include "screen.h"

struct screen;

// Takes over the terminal (alternate screen, raw input, hidden cursor) and
// gives it back in the destructor, whatever path leaves the scope.
class TerminalSession {
public:
    explicit TerminalSession(FILE* out = stdout, FILE* in = stdin);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

private:
    struct screen* screen_;
};

class NcursesScreen : public Screen {
public:
    explicit NcursesScreen(const Config& config);

    void draw(const AppState& state) override;
    void notice(const std::string& message) override;

    const std::string& lastNotice() const { return lastNotice_; }

private:
    void syncSize();
    void drawGauge(const AppState& state, int rows, int cols);

    Config      config_;
    std::string lastNotice_;
};
