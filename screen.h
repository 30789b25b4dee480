#pragma once

#include <string>

#include "app_state.h"

// Presentation surface the render loop paints through.
class Screen {
public:
    virtual ~Screen() = default;

    // Repaint everything from state. Throws on failure.
    virtual void draw(const AppState& state) = 0;

    // User-visible one-line message.
    virtual void notice(const std::string& message) = 0;
};
