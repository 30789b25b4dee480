#pragma once

// Unit of communication between the producers and the render loop.
struct Event {
    enum Kind { KeyPress, ProgressUpdate };

    Kind   kind;
    int    key;
    double value;

    static Event keyPress(int code) { return Event{KeyPress, code, 0.0}; }
    static Event progressUpdate(double v) { return Event{ProgressUpdate, 0, v}; }
};
