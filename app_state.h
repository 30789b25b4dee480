#pragma once

enum class GaugeColor { Primary, Secondary };

inline GaugeColor toggled(GaugeColor c) {
    return c == GaugeColor::Primary ? GaugeColor::Secondary : GaugeColor::Primary;
}

inline const char* gaugeColorName(GaugeColor c) {
    return c == GaugeColor::Primary ? "primary" : "secondary";
}

struct AppState {
    bool       exit       = false;
    GaugeColor gaugeColor = GaugeColor::Primary;
    double     progress   = 0.0;
};
