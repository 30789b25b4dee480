// Manual check of the gauge painting on a real terminal. Not run by ctest.
#include <unistd.h>

#include "app_state.h"
#include "config.h"
#include "ncurses_screen.h"

int main() {
    Config config;
    TerminalSession session;        // alternate screen, raw input
    NcursesScreen screen(config);

    AppState state;
    for (int i = 0; i <= 20; i++) {
        state.progress = i * 0.05;
        if (i == 10) state.gaugeColor = GaugeColor::Secondary;  // switch to yellow halfway
        screen.draw(state);
        usleep(150000);
    }

    screen.notice("smoke test done");
    sleep(2);                       // leave the last frame up
    return 0;
}
