#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

#include "app.h"
#include "config.h"
#include "event_channel.h"
#include "event_log.h"
#include "input_reader.h"
#include "ncurses_screen.h"
#include "ticker.h"

using namespace std;

int main() {
    Config config;
    try {
        config = loadConfig(configPath());
    } catch (ConfigError const& e) {
        cerr << "Config error: " << e.what() << endl;
        return 1;
    }

    auto log     = make_shared<EventLog>(EVENT_LOG_FILE);
    if (!log->enabled())
        cerr << "Warning: cannot open " << EVENT_LOG_FILE << ", event log disabled" << endl;

    auto channel = make_shared<EventChannel>();
    string notice;

    try {
        TerminalSession session;
        NcursesScreen   screen(config);

        // producers are never joined; they end with the process
        thread(runInputReader, EventSender(channel), log, (int)STDIN_FILENO).detach();
        thread(runTicker, EventSender(channel), log).detach();

        App app(config, log);
        app.run(*channel, screen);
        notice = screen.lastNotice();
    }
    catch (exception const& e) {
        log->note("fatal", e.what());
        cerr << "Fatal: " << e.what() << endl;
        return 1;
    }

    if (!notice.empty()) cout << "\033[31m" << notice << "\033[0m" << endl;
    return 0;
}
