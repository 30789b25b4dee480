#pragma once

#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Key bindings. Everything else about the dashboard is fixed.
struct Config {
    char quitKey   = 'q';
    char toggleKey = 'c';
};

const char* const DEFAULT_CONFIG_FILE = "gauge_pulse.json";
const char* const CONFIG_ENV_VAR      = "GAUGE_PULSE_CONFIG";

// $GAUGE_PULSE_CONFIG if set, otherwise gauge_pulse.json.
std::string configPath();

// Missing file yields the defaults. Malformed JSON or bad key values throw
// ConfigError.
Config loadConfig(const std::string& path);

Config parseConfig(const std::string& text);
