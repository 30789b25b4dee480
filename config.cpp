#include "config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

static char readKey(const json& j, const char* name, char fallback) {
    if (!j.contains(name)) return fallback;
    string s = j[name].get<string>();
    if (s.size() != 1 || !isprint((unsigned char)s[0]) || s[0] == ' ')
        throw ConfigError(string(name) + " must be a single printable character");
    return s[0];
}

string configPath() {
    const char* env = getenv(CONFIG_ENV_VAR);
    if (env && *env) return string(env);
    return DEFAULT_CONFIG_FILE;
}

Config parseConfig(const string& text) {
    Config cfg;
    json j;
    try {
        j = json::parse(text);
    } catch (json::exception const& e) {
        throw ConfigError(string("invalid config: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError("invalid config: top level must be an object");

    try {
        cfg.quitKey   = readKey(j, "quit_key", cfg.quitKey);
        cfg.toggleKey = readKey(j, "toggle_key", cfg.toggleKey);
    } catch (json::exception const& e) {
        throw ConfigError(string("invalid config value: ") + e.what());
    }

    if (cfg.quitKey == cfg.toggleKey)
        throw ConfigError("quit_key and toggle_key must differ");
    return cfg;
}

Config loadConfig(const string& path) {
    ifstream in(path);
    if (!in.is_open()) return Config{};

    stringstream ss;
    ss << in.rdbuf();
    return parseConfig(ss.str());
}
