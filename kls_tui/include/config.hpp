#pragma once

#include "key_bindings.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace kls::tui {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fixed cascade order
enum PanelIndex : size_t {
    CONTEXTS = 0,
    NAMESPACES = 1,
    API_RESOURCES = 2,
    RESOURCES = 3,
    PANEL_COUNT = 4
};

struct PanelSpec {
    std::string title;
    int width;      // relative share of the terminal width
};

struct Config {
    std::string kubectl = "kubectl";
    int refresh_interval_ms = 2000;
    int input_timeout_ms = 50;
    std::string log_file;
    LogLevel log_level = LogLevel::INFO;
    std::vector<PanelSpec> panels;
    KeyBindings key_bindings;

    static Config defaults();

    // Missing keys keep their defaults. Throws ConfigError.
    static Config from_json(const json& data);

    // Missing file yields the defaults. Throws ConfigError on unreadable
    // or invalid files.
    static Config load(const std::string& path);

    // $KLS_CONFIG, else $XDG_CONFIG_HOME/kls/config.json, else
    // ~/.config/kls/config.json
    static std::string default_path();

    // Replace a leading "~/" with $HOME
    static std::string expand_home(const std::string& path);

    void validate() const;
};

} // namespace kls::tui
