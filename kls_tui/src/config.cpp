#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace kls::tui {

Config Config::defaults() {
    Config config;
    config.panels = {
        {.title = "Contexts", .width = 15},
        {.title = "Namespaces", .width = 20},
        {.title = "API resources", .width = 20},
        {.title = "Resources", .width = 45}
    };
    config.key_bindings = KeyBindings::defaults();
    return config;
}

Config Config::from_json(const json& data) {
    Config config = defaults();

    if (!data.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    try {
        config.kubectl = data.value("kubectl", config.kubectl);
        config.refresh_interval_ms = data.value("refresh_interval_ms", config.refresh_interval_ms);
        config.input_timeout_ms = data.value("input_timeout_ms", config.input_timeout_ms);
        config.log_file = expand_home(data.value("log_file", config.log_file));

        if (data.contains("log_level")) {
            auto name = data["log_level"].get<std::string>();
            auto level = Logger::parse_level(name);
            if (!level) {
                throw ConfigError("unknown log_level '" + name + "'");
            }
            config.log_level = *level;
        }

        if (data.contains("panels")) {
            const auto& panels = data["panels"];
            if (!panels.is_array()) {
                throw ConfigError("panels must be an array");
            }
            config.panels.clear();
            for (const auto& p : panels) {
                config.panels.push_back(PanelSpec{
                    .title = p.at("title").get<std::string>(),
                    .width = p.at("width").get<int>()
                });
            }
        }

        if (data.contains("key_bindings")) {
            const auto& bindings = data["key_bindings"];
            if (!bindings.is_array()) {
                throw ConfigError("key_bindings must be an array");
            }
            std::vector<KeyBinding> parsed;
            for (const auto& b : bindings) {
                parsed.push_back(KeyBinding{
                    .key = b.at("key").get<std::string>(),
                    .description = b.value("description", std::string()),
                    .command = b.at("command").get<std::string>(),
                    .kind = b.value("kind", std::string(ANY_KIND)),
                    .confirm = b.value("confirm", false)
                });
            }
            config.key_bindings = KeyBindings(std::move(parsed));
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }

    config.validate();
    return config;
}

Config Config::load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        LOG_INFO("Config", "No configuration at '" + path + "', using defaults");
        return defaults();
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot read " + path);
    }

    json data;
    try {
        data = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }

    auto config = from_json(data);
    LOG_INFO("Config", std::format("Loaded {} ({} key bindings)",
             path, config.key_bindings.all().size()));
    return config;
}

std::string Config::default_path() {
    if (const char* explicit_path = std::getenv("KLS_CONFIG")) {
        return explicit_path;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/kls/config.json";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/kls/config.json";
    }
    return "";
}

std::string Config::expand_home(const std::string& path) {
    if (path.rfind("~/", 0) != 0) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

void Config::validate() const {
    if (kubectl.empty()) {
        throw ConfigError("kubectl must not be empty");
    }
    if (refresh_interval_ms <= 0) {
        throw ConfigError("refresh_interval_ms must be positive");
    }
    if (input_timeout_ms <= 0) {
        throw ConfigError("input_timeout_ms must be positive");
    }
    if (panels.size() != PANEL_COUNT) {
        throw ConfigError(std::format("expected {} panels, got {}",
                          static_cast<size_t>(PANEL_COUNT), panels.size()));
    }
    for (const auto& panel : panels) {
        if (panel.width <= 0) {
            throw ConfigError("panel '" + panel.title + "' needs a positive width");
        }
    }
    if (auto problem = key_bindings.validate()) {
        throw ConfigError("key_bindings: " + *problem);
    }
}

} // namespace kls::tui
