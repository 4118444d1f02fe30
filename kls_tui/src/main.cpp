#include "application.hpp"
#include "config.hpp"
#include "kube_client.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <memory>

#include "ncurses_terminal.hpp"

using namespace kls::tui;

namespace {

// Row sources for the four cascade panels, left to right
std::vector<RowFetcher> make_fetchers(const std::string& kubectl) {
    auto kube = std::make_shared<KubeClient>(kubectl);

    return {
        [kube](const std::vector<std::string>&, std::stop_token stop) {
            return kube->get_contexts(stop);
        },
        [kube](const std::vector<std::string>& upstream, std::stop_token stop) {
            return kube->get_namespaces(upstream.at(CONTEXTS), stop);
        },
        [kube](const std::vector<std::string>& upstream, std::stop_token stop) {
            return kube->get_api_resources(upstream.at(CONTEXTS), stop);
        },
        [kube](const std::vector<std::string>& upstream, std::stop_token stop) {
            return kube->get_resources(upstream.at(CONTEXTS), upstream.at(NAMESPACES),
                                       upstream.at(API_RESOURCES), stop);
        }
    };
}

void configure_logging(const Config& config) {
    auto& logger = Logger::instance();
    logger.set_min_level(config.log_level);

    if (!config.log_file.empty() && !logger.set_file(config.log_file)) {
        LOG_WARN("main", "Cannot write log file " + config.log_file);
    }
}

} // namespace

int main() {
    Config config;
    try {
        config = Config::load(Config::default_path());
    } catch (const ConfigError& e) {
        LOG_CRITICAL("main", std::string("Invalid configuration: ") + e.what());
        std::cerr << "kls: invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    configure_logging(config);
    LOG_INFO("main", "kls starting...");

    NcursesTerminal terminal(config.input_timeout_ms);

    try {
        terminal.init();

        Application app(config, terminal, make_fetchers(config.kubectl));
        app.init();
        app.run();
        app.shutdown();
    } catch (const std::exception& e) {
        terminal.shutdown();
        LOG_CRITICAL("main", std::string("Fatal error: ") + e.what());
        std::cerr << "kls: " << e.what() << std::endl;
        return 1;
    }

    terminal.shutdown();
    LOG_INFO("main", "kls shutting down...");
    return 0;
}
