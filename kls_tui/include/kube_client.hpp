#pragma once

#include "utils/process_runner.hpp"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace kls::tui {

class KubeClient {
public:
    explicit KubeClient(const std::string& kubectl = "kubectl");

    // ==================================================================
    // Cascade queries
    // ==================================================================

    // Context names, current context first
    std::optional<std::vector<std::string>> get_contexts(std::stop_token stop = {});

    // Namespaces of a context, its configured namespace first
    std::optional<std::vector<std::string>> get_namespaces(const std::string& context,
                                                           std::stop_token stop = {});

    // Gettable kinds: popular kinds first, then the rest as the cluster lists them
    std::optional<std::vector<std::string>> get_api_resources(const std::string& context,
                                                              std::stop_token stop = {});

    // Resource rows of one kind in one namespace
    std::optional<std::vector<std::string>> get_resources(const std::string& context,
                                                          const std::string& ns,
                                                          const std::string& kind,
                                                          std::stop_token stop = {});

    // Kinds listed ahead of everything the cluster reports
    static const std::vector<std::string>& top_api_resources();

    // Put `first` at the front of `items`, dropping its other occurrences
    static std::vector<std::string> promote(std::vector<std::string> items, const std::string& first);

    // Popular kinds first, then the remaining cluster kinds in order
    static std::vector<std::string> order_api_resources(const std::vector<std::string>& cluster_kinds);

    // Resource name from a table row: its first column
    static std::string resource_name(const std::string& row);

private:
    std::unique_ptr<ProcessRunner> runner_;

    // Run kubectl and log failures
    std::optional<std::vector<std::string>> run(const std::vector<std::string>& args,
                                                const std::string& query,
                                                std::stop_token stop);
};

} // namespace kls::tui
