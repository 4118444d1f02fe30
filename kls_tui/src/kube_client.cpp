#include "kube_client.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <format>
#include <set>

namespace kls::tui {

KubeClient::KubeClient(const std::string& kubectl)
    : runner_(std::make_unique<ProcessRunner>(kubectl)) {
    LOG_INFO("KubeClient", "Using " + kubectl);
}

// ==================================================================
// Cascade queries
// ==================================================================

std::optional<std::vector<std::string>> KubeClient::get_contexts(std::stop_token stop) {
    auto contexts = run({"config", "get-contexts", "-o", "name"}, "get_contexts", stop);
    if (!contexts) {
        return std::nullopt;
    }

    auto current = run({"config", "current-context"}, "current_context", stop);
    if (current && !current->empty()) {
        return promote(std::move(*contexts), current->front());
    }
    return contexts;
}

std::optional<std::vector<std::string>> KubeClient::get_namespaces(const std::string& context,
                                                                    std::stop_token stop) {
    auto namespaces = run({"--context", context, "get", "ns", "--no-headers",
                           "-o", "custom-columns=NAME:.metadata.name"},
                          "get_namespaces", stop);
    if (!namespaces) {
        return std::nullopt;
    }

    auto current = run({"config", "view", "--minify", "--context", context,
                        "-o", "jsonpath={..namespace}"},
                       "current_namespace", stop);
    if (current && !current->empty()) {
        return promote(std::move(*namespaces), current->front());
    }
    return namespaces;
}

std::optional<std::vector<std::string>> KubeClient::get_api_resources(const std::string& context,
                                                                       std::stop_token stop) {
    auto lines = run({"--context", context, "api-resources", "--no-headers", "--verbs=get"},
                     "get_api_resources", stop);
    if (!lines) {
        return std::nullopt;
    }

    std::vector<std::string> kinds;
    kinds.reserve(lines->size());
    for (const auto& line : *lines) {
        kinds.push_back(resource_name(line));
    }
    return order_api_resources(kinds);
}

std::optional<std::vector<std::string>> KubeClient::get_resources(const std::string& context,
                                                                   const std::string& ns,
                                                                   const std::string& kind,
                                                                   std::stop_token stop) {
    return run({"--context", context, "-n", ns, "get", kind, "--no-headers", "--ignore-not-found"},
               "get_resources", stop);
}

// ==================================================================
// Helper methods
// ==================================================================

const std::vector<std::string>& KubeClient::top_api_resources() {
    static const std::vector<std::string> top = {
        "pods",
        "services",
        "configmaps",
        "secrets",
        "persistentvolumeclaims",
        "ingresses",
        "nodes",
        "deployments",
        "statefulsets",
        "daemonsets",
        "storageclasses"
    };
    return top;
}

std::vector<std::string> KubeClient::promote(std::vector<std::string> items, const std::string& first) {
    items.erase(std::remove(items.begin(), items.end(), first), items.end());
    items.insert(items.begin(), first);
    return items;
}

std::vector<std::string> KubeClient::order_api_resources(const std::vector<std::string>& cluster_kinds) {
    std::vector<std::string> result;
    std::set<std::string> seen;

    for (const auto& kind : top_api_resources()) {
        result.push_back(kind);
        seen.insert(kind);
    }
    for (const auto& kind : cluster_kinds) {
        if (!kind.empty() && seen.insert(kind).second) {
            result.push_back(kind);
        }
    }
    return result;
}

std::string KubeClient::resource_name(const std::string& row) {
    size_t start = row.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = row.find_first_of(" \t", start);
    return row.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::optional<std::vector<std::string>> KubeClient::run(const std::vector<std::string>& args,
                                                         const std::string& query,
                                                         std::stop_token stop) {
    auto result = runner_->capture(args, stop);

    if (result.cancelled) {
        LOG_DEBUG("KubeClient", query + ": cancelled");
        return std::nullopt;
    }
    if (!result.success) {
        LOG_ERROR("KubeClient", std::format("{}: {}", query, result.error_message));
        return std::nullopt;
    }
    return std::move(result.lines);
}

} // namespace kls::tui
