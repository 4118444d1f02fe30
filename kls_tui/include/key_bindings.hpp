#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kls::tui {

// Applicability tag matching every kind
inline constexpr const char* ANY_KIND = "all";

struct KeyBinding {
    std::string key;            // "F1".."F12", "^A".."^Z", "Delete"
    std::string description;
    std::string command;        // template with {context} {namespace} {api_resource} {resource}
    std::string kind = ANY_KIND;
    bool confirm = false;       // destructive: ask before running

    bool applies_to(const std::string& selected_kind) const;
};

// Identifiers substituted into a command template
struct Selection {
    std::string context;
    std::string ns;
    std::string api_resource;
    std::string resource;
};

class KeyBindings {
public:
    KeyBindings() = default;
    explicit KeyBindings(std::vector<KeyBinding> bindings);

    const KeyBinding* find(const std::string& key) const;
    const std::vector<KeyBinding>& all() const { return bindings_; }
    bool empty() const { return bindings_.empty(); }

    // First problem found, if any: unknown or reserved key, duplicate key,
    // empty command, unknown placeholder, empty kind
    std::optional<std::string> validate() const;

    // Footer text such as "^Y: Yaml | ^D: Describe"
    std::string hints() const;

    static KeyBindings defaults();

    static bool is_valid_key(const std::string& key);

    // Substitute the selection into a template. Pipelines into batcat get
    // paging and line numbers unless they already choose a style.
    static std::string expand(const std::string& command_template, const Selection& selection);

private:
    std::vector<KeyBinding> bindings_;
};

} // namespace kls::tui
