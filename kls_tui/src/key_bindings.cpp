#include "key_bindings.hpp"
#include <algorithm>
#include <array>
#include <set>

namespace kls::tui {

namespace {

const std::string BATCAT_STYLE = " --paging always --style numbers";

const std::array<std::string, 4> PLACEHOLDERS = {
    "{context}", "{namespace}", "{api_resource}", "{resource}"
};

// Ctrl letters the terminal or the dispatcher already owns:
// ^C ^Z signals, ^S ^Q flow control, ^H ^I ^J ^M editing keys, ^R refresh
const std::string RESERVED_CTRL = "CHIJMQRSZ";

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

bool KeyBinding::applies_to(const std::string& selected_kind) const {
    return kind == ANY_KIND || kind == selected_kind;
}

KeyBindings::KeyBindings(std::vector<KeyBinding> bindings)
    : bindings_(std::move(bindings)) {
}

const KeyBinding* KeyBindings::find(const std::string& key) const {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&key](const KeyBinding& b) { return b.key == key; });
    return it == bindings_.end() ? nullptr : &*it;
}

std::optional<std::string> KeyBindings::validate() const {
    std::set<std::string> seen;

    for (const auto& binding : bindings_) {
        if (!is_valid_key(binding.key)) {
            return "invalid or reserved key '" + binding.key + "'";
        }
        if (!seen.insert(binding.key).second) {
            return "key '" + binding.key + "' is bound twice";
        }
        if (binding.command.empty()) {
            return "key '" + binding.key + "' has an empty command";
        }
        if (binding.kind.empty()) {
            return "key '" + binding.key + "' has an empty kind";
        }

        size_t open = binding.command.find('{');
        while (open != std::string::npos) {
            size_t close = binding.command.find('}', open);
            if (close == std::string::npos) {
                return "key '" + binding.key + "': unterminated placeholder";
            }
            std::string token = binding.command.substr(open, close - open + 1);
            if (std::find(PLACEHOLDERS.begin(), PLACEHOLDERS.end(), token) == PLACEHOLDERS.end()) {
                return "key '" + binding.key + "': unknown placeholder " + token;
            }
            open = binding.command.find('{', close);
        }
    }

    return std::nullopt;
}

std::string KeyBindings::hints() const {
    std::string out;
    for (const auto& binding : bindings_) {
        if (!out.empty()) {
            out += " | ";
        }
        out += binding.key + ": " + binding.description;
    }
    return out;
}

bool KeyBindings::is_valid_key(const std::string& key) {
    if (key == "Delete") {
        return true;
    }

    if (key.size() == 2 && key[0] == '^') {
        char c = key[1];
        return c >= 'A' && c <= 'Z' && RESERVED_CTRL.find(c) == std::string::npos;
    }

    if (key.size() >= 2 && key.size() <= 3 && key[0] == 'F') {
        std::string digits = key.substr(1);
        if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        int n = std::stoi(digits);
        return n >= 1 && n <= 12 && digits[0] != '0';
    }

    return false;
}

std::string KeyBindings::expand(const std::string& command_template, const Selection& selection) {
    std::string command = command_template;
    replace_all(command, "{context}", selection.context);
    replace_all(command, "{namespace}", selection.ns);
    replace_all(command, "{api_resource}", selection.api_resource);
    replace_all(command, "{resource}", selection.resource);

    if (command.find("batcat") != std::string::npos && command.find("--paging") == std::string::npos) {
        command += BATCAT_STYLE;
    }
    return command;
}

KeyBindings KeyBindings::defaults() {
    return KeyBindings({
        {.key = "^Y", .description = "Yaml",
         .command = "kubectl --context {context} -n {namespace} get {api_resource} {resource} -o yaml | batcat -l yaml"},
        {.key = "^D", .description = "Describe",
         .command = "kubectl --context {context} -n {namespace} describe {api_resource} {resource} | batcat -l yaml"},
        {.key = "^E", .description = "Edit",
         .command = "kubectl --context {context} -n {namespace} edit {api_resource} {resource}"},
        {.key = "^L", .description = "Logs",
         .command = "kubectl --context {context} -n {namespace} logs {resource} | batcat -l log",
         .kind = "pods"},
        {.key = "^X", .description = "Exec",
         .command = "kubectl --context {context} -n {namespace} exec -it {resource} -- sh",
         .kind = "pods"},
        {.key = "^N", .description = "Network debug",
         .command = "kubectl --context {context} -n {namespace} debug {resource} -it --image=nicolaka/netshoot",
         .kind = "pods"},
        {.key = "^A", .description = "Istio logs",
         .command = "kubectl --context {context} -n {namespace} logs {resource} -c istio-proxy | batcat -l log",
         .kind = "pods"},
        {.key = "^P", .description = "Istio exec",
         .command = "kubectl --context {context} -n {namespace} exec -it {resource} -c istio-proxy -- bash",
         .kind = "pods"},
        {.key = "Delete", .description = "Delete",
         .command = "kubectl --context {context} -n {namespace} delete {api_resource} {resource}",
         .confirm = true},
    });
}

} // namespace kls::tui
