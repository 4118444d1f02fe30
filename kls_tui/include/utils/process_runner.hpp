#pragma once

#include <string>
#include <vector>
#include <stop_token>

namespace kls::tui {

struct ProcessResult {
    int exit_code;
    std::vector<std::string> lines;
    bool success;
    bool cancelled;
    std::string error_message;
};

class ProcessRunner {
public:
    explicit ProcessRunner(const std::string& program);

    // Run the program with args and collect trimmed, non-empty stdout lines.
    // stdin and stderr are redirected to /dev/null. A stop request kills the
    // child and reaps it before returning.
    ProcessResult capture(const std::vector<std::string>& args,
                          std::stop_token stop = {}) const;

    const std::string& program() const { return program_; }

    // Split raw output into trimmed lines, dropping empty ones
    static std::vector<std::string> split_lines(const std::string& output);

    // Run a command line through /bin/sh in the foreground. Returns the
    // shell's exit status, or -1 if it could not be started.
    static int run_shell(const std::string& command);

private:
    std::string program_;
};

} // namespace kls::tui
