#include "utils/process_runner.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kls::tui {

namespace {

// How often a blocked read wakes up to check for a stop request
constexpr int POLL_INTERVAL_MS = 50;

ProcessResult failure(const std::string& message) {
    return ProcessResult{
        .exit_code = -1,
        .lines = {},
        .success = false,
        .cancelled = false,
        .error_message = message
    };
}

int wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ProcessRunner::ProcessRunner(const std::string& program)
    : program_(program) {
}

ProcessResult ProcessRunner::capture(const std::vector<std::string>& args,
                                     std::stop_token stop) const {
    // Build argv before forking; the child only makes system calls
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(program_);
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        return failure(std::string("pipe: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        return failure(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        dup2(pipefd[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(pipefd[1]);

    std::string output;
    bool cancelled = false;
    char buffer[4096];
    pollfd pfd{pipefd[0], POLLIN, 0};

    while (true) {
        if (stop.stop_requested()) {
            kill(pid, SIGKILL);
            cancelled = true;
            break;
        }

        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    close(pipefd[0]);
    int exit_code = wait_for(pid);

    ProcessResult result;
    result.exit_code = exit_code;
    result.cancelled = cancelled;

    if (cancelled) {
        result.success = false;
        result.error_message = "cancelled";
    } else if (exit_code != 0) {
        result.success = false;
        result.error_message = exit_code == 127
            ? "failed to execute " + program_
            : "exit status " + std::to_string(exit_code);
    } else {
        result.success = true;
        result.lines = split_lines(output);
    }

    return result;
}

std::vector<std::string> ProcessRunner::split_lines(const std::string& output) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (start <= output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string::npos) {
            end = output.size();
        }

        std::string line = output.substr(start, end - start);
        size_t first = line.find_first_not_of(" \t\r");
        if (first != std::string::npos) {
            size_t last = line.find_last_not_of(" \t\r");
            lines.push_back(line.substr(first, last - first + 1));
        }

        start = end + 1;
    }

    return lines;
}

int ProcessRunner::run_shell(const std::string& command) {
    int status = std::system(command.c_str());
    if (status == -1) {
        LOG_ERROR("ProcessRunner", "Failed to start shell for: " + command);
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace kls::tui
