#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace kls::tui {

/**
 * Runs at most one background row fetch at a time.
 *
 * The job runs on a worker thread while holding the exclusivity guard that
 * external command execution also takes. Its result is only handed back by
 * take_result() on the main thread, and only if no cancel() was issued since
 * the job started. cancel() stops the job and joins the worker before
 * returning, so once it returns nothing is touching the fetched data.
 */
class RefreshScheduler {
public:
    using Job = std::function<std::vector<std::string>(std::stop_token)>;

    explicit RefreshScheduler(std::mutex& guard);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // Start a job unless one is already in flight
    bool start(Job job);

    // A job has been started and its result not yet taken or cancelled
    bool in_flight() const { return worker_.joinable(); }

    // The in-flight job has produced its result
    bool finished() const;

    // Result of the finished job, if it belongs to the current generation
    std::optional<std::vector<std::string>> take_result();

    // Stop and await the in-flight job, discarding its result
    void cancel();

    uint64_t generation() const;

private:
    struct Outcome {
        uint64_t generation;
        std::vector<std::string> rows;
    };

    std::mutex& guard_;
    mutable std::mutex state_mutex_;
    uint64_t generation_ = 0;
    std::optional<Outcome> outcome_;
    std::jthread worker_;
};

} // namespace kls::tui
