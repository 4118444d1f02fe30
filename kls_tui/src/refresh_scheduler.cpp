#include "refresh_scheduler.hpp"
#include "utils/logger.hpp"
#include <format>

namespace kls::tui {

RefreshScheduler::RefreshScheduler(std::mutex& guard)
    : guard_(guard) {
}

RefreshScheduler::~RefreshScheduler() {
    cancel();
}

bool RefreshScheduler::start(Job job) {
    if (worker_.joinable()) {
        return false;
    }

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        outcome_.reset();
        generation = generation_;
    }

    worker_ = std::jthread([this, job = std::move(job), generation](std::stop_token stop) {
        std::vector<std::string> rows;
        {
            std::lock_guard<std::mutex> exclusive(guard_);
            rows = job(stop);
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop.stop_requested() || generation != generation_) {
            return;
        }
        outcome_ = Outcome{.generation = generation, .rows = std::move(rows)};
    });

    LOG_DEBUG("RefreshScheduler", std::format("Started background refresh (generation {})", generation));
    return true;
}

bool RefreshScheduler::finished() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return outcome_.has_value();
}

std::optional<std::vector<std::string>> RefreshScheduler::take_result() {
    if (!finished()) {
        return std::nullopt;
    }

    // The worker exits right after publishing
    worker_.join();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!outcome_ || outcome_->generation != generation_) {
        outcome_.reset();
        return std::nullopt;
    }

    auto rows = std::move(outcome_->rows);
    outcome_.reset();
    return rows;
}

void RefreshScheduler::cancel() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
        LOG_DEBUG("RefreshScheduler", "Cancelled background refresh");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    ++generation_;
    outcome_.reset();
}

uint64_t RefreshScheduler::generation() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return generation_;
}

} // namespace kls::tui
