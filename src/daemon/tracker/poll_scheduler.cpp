#include "tracker/poll_scheduler.hpp"

#include <format>
#include <print>

PollScheduler::PollScheduler(std::unique_ptr<WindowBackend> backend,
                             std::chrono::milliseconds interval, bool verbose)
    : backend_(std::move(backend)), interval_(interval), verbose_(verbose) {}

PollScheduler::~PollScheduler() {
    stop();
}

void PollScheduler::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) return;

    stopped_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    if (!backend_) {
        log("no supported compositor detected, window tracking disabled");
    }
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void PollScheduler::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    stopped_.store(true, std::memory_order_release);
    running_.store(false, std::memory_order_release);

    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

PollScheduler::TickOutcome PollScheduler::tick() {
    if (!backend_) return TickOutcome::NoBackend;

    std::unique_lock poll_lock(poll_mutex_, std::try_to_lock);
    if (!poll_lock.owns_lock()) {
        std::lock_guard lock(stats_mutex_);
        stats_.ticks_skipped++;
        return TickOutcome::Skipped;
    }

    auto result = backend_->poll();

    if (stopped_.load(std::memory_order_acquire)) {
        return TickOutcome::Discarded;
    }

    if (!result) {
        auto msg = describe(result.error());
        {
            std::lock_guard lock(stats_mutex_);
            stats_.polls_failed++;
            stats_.last_error = msg;
        }
        log(std::format("{} poll failed, keeping last state: {}", to_string(backend_->kind()), msg));
        return TickOutcome::Failed;
    }

    auto n = result->windows.size();
    registry_.replace(std::move(*result));
    {
        std::lock_guard lock(stats_mutex_);
        stats_.polls_ok++;
    }
    log(std::format("{} poll: {} windows", to_string(backend_->kind()), n));
    return TickOutcome::Replaced;
}

PollScheduler::Stats PollScheduler::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void PollScheduler::run(std::stop_token st) {
    while (!st.stop_requested()) {
        tick();

        std::unique_lock lock(wait_mutex_);
        wake_.wait_for(lock, st, interval_, [] { return false; });
    }
}

void PollScheduler::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dockwatch] {}", msg);
    }
}
