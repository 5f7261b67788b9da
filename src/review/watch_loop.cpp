#include "review/watch_loop.hpp"
#include <spdlog/spdlog.h>

namespace vigil::review {

WatchLoop::WatchLoop(ChangeDetector& detector, ReviewScheduler& scheduler,
                     std::chrono::milliseconds cooldown, Clock clock)
    : detector_(detector),
      scheduler_(scheduler),
      cooldown_(cooldown),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

std::optional<ReviewResult> WatchLoop::tick() {
    try {
        auto changes = detector_.check_for_changes();
        if (changes.changed) {
            spdlog::debug("Changes under {}: {} added, {} modified, {} deleted",
                detector_.root(), changes.added.size(), changes.modified.size(),
                changes.deleted.size());
            pending_ = true;
        }

        if (!pending_) {
            return std::nullopt;
        }

        auto now = clock_();
        if (last_attempt_ && now - *last_attempt_ < cooldown_) {
            return std::nullopt;
        }

        pending_ = false;
        last_attempt_ = now;
        ++attempts_;

        auto result = scheduler_.run_shadow_review();
        if (result) {
            report(*result);
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Watch tick failed: {}", e.what());
    }
    return std::nullopt;
}

void WatchLoop::report(const ReviewResult& result) {
    switch (result.severity) {
        case Severity::CRITICAL:
            spdlog::error("Shadow review [critical]: {}", result.message);
            break;
        case Severity::WARNING:
            spdlog::warn("Shadow review [warning]: {}", result.message);
            break;
        case Severity::ERROR:
            spdlog::warn("Shadow review [error]: {}", result.message);
            break;
        case Severity::SAFE:
            spdlog::info("Shadow review: safe");
            break;
    }
}

} // namespace vigil::review
