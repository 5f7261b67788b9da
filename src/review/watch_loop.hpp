#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include "review/change_detector.hpp"
#include "review/review_scheduler.hpp"

namespace vigil::review {

// Poll tick driver: runs the change detector and, when files changed and the
// cooldown since the previous attempt has elapsed, triggers a shadow review.
class WatchLoop {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    WatchLoop(ChangeDetector& detector, ReviewScheduler& scheduler,
              std::chrono::milliseconds cooldown, Clock clock = nullptr);

    // One poll. Returns the review result when a review ran.
    std::optional<ReviewResult> tick();

    // Changes seen but not yet handed to a review attempt
    bool pending() const { return pending_; }

    uint64_t attempts() const { return attempts_; }

private:
    ChangeDetector& detector_;
    ReviewScheduler& scheduler_;
    std::chrono::milliseconds cooldown_;
    Clock clock_;

    bool pending_ = false;
    uint64_t attempts_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_attempt_;

    static void report(const ReviewResult& result);
};

} // namespace vigil::review
