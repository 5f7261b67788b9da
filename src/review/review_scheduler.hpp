#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace vigil::services::llm {
class GatewayClient;
} // namespace vigil::services::llm

namespace vigil::services::git {
class DiffProvider;
} // namespace vigil::services::git

namespace vigil::review {

enum class Severity {
    SAFE,
    WARNING,
    CRITICAL,
    ERROR
};

const char* severity_to_string(Severity severity);

struct ReviewResult {
    Severity severity = Severity::SAFE;
    std::string message;
};

// Map a raw review response to a severity. "Error:" responses are errors;
// otherwise the [CRITICAL] and [WARNING] tags are matched case-insensitively.
Severity classify_review(const std::string& response);

// Instructions sent with every shadow review
extern const char* const kReviewPrompt;

// Supplies the currently selected model, if any
using ModelSource = std::function<std::optional<std::string>()>;

class ReviewScheduler {
public:
    ReviewScheduler(services::llm::GatewayClient& client,
                    services::git::DiffProvider& diffs,
                    ModelSource model_source,
                    bool enabled = true);

    // Non-copyable
    ReviewScheduler(const ReviewScheduler&) = delete;
    ReviewScheduler& operator=(const ReviewScheduler&) = delete;

    // Review the working tree diff when enabled, idle, connected and the diff
    // differs from the last one reviewed. Returns nullopt when nothing ran.
    std::optional<ReviewResult> run_shadow_review();

    void set_enabled(bool enabled);
    bool enabled() const { return enabled_; }
    bool reviewing() const { return reviewing_; }

    // Passive indicator: the most recent completed review
    std::optional<ReviewResult> last_result() const;

private:
    services::llm::GatewayClient& client_;
    services::git::DiffProvider& diffs_;
    ModelSource model_source_;

    std::atomic<bool> enabled_;
    std::atomic<bool> reviewing_{false};
    std::optional<size_t> last_diff_hash_;

    mutable std::mutex result_mutex_;
    std::optional<ReviewResult> last_result_;

    // Unstaged diff, else staged diff, else nullopt
    std::optional<std::string> review_subject();

    ReviewResult review(const std::string& subject, const std::string& model);
};

} // namespace vigil::review
