#include "review/review_scheduler.hpp"
#include "services/git/diff_provider.hpp"
#include "services/llm/gateway_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace vigil::review {

const char* const kReviewPrompt =
    "Review this diff as a security-minded code reviewer. Flag hardcoded credentials or "
    "secrets, injection risks, obvious bugs and leftover debug artifacts (print statements, "
    "console.log, commented-out code). Respond in at most three short lines. Start the "
    "response with exactly one tag: [CRITICAL], [WARNING] or [SAFE].";

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Clears the reentrancy flag on every exit path
class ReviewingGuard {
public:
    explicit ReviewingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ReviewingGuard() { flag_ = false; }

    ReviewingGuard(const ReviewingGuard&) = delete;
    ReviewingGuard& operator=(const ReviewingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::SAFE: return "safe";
        case Severity::WARNING: return "warning";
        case Severity::CRITICAL: return "critical";
        case Severity::ERROR: return "error";
    }
    return "unknown";
}

Severity classify_review(const std::string& response) {
    if (response.rfind("Error:", 0) == 0) {
        return Severity::ERROR;
    }
    std::string lower = lowercase(response);
    if (lower.find("[critical]") != std::string::npos) {
        return Severity::CRITICAL;
    }
    if (lower.find("[warning]") != std::string::npos) {
        return Severity::WARNING;
    }
    return Severity::SAFE;
}

ReviewScheduler::ReviewScheduler(services::llm::GatewayClient& client,
                                 services::git::DiffProvider& diffs,
                                 ModelSource model_source,
                                 bool enabled)
    : client_(client),
      diffs_(diffs),
      model_source_(std::move(model_source)),
      enabled_(enabled) {}

void ReviewScheduler::set_enabled(bool enabled) {
    if (enabled_.exchange(enabled) != enabled) {
        spdlog::info("Shadow review {}", enabled ? "enabled" : "disabled");
    }
}

std::optional<ReviewResult> ReviewScheduler::last_result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return last_result_;
}

std::optional<std::string> ReviewScheduler::review_subject() {
    std::string diff = diffs_.unstaged();
    if (!services::git::is_empty_diff(diff)) {
        return diff;
    }
    diff = diffs_.staged();
    if (!services::git::is_empty_diff(diff)) {
        return diff;
    }
    return std::nullopt;
}

std::optional<ReviewResult> ReviewScheduler::run_shadow_review() {
    if (!enabled_ || reviewing_) {
        return std::nullopt;
    }

    auto model = model_source_ ? model_source_() : std::nullopt;
    if (!model || !client_.connected()) {
        return std::nullopt;
    }

    if (reviewing_.exchange(true)) {
        return std::nullopt;
    }
    ReviewingGuard guard(reviewing_);

    ReviewResult result;
    try {
        auto subject = review_subject();
        if (!subject) {
            return std::nullopt;
        }

        size_t hash = std::hash<std::string>{}(*subject);
        if (last_diff_hash_ == hash) {
            return std::nullopt;
        }
        last_diff_hash_ = hash;

        result = review(*subject, *model);
    } catch (const std::exception& e) {
        spdlog::error("Shadow review failed: {}", e.what());
        result.severity = Severity::ERROR;
        result.message = std::string("Error: shadow review failed: ") + e.what();
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        last_result_ = result;
    }
    return result;
}

ReviewResult ReviewScheduler::review(const std::string& subject, const std::string& model) {
    spdlog::debug("Shadow review of {} byte diff with {}", subject.size(), model);

    services::llm::ChatRequest request;
    request.prompt = kReviewPrompt;
    request.context = subject;
    request.model = model;

    std::string text = client_.chat(request).text();

    ReviewResult result;
    result.severity = classify_review(text);
    result.message = text;
    return result;
}

} // namespace vigil::review
