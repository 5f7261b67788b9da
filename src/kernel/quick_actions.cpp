#include "kernel/quick_actions.hpp"
#include "services/git/diff_provider.hpp"

namespace vigil::kernel {

const std::vector<QuickAction>& quick_actions() {
    static const std::vector<QuickAction> actions = {
        {"ping", "Check the model answers"},
        {"explain-diff", "Explain the unstaged diff"},
        {"summarize-staged", "Summarize staged changes"},
        {"suggest-commit", "Suggest a commit message"},
    };
    return actions;
}

std::optional<services::llm::ChatRequest> build_quick_action(
    const std::string& name, services::git::DiffProvider& diffs,
    const std::optional<std::string>& model) {
    services::llm::ChatRequest request;
    request.model = model;

    if (name == "ping") {
        request.prompt = "Reply with exactly: pong";
    } else if (name == "explain-diff") {
        request.prompt = "Explain what this diff does. Be concise.";
        request.context = diffs.unstaged();
    } else if (name == "summarize-staged") {
        request.prompt = "Summarize these staged changes. What's the intent?";
        request.context = diffs.staged();
    } else if (name == "suggest-commit") {
        request.prompt = "Suggest a commit message for these changes. Just the message, no explanation.";
        request.context = diffs.staged();
        if (request.context == services::git::kNothingStaged) {
            request.context = diffs.unstaged();
        }
    } else {
        return std::nullopt;
    }
    return request;
}

} // namespace vigil::kernel
