#pragma once
#include <optional>
#include <string>
#include <vector>
#include "services/llm/gateway_client.hpp"

namespace vigil::services::git {
class DiffProvider;
} // namespace vigil::services::git

namespace vigil::kernel {

// One-shot prompts run against the working tree
struct QuickAction {
    std::string name;
    std::string description;
};

const std::vector<QuickAction>& quick_actions();

// Build the chat request for a named action, reading whatever diff it needs.
// Returns nullopt for unknown names.
std::optional<services::llm::ChatRequest> build_quick_action(
    const std::string& name, services::git::DiffProvider& diffs,
    const std::optional<std::string>& model);

} // namespace vigil::kernel
