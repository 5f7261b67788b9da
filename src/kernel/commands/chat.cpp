#include "kernel/commands.hpp"
#include "kernel/quick_actions.hpp"
#include "services/llm/gateway_client.hpp"
#include "services/llm/model_selector.hpp"
#include <spdlog/spdlog.h>
#include <iostream>

namespace vigil::kernel {

void ChatCommands::register_commands(CommandRouter& router) {
    router.register_handler("models", "models                      List models advertised by the server",
        [this](const std::vector<std::string>& args) { return handle_models(args); });
    router.register_handler("ask", "ask <action>                Run a quick action (ping, explain-diff, summarize-staged, suggest-commit)",
        [this](const std::vector<std::string>& args) { return handle_ask(args); });
    router.register_handler("candidates", "candidates                  Show API roots in probe order",
        [this](const std::vector<std::string>& args) { return handle_candidates(args); });
}

int ChatCommands::handle_models(const std::vector<std::string>&) {
    context_.selector.refresh(true);
    if (context_.config.model) {
        context_.selector.select(*context_.config.model);
    }

    std::cout << context_.selector.status_line() << "\n";
    if (!context_.gateway.connected()) {
        return 1;
    }

    auto selected = context_.selector.selected();
    for (const auto& model : context_.gateway.models()) {
        std::cout << (selected == model ? "* " : "  ") << model << "\n";
    }
    std::cout << "API root: " << context_.gateway.base_url() << "\n";
    return 0;
}

int ChatCommands::handle_ask(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: vigil ask <action>\nActions:\n";
        for (const auto& action : quick_actions()) {
            std::cerr << "  " << action.name << "  " << action.description << "\n";
        }
        return 1;
    }

    auto& gateway = context_.gateway;
    auto& selector = context_.selector;

    if (!gateway.connected()) {
        selector.refresh(true);
    }
    if (!gateway.connected()) {
        std::cout << "LM Studio not connected";
        if (auto error = gateway.last_error()) {
            std::cout << " (" << *error << ")";
        }
        std::cout << "\n";
        return 1;
    }
    if (context_.config.model) {
        selector.select(*context_.config.model);
    }

    auto model = selector.selected();
    if (!model) {
        std::cout << "No model selected\n";
        return 1;
    }

    auto request = build_quick_action(args[0], context_.diffs, model);
    if (!request) {
        std::cerr << "Unknown action: " << args[0] << "\n";
        return 1;
    }
    spdlog::debug("Running {} with {}", args[0], *model);

    services::llm::ChatResult result;
    if (context_.config.stream) {
        result = gateway.chat_stream(*request, [](const std::string& fragment) {
            std::cout << fragment << std::flush;
        });
        std::cout << "\n";
    } else {
        result = gateway.chat(*request);
        std::cout << result.text() << "\n";
    }
    return result.success ? 0 : 1;
}

int ChatCommands::handle_candidates(const std::vector<std::string>&) {
    for (const auto& candidate : context_.gateway.candidates()) {
        std::cout << candidate << "\n";
    }
    return 0;
}

} // namespace vigil::kernel
