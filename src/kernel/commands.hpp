#pragma once
#include <string>
#include <vector>
#include "kernel/command_router.hpp"
#include "kernel/context.hpp"

namespace vigil::kernel {

class ChatCommands final : public CommandModule {
public:
    explicit ChatCommands(VigilContext& context) : context_(context) {}
    void register_commands(CommandRouter& router) override;
private:
    int handle_models(const std::vector<std::string>& args);
    int handle_ask(const std::vector<std::string>& args);
    int handle_candidates(const std::vector<std::string>& args);
    VigilContext& context_;
};

class McpCommands final : public CommandModule {
public:
    explicit McpCommands(VigilContext& context) : context_(context) {}
    void register_commands(CommandRouter& router) override;
private:
    int handle_servers(const std::vector<std::string>& args);
    int handle_resources(const std::vector<std::string>& args);
    int handle_read(const std::vector<std::string>& args);
    VigilContext& context_;
};

// Pretty-print JSON documents; anything else is returned unchanged
std::string format_resource_text(const std::string& text);

} // namespace vigil::kernel
