#include "kernel/commands.hpp"
#include "services/mcp/client.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace vigil::kernel {

std::string format_resource_text(const std::string& text) {
    try {
        return json::parse(text).dump(2);
    } catch (const json::exception&) {
        return text;
    }
}

void McpCommands::register_commands(CommandRouter& router) {
    router.register_handler("servers", "servers                     List MCP servers from .mcp.json",
        [this](const std::vector<std::string>& args) { return handle_servers(args); });
    router.register_handler("resources", "resources <server>          List resources of an MCP server",
        [this](const std::vector<std::string>& args) { return handle_resources(args); });
    router.register_handler("read", "read <server> <uri>         Print an MCP resource",
        [this](const std::vector<std::string>& args) { return handle_read(args); });
}

int McpCommands::handle_servers(const std::vector<std::string>&) {
    auto names = context_.mcp.server_names();
    if (names.empty()) {
        std::cout << "No MCP servers configured\n";
        return 0;
    }
    for (const auto& name : names) {
        std::cout << name << "\n";
    }
    return 0;
}

int McpCommands::handle_resources(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: vigil resources <server>\n";
        return 1;
    }

    auto resources = context_.mcp.list_resources(args[0]);
    if (resources.empty()) {
        std::cout << "No resources found (is the server running?)\n";
        return 1;
    }
    for (const auto& resource : resources) {
        std::cout << resource.name << "\t" << resource.uri;
        if (!resource.description.empty()) {
            std::cout << "\t" << resource.description;
        }
        std::cout << "\n";
    }
    std::cout << resources.size() << " resources available\n";
    return 0;
}

int McpCommands::handle_read(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: vigil read <server> <uri>\n";
        return 1;
    }
    std::string text = context_.mcp.read_resource(args[0], args[1]);
    std::cout << format_resource_text(text) << "\n";
    bool failed = text.rfind("Error reading resource:", 0) == 0 || text.rfind("Server not found:", 0) == 0;
    return failed ? 1 : 0;
}

} // namespace vigil::kernel
