#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vigil::services::mcp {

// Configuration for an MCP server launched over stdio
struct McpServer {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> cwd;
};

// Servers in file order. A missing or invalid file yields no servers; the
// cause is kept in error for diagnostics.
struct McpConfigResult {
    std::string path;
    std::vector<McpServer> servers;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

// Nearest .mcp.json in start_dir or its parents; start_dir/.mcp.json when
// none exists.
std::string find_mcp_config(const std::string& start_dir);

McpConfigResult load_mcp_config(const std::string& path);

// Parse .mcp.json content ({"mcpServers": {name: {command, args, cwd}}})
McpConfigResult parse_mcp_config(const std::string& content);

} // namespace vigil::services::mcp
