#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "services/mcp/config.hpp"

namespace vigil::services::mcp {

// A resource advertised by an MCP server
struct McpResource {
    std::string uri;
    std::string name;
    std::string description;
    std::optional<std::string> mime_type;
};

// Browses resources of the servers named in .mcp.json. Each call launches
// the server, performs the JSON-RPC handshake over its stdio, runs one
// request and stops the server again.
class McpClient {
public:
    explicit McpClient(McpConfigResult config,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::vector<std::string> server_names() const;
    const McpConfigResult& config() const { return config_; }

    // Empty when the server is unknown or unreachable
    std::vector<McpResource> list_resources(const std::string& server_name);

    // Text parts joined by newlines. Failures are returned as text:
    // "Server not found: <name>" or "Error reading resource: <cause>".
    std::string read_resource(const std::string& server_name, const std::string& uri);

private:
    McpConfigResult config_;
    std::chrono::milliseconds timeout_;

    const McpServer* find_server(const std::string& name) const;
};

} // namespace vigil::services::mcp
