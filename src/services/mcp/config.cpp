#include "services/mcp/config.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using ordered_json = nlohmann::ordered_json;

namespace vigil::services::mcp {

namespace {

constexpr const char* kConfigName = ".mcp.json";

} // namespace

std::string find_mcp_config(const std::string& start_dir) {
    std::error_code ec;
    fs::path start = fs::absolute(start_dir, ec);
    if (ec) {
        start = start_dir;
    }

    for (fs::path dir = start; ; dir = dir.parent_path()) {
        fs::path candidate = dir / kConfigName;
        if (fs::exists(candidate, ec)) {
            return candidate.string();
        }
        if (dir == dir.parent_path()) {
            break;
        }
    }
    return (start / kConfigName).string();
}

McpConfigResult parse_mcp_config(const std::string& content) {
    McpConfigResult result;
    try {
        ordered_json j = ordered_json::parse(content);
        if (!j.is_object()) {
            result.error = "top-level value is not an object";
            return result;
        }
        auto servers = j.find("mcpServers");
        if (servers == j.end()) {
            return result;
        }
        if (!servers->is_object()) {
            result.error = "mcpServers is not an object";
            return result;
        }

        std::vector<McpServer> parsed;
        for (auto& [name, entry] : servers->items()) {
            McpServer server;
            server.name = name;
            server.command = entry.at("command").get<std::string>();
            if (entry.contains("args")) {
                server.args = entry["args"].get<std::vector<std::string>>();
            }
            if (entry.contains("cwd") && entry["cwd"].is_string()) {
                server.cwd = entry["cwd"].get<std::string>();
            }
            parsed.push_back(std::move(server));
        }
        result.servers = std::move(parsed);
    } catch (const ordered_json::exception& e) {
        // An invalid entry invalidates the whole file
        result.servers.clear();
        result.error = e.what();
    }
    return result;
}

McpConfigResult load_mcp_config(const std::string& path) {
    McpConfigResult result;
    result.path = path;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("No MCP config at {}", path);
        return result;
    }

    std::ifstream in(path);
    if (!in) {
        result.error = "cannot open " + path;
        spdlog::warn("Ignoring MCP config: {}", *result.error);
        return result;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_mcp_config(buffer.str());
    parsed.path = path;
    if (parsed.error) {
        spdlog::warn("Ignoring invalid MCP config {}: {}", path, *parsed.error);
    } else {
        spdlog::debug("Loaded {} MCP server(s) from {}", parsed.servers.size(), path);
    }
    return parsed;
}

} // namespace vigil::services::mcp
