#pragma once

#include "kernel/config.hpp"

namespace vigil::services::llm {
class GatewayClient;
class ModelSelector;
} // namespace vigil::services::llm

namespace vigil::services::git {
class DiffProvider;
} // namespace vigil::services::git

namespace vigil::services::mcp {
class McpClient;
} // namespace vigil::services::mcp

namespace vigil::kernel {

// Components handed to command modules. Owned by the Daemon.
struct VigilContext {
    VigilConfig& config;
    services::llm::GatewayClient& gateway;
    services::llm::ModelSelector& selector;
    services::git::DiffProvider& diffs;
    services::mcp::McpClient& mcp;
};

} // namespace vigil::kernel
