/**
 * Vigil Daemon
 *
 * Owns and wires every subsystem:
 * - Reactor (epoll loop with timerfd timers)
 * - GatewayClient + ModelSelector (inference server access)
 * - DiffProvider (git) and McpClient (resource inspector)
 * - ChangeDetector / ReviewScheduler / WatchLoop (shadow review)
 */
#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
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

namespace vigil::review {
class ChangeDetector;
class ReviewScheduler;
class WatchLoop;
} // namespace vigil::review

namespace vigil::kernel {

class CommandModule;
class CommandRouter;
class Reactor;
struct VigilContext;

class Daemon {
public:
    using Config = VigilConfig;

    // Components to use instead of the defaults built from Config
    struct Dependencies {
        std::unique_ptr<Reactor> reactor;
        std::unique_ptr<services::llm::GatewayClient> gateway;
        std::unique_ptr<services::git::DiffProvider> diffs;
        std::unique_ptr<services::mcp::McpClient> mcp;
    };

    explicit Daemon(const Config& config);
    Daemon(const Config& config, Dependencies deps);
    ~Daemon();

    // Non-copyable
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Run a one-shot command; returns the process exit code
    int execute(const std::string& command, const std::vector<std::string>& args);

    // Set up the watch loop and timers
    bool init();

    // Watch until shutdown (blocks until Ctrl+C)
    void run();

    // Request shutdown
    void shutdown();

    // Check if running
    bool is_running() const { return running_; }

    // Usage text for all commands
    std::string usage() const;

    const Config& get_config() const { return config_; }
    services::llm::GatewayClient& gateway() { return *gateway_; }
    review::ReviewScheduler& scheduler() { return *scheduler_; }

private:
    Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<services::llm::GatewayClient> gateway_;
    std::unique_ptr<services::llm::ModelSelector> selector_;
    std::unique_ptr<services::git::DiffProvider> diffs_;
    std::unique_ptr<services::mcp::McpClient> mcp_;
    std::unique_ptr<review::ReviewScheduler> scheduler_;
    std::unique_ptr<review::ChangeDetector> detector_;
    std::unique_ptr<review::WatchLoop> watch_loop_;
    std::unique_ptr<VigilContext> context_;
    std::unique_ptr<CommandRouter> router_;
    std::vector<std::unique_ptr<CommandModule>> modules_;

    std::optional<bool> last_connected_;

    // Timer handlers
    void on_refresh_timer();
    void on_watch_timer();
};

} // namespace vigil::kernel
