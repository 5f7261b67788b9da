#include "kernel/daemon.hpp"
#include "kernel/command_router.hpp"
#include "kernel/commands.hpp"
#include "kernel/context.hpp"
#include "kernel/reactor.hpp"
#include "review/change_detector.hpp"
#include "review/review_scheduler.hpp"
#include "review/watch_loop.hpp"
#include "services/git/diff_provider.hpp"
#include "services/llm/gateway_client.hpp"
#include "services/llm/model_selector.hpp"
#include "services/mcp/client.hpp"
#include "services/mcp/config.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <filesystem>

namespace vigil::kernel {

// Global daemon pointer for signal handling
static Daemon* g_daemon = nullptr;

static void signal_handler(int) {
    if (g_daemon) {
        g_daemon->shutdown();
    }
}

Daemon::Daemon(const Config& config)
    : Daemon(config, Dependencies{}) {}

Daemon::Daemon(const Config& config, Dependencies deps)
    : config_(config)
{
    reactor_ = std::move(deps.reactor);
    gateway_ = std::move(deps.gateway);
    diffs_ = std::move(deps.diffs);
    mcp_ = std::move(deps.mcp);

    if (!reactor_) {
        reactor_ = std::make_unique<Reactor>();
    }
    if (!gateway_) {
        services::llm::GatewayConfig gateway_config;
        gateway_config.base_url = config_.base_url;
        gateway_config.api_key = config_.api_key;
        gateway_config.models_ttl = config_.models_ttl;
        gateway_config.models_timeout = config_.models_timeout;
        gateway_config.chat_timeout = config_.chat_timeout;
        gateway_ = std::make_unique<services::llm::GatewayClient>(gateway_config);
    }
    if (!diffs_) {
        diffs_ = std::make_unique<services::git::GitDiffProvider>(config_.watch_root);
    }
    if (!mcp_) {
        std::string path = config_.mcp_config_path.value_or(
            services::mcp::find_mcp_config(std::filesystem::current_path().string()));
        mcp_ = std::make_unique<services::mcp::McpClient>(services::mcp::load_mcp_config(path));
    }

    selector_ = std::make_unique<services::llm::ModelSelector>(*gateway_);
    scheduler_ = std::make_unique<review::ReviewScheduler>(
        *gateway_, *diffs_,
        [this]() { return selector_->selected(); },
        config_.shadow_review);

    context_ = std::make_unique<VigilContext>(VigilContext{
        config_,
        *gateway_,
        *selector_,
        *diffs_,
        *mcp_
    });

    router_ = std::make_unique<CommandRouter>();
    modules_.push_back(std::make_unique<ChatCommands>(*context_));
    modules_.push_back(std::make_unique<McpCommands>(*context_));

    router_->register_handler("watch", "watch                       Watch the tree and review changes (default)",
        [this](const std::vector<std::string>&) {
            if (!init()) {
                return 1;
            }
            run();
            return 0;
        });

    for (auto& module : modules_) {
        module->register_commands(*router_);
    }
}

Daemon::~Daemon() {
    if (g_daemon == this) {
        g_daemon = nullptr;
    }
}

int Daemon::execute(const std::string& command, const std::vector<std::string>& args) {
    return router_->handle(command, args);
}

std::string Daemon::usage() const {
    return router_->usage();
}

bool Daemon::init() {
    spdlog::info("Initializing Vigil...");

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(config_.watch_root, ec)) {
        spdlog::error("Watch root {} is not a directory", config_.watch_root);
        return false;
    }

    detector_ = std::make_unique<review::ChangeDetector>(config_.watch_root);
    watch_loop_ = std::make_unique<review::WatchLoop>(*detector_, *scheduler_, config_.review_cooldown);

    if (reactor_->add_timer(config_.model_refresh_interval, [this] { on_refresh_timer(); }, true) < 0) {
        spdlog::error("Failed to arm model refresh timer");
        return false;
    }
    if (reactor_->add_timer(config_.poll_interval, [this] { on_watch_timer(); }) < 0) {
        spdlog::error("Failed to arm watch timer");
        return false;
    }

    // Set up signal handlers
    g_daemon = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (config_.model) {
        selector_->select(*config_.model);
    }

    spdlog::info("Vigil initialized successfully");
    spdlog::info("Watching: {} ({} files)", config_.watch_root, detector_->snapshot().size());
    spdlog::info("Shadow review: {} (cooldown {}s)",
        scheduler_->enabled() ? "enabled" : "disabled",
        std::chrono::duration_cast<std::chrono::seconds>(config_.review_cooldown).count());
    return true;
}

void Daemon::run() {
    running_ = true;
    spdlog::info("Vigil running against {}", config_.base_url);
    spdlog::info("Press Ctrl+C to exit");

    while (running_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    running_ = false;
    spdlog::info("Vigil stopped");
}

void Daemon::shutdown() {
    running_ = false;
}

void Daemon::on_refresh_timer() {
    selector_->refresh(false);

    bool connected = gateway_->connected();
    if (connected != last_connected_) {
        spdlog::info("{}", selector_->status_line());
        last_connected_ = connected;
    }
}

void Daemon::on_watch_timer() {
    if (!running_) {
        return;
    }
    watch_loop_->tick();
}

} // namespace vigil::kernel
