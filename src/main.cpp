#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include "kernel/daemon.hpp"
#include "util/logger.hpp"

namespace {

void print_usage(const vigil::kernel::Daemon* daemon) {
    std::cerr << "Usage: vigil [options] [command] [args]\n"
                 "Options:\n"
                 "  --base-url <url>       API root (default $LMSTUDIO_BASE_URL or http://127.0.0.1:1234/v1)\n"
                 "  --api-key <key>        Bearer token (default $LMSTUDIO_API_KEY)\n"
                 "  --root <dir>           Tree to watch and diff (default .)\n"
                 "  --model <id>           Preferred model\n"
                 "  --mcp-config <path>    MCP server list (default nearest .mcp.json)\n"
                 "  --stream               Print chat output as it arrives\n"
                 "  --no-shadow-review     Watch without automatic reviews\n"
                 "  --log-level <level>    trace|debug|info|warn|error|off\n";
    if (daemon) {
        std::cerr << daemon->usage();
    }
}

} // namespace

int main(int argc, char** argv) {
    vigil::util::init_logger();

    // Writes to exited MCP servers must fail with EPIPE instead of killing us
    signal(SIGPIPE, SIG_IGN);

    auto config = vigil::kernel::VigilConfig::from_env();

    // Parse command line args
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(nullptr);
            return 0;
        } else if (arg == "--base-url" || arg == "--api-key" || arg == "--root" ||
                   arg == "--model" || arg == "--mcp-config" || arg == "--log-level") {
            const char* value = next();
            if (!value) {
                return 1;
            }
            if (arg == "--base-url") config.base_url = value;
            else if (arg == "--api-key") config.api_key = value;
            else if (arg == "--root") config.watch_root = value;
            else if (arg == "--model") config.model = std::string(value);
            else if (arg == "--mcp-config") config.mcp_config_path = std::string(value);
            else config.log_level = value;
        } else if (arg == "--stream") {
            config.stream = true;
        } else if (arg == "--no-shadow-review") {
            config.shadow_review = false;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(nullptr);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    vigil::util::set_log_level(vigil::util::parse_log_level(config.log_level));

    std::string command = positional.empty() ? "watch" : positional.front();
    std::vector<std::string> args;
    if (!positional.empty()) {
        args.assign(positional.begin() + 1, positional.end());
    }

    if (command == "watch") {
        spdlog::info("=================================");
        spdlog::info("  Vigil v0.1.0");
        spdlog::info("  Shadow review for {}", config.watch_root);
        spdlog::info("=================================");
    }

    vigil::kernel::Daemon daemon(config);
    if (command == "help") {
        print_usage(&daemon);
        return 0;
    }
    return daemon.execute(command, args);
}
