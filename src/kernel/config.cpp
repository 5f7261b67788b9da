#include "kernel/config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace vigil::kernel {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<long> env_number(const char* name) {
    auto value = env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        long n = std::stol(*value, &used);
        if (used != value->size() || n < 0) {
            throw std::invalid_argument("trailing characters");
        }
        return n;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not a non-negative integer", name, *value);
        return std::nullopt;
    }
}

} // namespace

VigilConfig VigilConfig::from_env() {
    VigilConfig config;

    if (auto url = env("LMSTUDIO_BASE_URL")) {
        config.base_url = *url;
    }
    if (auto key = env("LMSTUDIO_API_KEY")) {
        config.api_key = *key;
    }
    if (auto root = env("VIGIL_WATCH_ROOT")) {
        config.watch_root = *root;
    }
    if (auto ms = env_number("VIGIL_POLL_INTERVAL_MS")) {
        config.poll_interval = std::chrono::milliseconds(*ms);
    }
    if (auto s = env_number("VIGIL_REVIEW_COOLDOWN_S")) {
        config.review_cooldown = std::chrono::seconds(*s);
    }
    if (auto flag = env("VIGIL_SHADOW_REVIEW")) {
        config.shadow_review = !(*flag == "0" || *flag == "false" || *flag == "off");
    }
    if (auto level = env("VIGIL_LOG_LEVEL")) {
        config.log_level = *level;
    }
    if (auto path = env("VIGIL_MCP_CONFIG")) {
        config.mcp_config_path = *path;
    }

    return config;
}

} // namespace vigil::kernel
