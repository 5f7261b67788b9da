#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace vigil::kernel {

// Vigil configuration
struct VigilConfig {
    std::string base_url = "http://127.0.0.1:1234/v1";  // Inference server API root
    std::string api_key;                                // Bearer token (or from env)
    std::chrono::milliseconds models_ttl{15000};
    std::chrono::milliseconds models_timeout{5000};
    std::chrono::milliseconds chat_timeout{60000};

    // Watch mode
    std::string watch_root = ".";
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::milliseconds review_cooldown{30000};
    std::chrono::milliseconds model_refresh_interval{2000};
    bool shadow_review = true;

    // One-shot commands
    std::optional<std::string> model;   // Preferred model id
    bool stream = false;                // Print chat output as it arrives

    std::string log_level = "info";
    std::optional<std::string> mcp_config_path;  // Defaults to .mcp.json search

    // Defaults overridden by LMSTUDIO_* / VIGIL_* environment variables
    static VigilConfig from_env();
};

} // namespace vigil::kernel
