#include "services/llm/model_selector.hpp"
#include "services/llm/gateway_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace vigil::services::llm {

ModelSelector::ModelSelector(GatewayClient& client)
    : client_(client) {}

void ModelSelector::refresh(bool force) {
    auto models = client_.refresh_models(force);
    bool connected = client_.connected();

    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = selected_;

    if (!connected || models.empty()) {
        selected_.reset();
    } else {
        auto advertised = [&models](const std::optional<std::string>& name) {
            return name && std::find(models.begin(), models.end(), *name) != models.end();
        };
        if (advertised(preferred_)) {
            selected_ = preferred_;
        } else if (!advertised(selected_)) {
            selected_ = models.front();
        }
    }

    if (selected_ != previous) {
        spdlog::info("Selected model: {}", selected_.value_or("(none)"));
    }
}

bool ModelSelector::select(const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    preferred_ = model;
    auto models = client_.models();
    if (std::find(models.begin(), models.end(), model) == models.end()) {
        spdlog::warn("Model {} is not advertised by the server", model);
        return false;
    }
    selected_ = model;
    return true;
}

std::optional<std::string> ModelSelector::selected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selected_;
}

std::string ModelSelector::status_line() const {
    if (client_.connected()) {
        return "LM Studio connected (" + std::to_string(client_.models().size()) + " models)";
    }
    return "LM Studio offline (" + client_.last_error().value_or("Not connected.") + ")";
}

} // namespace vigil::services::llm
