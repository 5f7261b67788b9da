#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vigil::services::llm {

class GatewayClient;

// Tracks which advertised model is selected across catalog refreshes
class ModelSelector {
public:
    explicit ModelSelector(GatewayClient& client);

    // Refresh the catalog and reconcile the selection with it
    void refresh(bool force = false);

    // Explicit choice; ignored unless the model is currently advertised
    bool select(const std::string& model);

    std::optional<std::string> selected() const;

    // "LM Studio connected (N models)" or "LM Studio offline (<error>)"
    std::string status_line() const;

private:
    GatewayClient& client_;
    mutable std::mutex mutex_;
    std::optional<std::string> selected_;
    std::optional<std::string> preferred_;
};

} // namespace vigil::services::llm
