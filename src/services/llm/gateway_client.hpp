#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "services/llm/http_transport.hpp"
#include "services/llm/stream_decoder.hpp"

namespace vigil::services::llm {

// Gateway configuration
struct GatewayConfig {
    std::string base_url = "http://127.0.0.1:1234/v1";   // Configured API root
    std::string api_key;                                 // Bearer token (or from env)
    std::chrono::milliseconds models_ttl{15000};
    std::chrono::milliseconds models_timeout{5000};
    std::chrono::milliseconds chat_timeout{60000};
    float temperature = 0.3f;
    int max_tokens = 500;
};

// Chat request: the prompt plus a block of context (usually a diff)
struct ChatRequest {
    std::string prompt;
    std::string context;
    std::optional<std::string> model;
};

// Chat result. Failures are data, never exceptions.
struct ChatResult {
    bool success = false;
    std::string content;
    std::string error;

    // Content, or "Error: <cause>" for failures
    std::string text() const { return success ? content : "Error: " + error; }
};

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

class GatewayClient {
public:
    explicit GatewayClient(const GatewayConfig& config,
                           std::shared_ptr<HttpTransport> transport = nullptr,
                           SteadyClock clock = nullptr);
    ~GatewayClient();

    // Non-copyable
    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    // Refresh the model catalog. Returns the cached list without I/O while it
    // is fresh unless forced. Concurrent callers share one in-flight refresh.
    std::vector<std::string> refresh_models(bool force = false);

    // Blocking chat completion
    ChatResult chat(const ChatRequest& request);

    // Streaming chat completion. Fragments are delivered as they arrive; when
    // every candidate fails a single "Error: ..." fragment is delivered. The
    // returned result carries the concatenated text. An empty callback only
    // collects the text.
    ChatResult chat_stream(const ChatRequest& request, const StreamCallback& on_fragment);

    // State snapshots
    bool connected() const;
    std::optional<std::string> last_error() const;
    std::vector<std::string> models() const;
    std::optional<std::string> sticky_base_url() const;
    std::string base_url() const;   // Sticky root, else the configured one
    bool models_stale() const;

    // Candidate API roots in probe order (sticky root first)
    std::vector<std::string> candidates() const;

    const GatewayConfig& config() const { return config_; }

    // Load API key from environment
    static std::string get_api_key_from_env();

private:
    struct Failure {
        TransportError error = TransportError::None;
        int status = 0;
        std::string reason;
        std::string message;
    };

    GatewayConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    SteadyClock clock_;

    // Serializes catalog refreshes
    std::mutex refresh_mutex_;

    // Guards the fields below
    mutable std::mutex state_mutex_;
    bool connected_ = false;
    std::optional<std::string> last_error_;
    std::optional<std::string> sticky_base_url_;
    std::vector<std::string> models_;
    std::optional<std::chrono::steady_clock::time_point> last_refresh_;

    Headers auth_headers() const;
    std::string build_request_json(const ChatRequest& request, bool stream) const;
    void pin(const std::string& candidate);

    static bool is_auth_challenge(const HttpResult& result);
    static Failure failure_from(const HttpResult& result);
    static std::string describe(const std::optional<Failure>& failure);
};

// Model ids from a /models body: a bare list or {"data": [...]}, each entry
// naming its id under "id", "name" or "model". Throws json::exception on
// malformed JSON.
std::vector<std::string> parse_model_list(const std::string& body);

} // namespace vigil::services::llm
