#include "services/llm/gateway_client.hpp"
#include "services/llm/endpoint_resolver.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <unordered_set>

using json = nlohmann::json;

namespace vigil::services::llm {

namespace {

constexpr const char* kSystemPersona =
    "You are a concise assistant helping with git operations. Be brief and direct.";
constexpr const char* kFallbackApiKey = "lm-studio";
constexpr const char* kConnectFailure = "Can't connect to LM Studio. Is it running?";

std::string join_path(const std::string& base, const char* suffix) {
    std::string out = base;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out + suffix;
}

bool is_truthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return value.get<double>() != 0.0;
        case json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return !value.empty();
    }
}

} // namespace

std::vector<std::string> parse_model_list(const std::string& body) {
    json j = json::parse(body);

    json items = json::array();
    if (j.is_object() && j.contains("data") && j["data"].is_array()) {
        items = j["data"];
    } else if (j.is_array()) {
        items = j;
    }

    std::vector<std::string> models;
    for (const auto& item : items) {
        if (!item.is_object()) {
            continue;
        }
        // The first present, non-empty key names the model; a non-string
        // value there disqualifies the entry
        for (const char* key : {"id", "name", "model"}) {
            auto it = item.find(key);
            if (it == item.end() || !is_truthy(*it)) {
                continue;
            }
            if (it->is_string()) {
                models.push_back(it->get<std::string>());
            }
            break;
        }
    }
    return models;
}

GatewayClient::GatewayClient(const GatewayConfig& config,
                             std::shared_ptr<HttpTransport> transport,
                             SteadyClock clock)
    : config_(config),
      transport_(std::move(transport)),
      clock_(std::move(clock)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
    if (config_.api_key.empty()) {
        config_.api_key = get_api_key_from_env();
    }
    if (!transport_) {
        transport_ = std::make_shared<HttplibTransport>();
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }

    spdlog::debug("Gateway client initialized (base_url={})", config_.base_url);
}

GatewayClient::~GatewayClient() = default;

std::string GatewayClient::get_api_key_from_env() {
    const char* key = std::getenv("LMSTUDIO_API_KEY");
    return key ? std::string(key) : "";
}

Headers GatewayClient::auth_headers() const {
    const std::string& key = config_.api_key.empty() ? std::string(kFallbackApiKey) : config_.api_key;
    return {{"Authorization", "Bearer " + key}};
}

bool GatewayClient::connected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connected_;
}

std::optional<std::string> GatewayClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

std::vector<std::string> GatewayClient::models() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return models_;
}

std::optional<std::string> GatewayClient::sticky_base_url() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return sticky_base_url_;
}

std::string GatewayClient::base_url() const {
    return sticky_base_url().value_or(config_.base_url);
}

bool GatewayClient::models_stale() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!last_refresh_) {
        return true;
    }
    return clock_() - *last_refresh_ > config_.models_ttl;
}

std::vector<std::string> GatewayClient::candidates() const {
    std::vector<std::string> ordered;
    if (auto sticky = sticky_base_url()) {
        ordered = resolve_candidates(*sticky);
    }
    auto configured = resolve_candidates(config_.base_url);
    ordered.insert(ordered.end(), configured.begin(), configured.end());

    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (auto& candidate : ordered) {
        if (seen.insert(candidate).second) {
            unique.push_back(std::move(candidate));
        }
    }
    return unique;
}

void GatewayClient::pin(const std::string& candidate) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (sticky_base_url_ != candidate) {
        spdlog::debug("Pinned API root {}", candidate);
    }
    sticky_base_url_ = candidate;
}

bool GatewayClient::is_auth_challenge(const HttpResult& result) {
    return result.error == TransportError::None &&
           (result.status == 401 || result.status == 403);
}

GatewayClient::Failure GatewayClient::failure_from(const HttpResult& result) {
    Failure failure;
    failure.error = result.error;
    failure.status = result.status;
    failure.reason = result.reason;
    failure.message = result.message;
    return failure;
}

std::string GatewayClient::describe(const std::optional<Failure>& failure) {
    if (!failure) {
        return "Unknown error";
    }
    switch (failure->error) {
        case TransportError::Connect:
            return kConnectFailure;
        case TransportError::None:
            return std::to_string(failure->status) + " " + failure->reason;
        case TransportError::Other:
            break;
    }
    return failure->message.empty() ? "Unknown error" : failure->message;
}

std::vector<std::string> GatewayClient::refresh_models(bool force) {
    if (!force && !models_stale()) {
        return models();
    }

    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    // Another caller may have refreshed while we waited for the lock
    if (!force && !models_stale()) {
        return models();
    }

    std::optional<Failure> last_failure;
    for (const auto& candidate : candidates()) {
        std::string url = join_path(candidate, "/models");
        spdlog::debug("Probing {}", url);

        auto result = transport_->get(url, {}, config_.models_timeout);
        if (is_auth_challenge(result)) {
            result = transport_->get(url, auth_headers(), config_.models_timeout);
        }

        if (result.error == TransportError::Connect || (result.error == TransportError::None && !result.ok())) {
            last_failure = failure_from(result);
            continue;
        }
        if (result.error == TransportError::Other) {
            last_failure = failure_from(result);
            break;
        }

        std::vector<std::string> listed;
        try {
            listed = parse_model_list(result.body);
        } catch (const json::exception& e) {
            last_failure = Failure{TransportError::Other, 0, "",
                                   std::string("invalid models response: ") + e.what()};
            break;
        }

        bool was_connected;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            was_connected = connected_;
            models_ = std::move(listed);
            connected_ = true;
            last_error_ = models_.empty() ? std::optional<std::string>("No models returned.")
                                          : std::nullopt;
            last_refresh_ = clock_();
            sticky_base_url_ = candidate;
        }
        if (!was_connected) {
            spdlog::info("Connected to {}", candidate);
        }
        return models();
    }

    std::string error = describe(last_failure);
    bool was_connected;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_connected = connected_;
        models_.clear();
        connected_ = false;
        last_error_ = error;
        last_refresh_ = clock_();
    }
    if (was_connected) {
        spdlog::warn("Lost connection to model server: {}", error);
    } else {
        spdlog::debug("Model refresh failed: {}", error);
    }
    return {};
}

std::string GatewayClient::build_request_json(const ChatRequest& request, bool stream) const {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", kSystemPersona}});
    messages.push_back({{"role", "user"},
                        {"content", request.prompt + "\n\n```\n" + request.context + "\n```"}});

    json payload;
    payload["messages"] = messages;
    payload["temperature"] = config_.temperature;
    payload["max_tokens"] = config_.max_tokens;
    payload["stream"] = stream;
    if (request.model && !request.model->empty()) {
        payload["model"] = *request.model;
    }
    // Diffs of non-UTF-8 files must not abort serialization
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

ChatResult GatewayClient::chat(const ChatRequest& request) {
    ChatResult response;
    std::string body;
    try {
        body = build_request_json(request, false);
    } catch (const json::exception& e) {
        response.error = std::string("invalid chat request: ") + e.what();
        spdlog::error("Chat request failed: {}", response.error);
        return response;
    }

    std::optional<Failure> last_failure;
    for (const auto& candidate : candidates()) {
        std::string url = join_path(candidate, "/chat/completions");
        spdlog::debug("POST {}", url);

        auto result = transport_->post(url, body, {}, config_.chat_timeout);
        if (is_auth_challenge(result)) {
            result = transport_->post(url, body, auth_headers(), config_.chat_timeout);
        }

        if (result.error == TransportError::Connect || (result.error == TransportError::None && !result.ok())) {
            last_failure = failure_from(result);
            continue;
        }
        if (result.error == TransportError::Other) {
            last_failure = failure_from(result);
            break;
        }

        try {
            json j = json::parse(result.body);
            const auto& content = j.at("choices").at(0).at("message").at("content");
            response.content = content.is_string() ? content.get<std::string>() : "";
            response.success = true;
            pin(candidate);
            return response;
        } catch (const json::exception& e) {
            spdlog::error("Failed to parse chat response: {}", e.what());
            spdlog::debug("Response body: {}", result.body);
            last_failure = Failure{TransportError::Other, 0, "",
                                   std::string("invalid chat response: ") + e.what()};
            break;
        }
    }

    response.success = false;
    response.error = describe(last_failure);
    spdlog::warn("Chat request failed: {}", response.error);
    return response;
}

ChatResult GatewayClient::chat_stream(const ChatRequest& request, const StreamCallback& on_fragment) {
    ChatResult response;
    std::string body;
    try {
        body = build_request_json(request, true);
    } catch (const json::exception& e) {
        response.error = std::string("invalid chat request: ") + e.what();
        spdlog::error("Streaming chat request failed: {}", response.error);
        if (on_fragment) {
            on_fragment(response.text());
        }
        return response;
    }

    // Credentials go out on the first attempt: a stream cannot be replayed
    // once bytes have been delivered.
    Headers headers = auth_headers();

    std::optional<Failure> last_failure;
    for (const auto& candidate : candidates()) {
        std::string url = join_path(candidate, "/chat/completions");
        spdlog::debug("POST {} (stream)", url);

        StreamDecoder decoder([&](const std::string& fragment) {
            response.content += fragment;
            if (on_fragment) {
                on_fragment(fragment);
            }
        });

        auto result = transport_->post_stream(url, body, headers, config_.chat_timeout,
            [&decoder](const char* data, size_t size) { return decoder.feed(data, size); });

        if (result.error == TransportError::Connect || (result.error == TransportError::None && !result.ok())) {
            last_failure = failure_from(result);
            continue;
        }
        if (result.error == TransportError::Other) {
            last_failure = failure_from(result);
            break;
        }

        decoder.finish();
        pin(candidate);
        response.success = true;
        return response;
    }

    response.success = false;
    response.error = describe(last_failure);
    spdlog::warn("Streaming chat request failed: {}", response.error);
    if (on_fragment) {
        on_fragment(response.text());
    }
    return response;
}

} // namespace vigil::services::llm
