#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace vigil::services::llm {

using Headers = std::map<std::string, std::string>;

// How a request failed before an HTTP status was obtained
enum class TransportError {
    None,       // A response (of any status) was received
    Connect,    // Refused, unreachable, connect timeout, TLS handshake failed
    Other       // Timeouts after connecting, reads, protocol errors
};

struct HttpResult {
    TransportError error = TransportError::None;
    int status = 0;
    std::string reason;     // Reason phrase for status
    std::string body;       // Not populated for accepted streaming responses
    std::string message;    // Transport failure description

    bool ok() const {
        return error == TransportError::None && status >= 200 && status < 300;
    }
};

// Receives body bytes of a successful streaming response. Returning false
// ends the transfer early; that is not reported as an error.
using ChunkSink = std::function<bool(const char* data, size_t size)>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult get(const std::string& url, const Headers& headers,
                           std::chrono::milliseconds timeout) = 0;

    virtual HttpResult post(const std::string& url, const std::string& json_body,
                            const Headers& headers, std::chrono::milliseconds timeout) = 0;

    virtual HttpResult post_stream(const std::string& url, const std::string& json_body,
                                   const Headers& headers, std::chrono::milliseconds timeout,
                                   const ChunkSink& sink) = 0;
};

// cpp-httplib backed transport. Each call opens its own connection, so one
// instance may be shared between threads.
class HttplibTransport final : public HttpTransport {
public:
    HttpResult get(const std::string& url, const Headers& headers,
                   std::chrono::milliseconds timeout) override;

    HttpResult post(const std::string& url, const std::string& json_body,
                    const Headers& headers, std::chrono::milliseconds timeout) override;

    HttpResult post_stream(const std::string& url, const std::string& json_body,
                           const Headers& headers, std::chrono::milliseconds timeout,
                           const ChunkSink& sink) override;
};

} // namespace vigil::services::llm
