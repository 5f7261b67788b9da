#include "services/llm/http_transport.hpp"
#include "services/llm/endpoint_resolver.hpp"
#include "services/llm/httplib_errors.hpp"
#include <spdlog/spdlog.h>

namespace vigil::services::llm {

namespace {

struct Target {
    std::string origin;
    std::string path;
};

bool split_url(const std::string& url, Target& target, HttpResult& failure) {
    auto parsed = parse_base_url(url);
    if (!parsed) {
        failure.error = TransportError::Other;
        failure.message = "invalid URL: " + url;
        return false;
    }
    target.origin = parsed->origin();
    target.path = parsed->path.empty() ? "/" : parsed->path;
    return true;
}

void configure(httplib::Client& cli, std::chrono::milliseconds timeout) {
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
}

httplib::Headers to_httplib(const Headers& headers) {
    httplib::Headers out;
    for (const auto& [name, value] : headers) {
        out.emplace(name, value);
    }
    return out;
}


HttpResult from_result(const httplib::Result& result) {
    HttpResult out;
    if (!result) {
        out.error = classify_httplib_error(result.error());
        out.message = httplib::to_string(result.error());
        return out;
    }
    out.status = result->status;
    out.reason = result->reason.empty() ? httplib::status_message(result->status) : result->reason;
    out.body = result->body;
    return out;
}

} // namespace

TransportError classify_httplib_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::Success:
            return TransportError::None;
        case httplib::Error::Connection:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::SSLConnection:
            return TransportError::Connect;
        default:
            return TransportError::Other;
    }
}

HttpResult HttplibTransport::get(const std::string& url, const Headers& headers,
                                 std::chrono::milliseconds timeout) {
    HttpResult out;
    Target target;
    if (!split_url(url, target, out)) {
        return out;
    }

    try {
        httplib::Client cli(target.origin);
        configure(cli, timeout);
        return from_result(cli.Get(target.path, to_httplib(headers)));
    } catch (const std::exception& e) {
        out.error = TransportError::Other;
        out.message = e.what();
        spdlog::error("GET {} raised: {}", url, e.what());
    }
    return out;
}

HttpResult HttplibTransport::post(const std::string& url, const std::string& json_body,
                                  const Headers& headers, std::chrono::milliseconds timeout) {
    HttpResult out;
    Target target;
    if (!split_url(url, target, out)) {
        return out;
    }

    try {
        httplib::Client cli(target.origin);
        configure(cli, timeout);
        return from_result(cli.Post(target.path, to_httplib(headers), json_body, "application/json"));
    } catch (const std::exception& e) {
        out.error = TransportError::Other;
        out.message = e.what();
        spdlog::error("POST {} raised: {}", url, e.what());
    }
    return out;
}

HttpResult HttplibTransport::post_stream(const std::string& url, const std::string& json_body,
                                         const Headers& headers, std::chrono::milliseconds timeout,
                                         const ChunkSink& sink) {
    HttpResult out;
    Target target;
    if (!split_url(url, target, out)) {
        return out;
    }

    try {
        httplib::Client cli(target.origin);
        configure(cli, timeout);

        httplib::Request req;
        httplib::Response res;
        req.method = "POST";
        req.path = target.path;
        req.headers = to_httplib(headers);
        req.set_header("Content-Type", "application/json");
        req.set_header("Accept", "text/event-stream");
        req.body = json_body;

        bool stopped_by_sink = false;
        std::string error_body;
        req.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t) {
            // Status line and headers are parsed before the body arrives
            if (res.status < 200 || res.status >= 300) {
                error_body.append(data, size);
                return true;
            }
            if (!sink(data, size)) {
                stopped_by_sink = true;
                return false;
            }
            return true;
        };

        httplib::Error error = httplib::Error::Success;
        bool sent = cli.send(req, res, error);
        if (!sent && !(stopped_by_sink && error == httplib::Error::Canceled)) {
            out.error = classify_httplib_error(error);
            out.message = httplib::to_string(error);
            // A failure after the status arrived is still a mid-stream failure
            out.status = res.status > 0 ? res.status : 0;
            return out;
        }

        out.status = res.status;
        out.reason = res.reason.empty() ? httplib::status_message(res.status) : res.reason;
        out.body = std::move(error_body);
    } catch (const std::exception& e) {
        out.error = TransportError::Other;
        out.message = e.what();
        spdlog::error("POST {} (stream) raised: {}", url, e.what());
    }
    return out;
}

} // namespace vigil::services::llm
