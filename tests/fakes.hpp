#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "services/git/diff_provider.hpp"
#include "services/llm/http_transport.hpp"

namespace vigil::testing {

using services::llm::ChunkSink;
using services::llm::Headers;
using services::llm::HttpResult;
using services::llm::TransportError;

struct Call {
    std::string method;
    std::string url;
    Headers headers;
    std::string body;
};

inline HttpResult ok(const std::string& body) {
    HttpResult r;
    r.status = 200;
    r.reason = "OK";
    r.body = body;
    return r;
}

inline HttpResult status(int code, const std::string& reason) {
    HttpResult r;
    r.status = code;
    r.reason = reason;
    return r;
}

inline HttpResult connect_error() {
    HttpResult r;
    r.error = TransportError::Connect;
    r.message = "Could not establish connection";
    return r;
}

inline HttpResult other_error(const std::string& message) {
    HttpResult r;
    r.error = TransportError::Other;
    r.message = message;
    return r;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Scripted transport. The handler answers every call; for streaming calls a
// 2xx body is fed to the sink in small chunks.
class FakeTransport final : public services::llm::HttpTransport {
public:
    using Handler = std::function<HttpResult(const Call&)>;

    explicit FakeTransport(Handler handler = nullptr)
        : handler_(handler ? std::move(handler) : [](const Call&) { return connect_error(); }) {}

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    HttpResult get(const std::string& url, const Headers& headers,
                   std::chrono::milliseconds) override {
        return dispatch({"GET", url, headers, ""});
    }

    HttpResult post(const std::string& url, const std::string& body,
                    const Headers& headers, std::chrono::milliseconds) override {
        return dispatch({"POST", url, headers, body});
    }

    HttpResult post_stream(const std::string& url, const std::string& body,
                           const Headers& headers, std::chrono::milliseconds,
                           const ChunkSink& sink) override {
        HttpResult result = dispatch({"STREAM", url, headers, body});
        if (!result.ok()) {
            return result;
        }
        const std::string stream = std::move(result.body);
        result.body.clear();
        for (size_t offset = 0; offset < stream.size(); offset += kChunkSize) {
            size_t size = std::min(kChunkSize, stream.size() - offset);
            if (!sink(stream.data() + offset, size)) {
                break;
            }
        }
        return result;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& method, const std::string& url_suffix = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::count_if(calls_.begin(), calls_.end(), [&](const Call& c) {
            return c.method == method && ends_with(c.url, url_suffix);
        });
    }

private:
    static constexpr size_t kChunkSize = 7;

    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<Call> calls_;

    HttpResult dispatch(const Call& call) {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(call);
            handler = handler_;
        }
        return handler(call);
    }
};

// Manually advanced steady clock
class ManualClock {
public:
    std::chrono::steady_clock::time_point now() const { return now_; }
    void advance(std::chrono::milliseconds d) { now_ += d; }

    std::function<std::chrono::steady_clock::time_point()> fn() {
        return [this] { return now_; };
    }

private:
    std::chrono::steady_clock::time_point now_{std::chrono::hours(1)};
};

class FakeDiffProvider final : public services::git::DiffProvider {
public:
    std::string unstaged_text = services::git::kNoUnstagedChanges;
    std::string staged_text = services::git::kNothingStaged;
    int unstaged_calls = 0;
    int staged_calls = 0;
    bool throw_on_read = false;

    std::string unstaged() override {
        ++unstaged_calls;
        if (throw_on_read) {
            throw std::runtime_error("diff provider exploded");
        }
        return unstaged_text;
    }

    std::string staged() override {
        ++staged_calls;
        return staged_text;
    }

    std::string log(int) override { return services::git::kNoCommits; }
};

} // namespace vigil::testing
