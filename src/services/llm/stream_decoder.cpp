#include "services/llm/stream_decoder.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vigil::services::llm {

namespace {

constexpr const char* kDataPrefix = "data: ";
constexpr size_t kDataPrefixLen = 6;
constexpr const char* kDoneSentinel = "[DONE]";

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

StreamDecoder::StreamDecoder(StreamCallback on_fragment)
    : on_fragment_(std::move(on_fragment)) {}

bool StreamDecoder::feed(const char* data, size_t size) {
    if (done_) {
        return false;
    }
    pending_.append(data, size);

    size_t start = 0;
    while (!done_) {
        auto newline = pending_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        feed_line(pending_.substr(start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
    return !done_;
}

bool StreamDecoder::feed_line(const std::string& raw) {
    if (done_) {
        return false;
    }

    std::string line = raw;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // Comments, keepalives and other event fields
    if (line.compare(0, kDataPrefixLen, kDataPrefix) != 0) {
        return true;
    }

    std::string payload = line.substr(kDataPrefixLen);
    if (trim(payload) == kDoneSentinel) {
        done_ = true;
        pending_.clear();
        return false;
    }

    try {
        json j = json::parse(payload);
        if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() ||
            j["choices"].empty()) {
            return true;
        }
        const auto& choice = j["choices"][0];
        if (!choice.is_object() || !choice.contains("delta") || !choice["delta"].is_object()) {
            return true;
        }
        const auto& delta = choice["delta"];
        if (delta.contains("content") && delta["content"].is_string()) {
            auto content = delta["content"].get<std::string>();
            if (!content.empty()) {
                ++fragments_;
                on_fragment_(content);
            }
        }
    } catch (const json::exception& e) {
        spdlog::debug("Dropping malformed stream frame: {}", e.what());
    }
    return true;
}

void StreamDecoder::finish() {
    if (!done_ && !pending_.empty()) {
        std::string tail;
        tail.swap(pending_);
        feed_line(tail);
    }
}

} // namespace vigil::services::llm
