#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace vigil::services::llm {

// Callback for streamed text deltas
using StreamCallback = std::function<void(const std::string& chunk)>;

// Incremental decoder for "data: {json}" event streams terminated by
// "data: [DONE]". Bytes may arrive split at arbitrary positions.
class StreamDecoder {
public:
    explicit StreamDecoder(StreamCallback on_fragment);

    // Feed raw body bytes. Returns false once the end-of-stream sentinel has
    // been seen; further input is ignored.
    bool feed(const char* data, size_t size);

    // Decode one complete line (without its newline).
    bool feed_line(const std::string& line);

    // Decode a trailing line left without a newline when the body ends.
    void finish();

    bool done() const { return done_; }

    // Number of fragments delivered so far
    size_t fragments() const { return fragments_; }

private:
    StreamCallback on_fragment_;
    std::string pending_;
    bool done_ = false;
    size_t fragments_ = 0;
};

} // namespace vigil::services::llm
