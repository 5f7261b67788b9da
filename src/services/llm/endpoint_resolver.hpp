#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vigil::services::llm {

// Decomposed API root, e.g. http://[::1]:1234/api/v0
struct BaseUrl {
    std::string scheme = "http";
    std::string host;              // Without IPv6 brackets, lowercased
    std::optional<int> port;
    std::string path;              // No trailing slash; empty for the bare root

    // scheme://host[:port], IPv6 hosts bracketed
    std::string origin() const;

    // origin() + path
    std::string str() const;
};

// Parse "scheme://host[:port][/path]". A missing scheme defaults to http.
std::optional<BaseUrl> parse_base_url(const std::string& url);

bool is_loopback_host(const std::string& host);

// Ordered, deduplicated list of API roots to probe for a configured base URL:
// the given host first, then loopback spellings when the host is a loopback
// alias; for each host the given path, <root>/v1, <root>/api/v0 and <root>.
std::vector<std::string> resolve_candidates(const std::string& base_url);

} // namespace vigil::services::llm
