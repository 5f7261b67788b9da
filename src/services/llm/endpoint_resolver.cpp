#include "services/llm/endpoint_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace vigil::services::llm {

namespace {

std::string strip_trailing_slashes(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string without_suffix(const std::string& path, const std::string& suffix) {
    return ends_with(path, suffix) ? path.substr(0, path.size() - suffix.size()) : path;
}

std::optional<int> parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int port = std::stoi(text);
    if (port > 65535) {
        return std::nullopt;
    }
    return port;
}

} // namespace

std::string BaseUrl::origin() const {
    std::string out = scheme + "://";
    if (host.find(':') != std::string::npos) {
        out += "[" + host + "]";
    } else {
        out += host;
    }
    if (port) {
        out += ":" + std::to_string(*port);
    }
    return out;
}

std::string BaseUrl::str() const {
    return origin() + path;
}

std::optional<BaseUrl> parse_base_url(const std::string& url) {
    BaseUrl parsed;
    std::string rest = url;

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        parsed.scheme = rest.substr(0, scheme_end);
        std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        rest = rest.substr(scheme_end + 3);
    }
    if (parsed.scheme.empty()) {
        parsed.scheme = "http";
    }

    // Drop query and fragment; only the path prefix matters for an API root
    auto query = rest.find_first_of("?#");
    if (query != std::string::npos) {
        rest = rest.substr(0, query);
    }

    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        parsed.path = strip_trailing_slashes(rest.substr(path_start));
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::nullopt;
            }
            port_text = tail.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }
    std::transform(parsed.host.begin(), parsed.host.end(), parsed.host.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (!port_text.empty()) {
        parsed.port = parse_port(port_text);
        if (!parsed.port) {
            return std::nullopt;
        }
    }

    return parsed;
}

bool is_loopback_host(const std::string& host) {
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

std::vector<std::string> resolve_candidates(const std::string& base_url) {
    auto parsed = parse_base_url(base_url);
    if (!parsed) {
        // Unparseable input is still worth one attempt as-is
        return {strip_trailing_slashes(base_url)};
    }

    std::vector<std::string> hosts = {parsed->host};
    if (is_loopback_host(parsed->host)) {
        hosts.insert(hosts.end(), {"localhost", "127.0.0.1", "::1"});
    }

    std::string root = without_suffix(parsed->path, "/v1");
    if (root == parsed->path) {
        root = without_suffix(parsed->path, "/api/v0");
    }
    const std::vector<std::string> paths = {parsed->path, root + "/v1", root + "/api/v0", root};

    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;
    for (const auto& host : hosts) {
        for (const auto& path : paths) {
            BaseUrl candidate = *parsed;
            candidate.host = host;
            candidate.path = strip_trailing_slashes(path);
            auto rendered = candidate.str();
            if (seen.insert(rendered).second) {
                candidates.push_back(std::move(rendered));
            }
        }
    }
    return candidates;
}

} // namespace vigil::services::llm
