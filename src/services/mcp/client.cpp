#include "services/mcp/client.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

using json = nlohmann::json;

namespace vigil::services::mcp {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kClientName = "vigil";
constexpr const char* kClientVersion = "0.1.0";

// One server process speaking newline-delimited JSON-RPC on stdin/stdout
class StdioSession {
public:
    StdioSession(const McpServer& server, std::chrono::milliseconds timeout)
        : server_(server), timeout_(timeout) {}

    ~StdioSession() { stop(); }

    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;

    void start();
    void stop();

    // Send a request and wait for the response with the same id
    json request(const std::string& method, const json& params);
    void notify(const std::string& method);

    void initialize();

private:
    const McpServer& server_;
    std::chrono::milliseconds timeout_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int next_id_ = 1;
    std::string buffer_;

    void write_message(const json& message);
    std::string read_line();
};

void StdioSession::start() {
    // A server that exits early must surface as EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe(stdin_pipe) < 0) {
        throw std::runtime_error(std::string("pipe failed: ") + strerror(errno));
    }
    if (pipe(stdout_pipe) < 0) {
        int err = errno;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw std::runtime_error(std::string("pipe failed: ") + strerror(err));
    }

    // argv must be assembled before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(server_.command.c_str()));
    for (const auto& arg : server_.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);

        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);

        close(stdin_pipe[0]);
        close(stdout_pipe[1]);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        signal(SIGPIPE, SIG_DFL);

        if (server_.cwd && chdir(server_.cwd->c_str()) != 0) {
            _exit(126);
        }

        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    spdlog::debug("Started MCP server {} (pid={})", server_.name, pid_);
}

void StdioSession::stop() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (pid_ <= 0) {
        return;
    }

    kill(pid_, SIGTERM);
    int status = 0;
    waitpid(pid_, &status, 0);
    spdlog::debug("Stopped MCP server {} (pid={})", server_.name, pid_);
    pid_ = -1;
}

void StdioSession::write_message(const json& message) {
    std::string line = message.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');

    size_t offset = 0;
    while (offset < line.size()) {
        ssize_t wrote = write(stdin_fd_, line.data() + offset, line.size() - offset);
        if (wrote < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("write to server failed: ") + strerror(errno));
        }
        offset += static_cast<size_t>(wrote);
    }
}

std::string StdioSession::read_line() {
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    char buf[4096];

    while (true) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            return line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw std::runtime_error("timed out waiting for server response");
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(stdout_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("read from server failed: ") + strerror(errno));
        }
        if (n == 0) {
            throw std::runtime_error("server closed its output");
        }
        buffer_.append(buf, buf + n);
    }
}

json StdioSession::request(const std::string& method, const json& params) {
    int id = next_id_++;
    write_message({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});

    while (true) {
        std::string line = read_line();
        if (line.empty()) {
            continue;
        }

        json message;
        try {
            message = json::parse(line);
        } catch (const json::exception&) {
            spdlog::debug("MCP server {} wrote non-JSON output", server_.name);
            continue;
        }

        // Notifications and server-initiated requests are not ours
        if (!message.is_object() || !message.contains("id") || message.contains("method") ||
            message["id"] != id) {
            continue;
        }

        if (message.contains("error")) {
            const auto& error = message["error"];
            std::string text = error.is_object() ? error.value("message", error.dump()) : error.dump();
            throw std::runtime_error(text);
        }
        return message.value("result", json::object());
    }
}

void StdioSession::notify(const std::string& method) {
    write_message({{"jsonrpc", "2.0"}, {"method", method}});
}

void StdioSession::initialize() {
    json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}
    };
    request("initialize", params);
    notify("notifications/initialized");
}

} // namespace

McpClient::McpClient(McpConfigResult config, std::chrono::milliseconds timeout)
    : config_(std::move(config)), timeout_(timeout) {}

std::vector<std::string> McpClient::server_names() const {
    std::vector<std::string> names;
    for (const auto& server : config_.servers) {
        names.push_back(server.name);
    }
    return names;
}

const McpServer* McpClient::find_server(const std::string& name) const {
    for (const auto& server : config_.servers) {
        if (server.name == name) {
            return &server;
        }
    }
    return nullptr;
}

std::vector<McpResource> McpClient::list_resources(const std::string& server_name) {
    const McpServer* server = find_server(server_name);
    if (!server) {
        return {};
    }

    try {
        StdioSession session(*server, timeout_);
        session.start();
        session.initialize();
        json result = session.request("resources/list", json::object());

        std::vector<McpResource> resources;
        for (const auto& r : result.value("resources", json::array())) {
            McpResource resource;
            resource.uri = r.at("uri").get<std::string>();
            resource.name = r.contains("name") && r["name"].is_string() && !r["name"].get<std::string>().empty()
                ? r["name"].get<std::string>() : resource.uri;
            if (r.contains("description") && r["description"].is_string()) {
                resource.description = r["description"].get<std::string>();
            }
            if (r.contains("mimeType") && r["mimeType"].is_string()) {
                resource.mime_type = r["mimeType"].get<std::string>();
            }
            resources.push_back(std::move(resource));
        }
        return resources;
    } catch (const std::exception& e) {
        spdlog::warn("Listing resources of {} failed: {}", server_name, e.what());
    }
    return {};
}

std::string McpClient::read_resource(const std::string& server_name, const std::string& uri) {
    const McpServer* server = find_server(server_name);
    if (!server) {
        return "Server not found: " + server_name;
    }

    try {
        StdioSession session(*server, timeout_);
        session.start();
        session.initialize();
        json result = session.request("resources/read", {{"uri", uri}});

        std::string text;
        bool first = true;
        for (const auto& content : result.value("contents", json::array())) {
            std::string part;
            if (content.contains("text") && content["text"].is_string()) {
                part = content["text"].get<std::string>();
            } else if (content.contains("blob") && content["blob"].is_string()) {
                part = "[Binary data: " + std::to_string(content["blob"].get<std::string>().size()) + " bytes]";
            } else {
                continue;
            }
            if (!first) {
                text += "\n";
            }
            text += part;
            first = false;
        }
        return text;
    } catch (const std::exception& e) {
        spdlog::warn("Reading {} from {} failed: {}", uri, server_name, e.what());
        return std::string("Error reading resource: ") + e.what();
    }
}

} // namespace vigil::services::mcp
