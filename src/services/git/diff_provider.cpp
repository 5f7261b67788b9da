#include "services/git/diff_provider.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <sys/wait.h>

namespace vigil::services::git {

namespace {

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

bool is_empty_diff(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return true;
    }
    return text == kNoUnstagedChanges || text == kNothingStaged || text == kNoCommits ||
           starts_with(text, "Error:");
}

GitDiffProvider::GitDiffProvider(std::string repo_root)
    : repo_root_(std::move(repo_root)) {}

std::string GitDiffProvider::unstaged() {
    return run("diff", kNoUnstagedChanges);
}

std::string GitDiffProvider::staged() {
    return run("diff --cached", kNothingStaged);
}

std::string GitDiffProvider::log(int count) {
    return run("log -" + std::to_string(count) + " --oneline", kNoCommits);
}

std::string GitDiffProvider::run(const std::string& args, const char* fallback) const {
    std::string command = "git -C " + shell_quote(repo_root_) + " --no-pager " + args + " 2>/dev/null";
    spdlog::debug("Running: {}", command);

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return "Error: failed to execute git";
    }

    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        return "Error: failed to wait for git";
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return "Error: git not found";
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (output.empty()) {
            int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return "Error: git " + args + " exited with status " + std::to_string(code);
        }
        spdlog::debug("git {} exited abnormally with output", args);
    }

    return output.empty() ? std::string(fallback) : output;
}

} // namespace vigil::services::git
