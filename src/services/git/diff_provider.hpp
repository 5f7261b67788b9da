#pragma once
#include <string>

namespace vigil::services::git {

// Sentinels returned when git has nothing to report
inline constexpr const char* kNoUnstagedChanges = "(no unstaged changes)";
inline constexpr const char* kNothingStaged = "(nothing staged)";
inline constexpr const char* kNoCommits = "(no commits)";

// Source of review subjects. Implementations return the diff text, one of
// the sentinels above, or an "Error: ..." string; they never throw.
class DiffProvider {
public:
    virtual ~DiffProvider() = default;

    virtual std::string unstaged() = 0;
    virtual std::string staged() = 0;
    virtual std::string log(int count = 5) = 0;
};

// True for empty output, a sentinel, or an error string
bool is_empty_diff(const std::string& text);

class GitDiffProvider final : public DiffProvider {
public:
    explicit GitDiffProvider(std::string repo_root);

    std::string unstaged() override;
    std::string staged() override;
    std::string log(int count = 5) override;

    const std::string& repo_root() const { return repo_root_; }

private:
    std::string repo_root_;

    // Run git with the given arguments; fallback replaces empty output
    std::string run(const std::string& args, const char* fallback) const;
};

} // namespace vigil::services::git
