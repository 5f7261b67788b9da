#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vigil::review {

// path -> modification time (file clock ticks)
using FileSnapshot = std::map<std::string, int64_t>;

struct ChangeSet {
    bool changed = false;
    std::vector<std::string> added;      // Sorted
    std::vector<std::string> modified;
    std::vector<std::string> deleted;
};

// Set algebra between two snapshots
ChangeSet diff_snapshots(const FileSnapshot& before, const FileSnapshot& after);

// True when a path has a .git, .hg or .svn segment
bool is_vcs_metadata_path(const std::string& path);

// Recursive mtime snapshot of every regular file under root. Entries that
// cannot be stat'ed are left out.
FileSnapshot take_snapshot(const std::string& root);

// Poll-based watcher over a directory tree
class ChangeDetector {
public:
    // Takes the initial snapshot synchronously
    explicit ChangeDetector(std::string root);

    // Rescan, diff against the previous scan and keep the new one
    ChangeSet check_for_changes();

    const std::string& root() const { return root_; }
    const FileSnapshot& snapshot() const { return snapshot_; }

private:
    std::string root_;
    FileSnapshot snapshot_;
};

} // namespace vigil::review
