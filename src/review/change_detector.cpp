#include "review/change_detector.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace vigil::review {

namespace {

bool is_vcs_dir_name(const std::string& name) {
    return name == ".git" || name == ".hg" || name == ".svn";
}

} // namespace

bool is_vcs_metadata_path(const std::string& path) {
    for (const auto& segment : fs::path(path)) {
        if (is_vcs_dir_name(segment.string())) {
            return true;
        }
    }
    return false;
}

ChangeSet diff_snapshots(const FileSnapshot& before, const FileSnapshot& after) {
    ChangeSet changes;

    for (const auto& [path, mtime] : after) {
        auto it = before.find(path);
        if (it == before.end()) {
            changes.added.push_back(path);
        } else if (it->second != mtime) {
            changes.modified.push_back(path);
        }
    }
    for (const auto& [path, mtime] : before) {
        if (after.find(path) == after.end()) {
            changes.deleted.push_back(path);
        }
    }

    changes.changed = !changes.added.empty() || !changes.modified.empty() ||
                      !changes.deleted.empty();
    return changes;
}

FileSnapshot take_snapshot(const std::string& root) {
    FileSnapshot snapshot;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", root, ec.message());
        return snapshot;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            if (is_vcs_dir_name(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(entry_ec)) {
            std::string path = entry.path().string();
            auto mtime = entry.last_write_time(entry_ec);
            if (!entry_ec && !is_vcs_metadata_path(path)) {
                snapshot[path] = static_cast<int64_t>(mtime.time_since_epoch().count());
            }
        }

        it.increment(ec);
        if (ec) {
            // A directory vanished or became unreadable mid-walk
            spdlog::debug("Scan of {} cut short: {}", root, ec.message());
            break;
        }
    }

    return snapshot;
}

ChangeDetector::ChangeDetector(std::string root)
    : root_(std::move(root)),
      snapshot_(take_snapshot(root_)) {
    spdlog::debug("Watching {} ({} files)", root_, snapshot_.size());
}

ChangeSet ChangeDetector::check_for_changes() {
    FileSnapshot current = take_snapshot(root_);
    ChangeSet changes = diff_snapshots(snapshot_, current);
    snapshot_ = std::move(current);
    return changes;
}

} // namespace vigil::review
