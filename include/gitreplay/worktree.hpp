#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace gitreplay {

class Repository; // fwd

namespace worktree {

// Enumerate regular files under root, excluding the .git directory and
// symlinks, as repo-relative generic paths
void enumerate_paths(const std::filesystem::path& root, std::set<std::string>& out_paths);

// Remove every top-level entry of the working area except .git.
// Throws WorkdirIOError.
void clear(const std::filesystem::path& root);

// Copy all files below `snapshot` into `root`, keeping relative paths and
// permission bits. Files named `reserved_name` are never copied.
// Throws WorkdirIOError.
void copy_snapshot(const std::filesystem::path& snapshot, const std::filesystem::path& root,
                   std::string_view reserved_name);

// Full-tree staging: rebuild the index from every file in the working area
// (mode 100755 when owner-executable, else 100644), save it, and write the
// tree objects. Returns the root tree id.
auto stage_all(const Repository& repo) -> std::string;

} // namespace worktree

} // namespace gitreplay
