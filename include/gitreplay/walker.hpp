#pragma once
#include "gitreplay/repo.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gitreplay {

// A commit reachable from the walked branch, already parsed.
struct Commit {
  std::string id;
  Repository::CommitInfo info;
};

// Every commit reachable from refs/heads/<branch>, parents before children.
// Ties are broken by depth-first post-order over parents in their recorded
// order, so the same history always yields the same sequence.
// Throws RefNotFound if the branch does not exist.
auto collect_commits(const Repository& repo, std::string_view branch) -> std::vector<Commit>;

// Same walk starting from an explicit commit id.
auto collect_commits_from(const Repository& repo, const std::string& head_hex)
    -> std::vector<Commit>;

} // namespace gitreplay
