#pragma once
#include "gitreplay/commit_meta.hpp"
#include "gitreplay/config.hpp"
#include "gitreplay/repo.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace gitreplay {

struct ReplayResult {
  std::string head;                          // last created commit
  std::map<std::string, std::string> remap;  // original id -> new id
  std::vector<std::string> tree_mismatches;  // original ids whose new tree differs
};

// Called after each replayed commit; `index` is 1-based.
using ReplayProgress = std::function<void(std::size_t index, std::size_t total,
                                          const CommitMeta& meta, const std::string& new_id)>;

// Recreates commits one record at a time against the working area of an
// initialized repository. One instance per run; the remap table lives and
// dies with it.
class Replayer {
public:
  // `base_dir` resolves relative snapshot folders.
  Replayer(const Repository& repo, std::filesystem::path base_dir, Settings settings);

  // Clear, materialize, stage, commit, record. Returns the new commit id.
  // Throws WorkdirIOError, DanglingParentReference, CommitCreationError.
  auto apply(const CommitMeta& meta) -> std::string;

  // Tree id staged by the last apply().
  [[nodiscard]] const std::string& last_tree() const { return last_tree_; }

  [[nodiscard]] const std::map<std::string, std::string>& remap() const { return remap_; }

private:
  auto resolve_parents(const CommitMeta& meta) const -> std::vector<std::string>;
  auto snapshot_path(const CommitMeta& meta) const -> std::filesystem::path;

  const Repository& repo_;
  std::filesystem::path base_dir_;
  Settings settings_;
  std::map<std::string, std::string> remap_;
  std::string last_tree_;
};

// Initialize a repository at `target` (HEAD -> refs/heads/<manifest.branch>),
// replay every record in order and point refs/heads/<manifest.branch> at the
// last commit. Throws EmptyManifest before touching `target` when there is
// nothing to replay.
auto replay_manifest(const RepoManifest& manifest, const std::filesystem::path& target,
                     const std::filesystem::path& base_dir, const Settings& settings,
                     const ReplayProgress& progress = {}) -> ReplayResult;

// <base_dir>/<manifest.name>; throws ManifestDecodeError if the name is not a
// single plain path component.
auto rebuild_target(const RepoManifest& manifest, const std::filesystem::path& base_dir)
    -> std::filesystem::path;

} // namespace gitreplay
