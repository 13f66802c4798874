#pragma once
#include "gitreplay/commit_meta.hpp"
#include "gitreplay/config.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace gitreplay {

class Repository; // fwd

// Called once per exported commit; `index` is 1-based.
using ExtractProgress =
    std::function<void(std::size_t index, std::size_t total, const CommitMeta& meta)>;

// "0007_<sha>"
auto snapshot_dir_name(std::size_t index, const std::string& sha) -> std::string;

// Export every commit reachable from settings.branch:
//   <export_dir>/<NNNN>_<sha>/            full tree snapshot
//   <export_dir>/<NNNN>_<sha>/<meta_file> redundant CommitMeta record
//   <export_dir>/<manifest_file>          RepoManifest
// Snapshot folders are recorded as export_dir/<NNNN>_<sha>, so a relative
// export_dir yields folders relative to the current directory.
// Throws RefNotFound, ExportIOError, InvalidTimestamp or ObjectError.
auto extract(const Repository& repo, const Settings& settings,
             const ExtractProgress& progress = {}) -> RepoManifest;

} // namespace gitreplay
