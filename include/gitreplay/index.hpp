#pragma once
#include "gitreplay/hash.hpp"
#include "gitreplay/consts.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace gitreplay {

class Repository; // fwd decl to avoid header cycle

// Cached stat data; git only uses it to skip rehashing unchanged files.
struct StatInfo {
  std::uint32_t ctime_s = 0;
  std::uint32_t ctime_ns = 0;
  std::uint32_t mtime_s = 0;
  std::uint32_t mtime_ns = 0;
  std::uint32_t dev = 0;
  std::uint32_t ino = 0;
  std::uint32_t uid = 0;
  std::uint32_t gid = 0;
  std::uint32_t size = 0;
};

struct IndexEntry {
  std::uint32_t mode;  // gitreplay::consts::kModeFile or kModeExec
  oid           id;    // blob id (20 bytes)
  std::string   path;  // "dir/file", UTF-8, no leading '/'
  StatInfo      stat{};
};

// The staging area, stored as a version 2 "DIRC" file in .git/index so stock
// git tooling can read it.
class Index {
public:
  explicit Index(std::filesystem::path repo_root);

  // Parse .git/index if it exists (no throw if missing). Throws ObjectError
  // on a bad signature, unsupported version or checksum mismatch.
  void load();

  // Overwrite .git/index with current entries (sorted by path, SHA-1 trailer)
  void save() const;

  // Read file at working-dir `wd/relpath`, write blob via repo, add/replace an entry
  void add_path(const std::filesystem::path& wd,
                std::string_view relpath,
                const Repository& repo,
                std::uint32_t mode = gitreplay::consts::kModeFile);

  const std::vector<IndexEntry>& entries() const { return entries_; }

private:
  std::filesystem::path index_path() const;

  std::filesystem::path repo_root_;
  std::vector<IndexEntry> entries_;
};

} // namespace gitreplay
