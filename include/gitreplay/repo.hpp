#pragma once
#include "gitreplay/consts.hpp"
#include "gitreplay/hash.hpp"
#include "gitreplay/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitreplay {

class Index; // fwd

struct TreeEntry {
  std::uint32_t mode; // e.g., gitreplay::consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto git_dir() const -> std::filesystem::path { return root_ / consts::kGitDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return git_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return git_dir() / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir() / consts::kHeadFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return git_dir() / consts::kConfigFile;
  }

  // Initialize a new repo structure under root_ with HEAD -> refs/heads/<initial_branch>.
  // Throws WorkdirIOError if .git already exists (to avoid clobber).
  void init(std::string_view initial_branch = consts::kDefaultBranch) const;

  // Convenience: does .git exist?
  [[nodiscard]] auto is_initialized() const -> bool;

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  // Entries are written in git order (a directory sorts as "name/").
  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::string message;              // raw message (may contain newlines)
  };

  // Read and parse a commit object into headers + message.
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Build nested tree objects from the staged entries; returns the root tree.
  [[nodiscard]] auto write_tree_from_index(const Index &index) const -> std::string;

  [[nodiscard]] const ObjectStore &objects() const { return store_; }

private:
  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
  ObjectStore store_;
};

} // namespace gitreplay
