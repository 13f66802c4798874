#pragma once
#include "gitreplay/refs.hpp"
#include "gitreplay/repo.hpp"
#include "gitreplay/signature.hpp"
#include "gitreplay/worktree.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace testsupport {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on scope exit.
struct ScratchDir {
  fs::path path;

  explicit ScratchDir(const std::string &prefix)
      : path(fs::temp_directory_path() /
             (prefix + "_" + std::to_string(std::random_device{}()))) {
    fs::create_directories(path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  ScratchDir(const ScratchDir &) = delete;
  ScratchDir &operator=(const ScratchDir &) = delete;
};

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

inline std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Throws with `msg` when `cond` is false; main() turns it into exit 1.
inline void check(bool cond, const std::string &msg) {
  if (!cond) {
    throw std::runtime_error("check failed: " + msg);
  }
}

// Replace the working tree of `repo` with `files`, stage everything and
// commit it on top of `parents`. Advances refs/heads/<branch>.
inline std::string commit_files(const gitreplay::Repository &repo,
                                const std::map<std::string, std::string> &files,
                                const std::vector<std::string> &parents,
                                const std::string &message, std::int64_t when,
                                int offset_minutes = 0, const std::string &branch = "main",
                                const std::string &name = "Ada Lovelace",
                                const std::string &email = "ada@example.com") {
  gitreplay::worktree::clear(repo.root());
  for (const auto &[rel, content] : files) {
    write_file(repo.root() / rel, content);
  }
  const auto tree = gitreplay::worktree::stage_all(repo);
  const auto sig = gitreplay::format_signature(gitreplay::Signature{
      .name = name, .email = email, .when = {.seconds = when, .offset_minutes = offset_minutes}});
  const auto id = repo.write_commit(tree, parents, sig, sig, message);
  gitreplay::update_ref(repo.root(), gitreplay::heads_ref(branch), id);
  return id;
}

// Every regular file below `root` (excluding .git and `skip_name`) with its bytes.
inline std::map<std::string, std::string> snapshot_of(const fs::path &root,
                                                      const std::string &skip_name = {}) {
  std::map<std::string, std::string> out;
  for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator();
       ++it) {
    if (it.depth() == 0 && it->path().filename() == ".git") {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file() || it->path().filename() == skip_name) {
      continue;
    }
    out[fs::relative(it->path(), root).generic_string()] = slurp(it->path());
  }
  return out;
}

} // namespace testsupport
