#include "gitreplay/worktree.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/index.hpp"
#include "gitreplay/repo.hpp"

#include <filesystem>
#include <vector>

namespace stdfs = std::filesystem;

namespace gitreplay::worktree {

static bool is_owner_executable(const stdfs::path &p) {
  const auto perms = stdfs::status(p).permissions();
  return (perms & stdfs::perms::owner_exec) != stdfs::perms::none;
}

void enumerate_paths(const stdfs::path &root, std::set<std::string> &out_paths) {
  for (auto it = stdfs::recursive_directory_iterator(root);
       it != stdfs::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (it.depth() == 0 && p.filename() == consts::kGitDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_symlink() || !it->is_regular_file()) {
      continue;
    }
    out_paths.insert(stdfs::relative(p, root).generic_string());
  }
}

void clear(const stdfs::path &root) {
  std::error_code ec;
  std::vector<stdfs::path> doomed;
  for (const auto &entry : stdfs::directory_iterator(root, ec)) {
    if (entry.path().filename() != consts::kGitDir) {
      doomed.push_back(entry.path());
    }
  }
  if (ec) {
    throw WorkdirIOError("cannot list " + root.string() + ": " + ec.message());
  }
  for (const auto &p : doomed) {
    stdfs::remove_all(p, ec);
    if (ec) {
      throw WorkdirIOError("cannot remove " + p.string() + ": " + ec.message());
    }
  }
}

void copy_snapshot(const stdfs::path &snapshot, const stdfs::path &root,
                   std::string_view reserved_name) {
  std::error_code ec;
  if (!stdfs::is_directory(snapshot, ec)) {
    throw WorkdirIOError("snapshot directory missing: " + snapshot.string());
  }
  for (auto it = stdfs::recursive_directory_iterator(snapshot, ec);
       it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw WorkdirIOError("cannot walk " + snapshot.string() + ": " + ec.message());
    }
    const auto &src = it->path();
    if (src.filename() == reserved_name) {
      it.disable_recursion_pending();
      continue;
    }
    const auto dest = root / stdfs::relative(src, snapshot);
    if (it->is_directory()) {
      stdfs::create_directories(dest, ec);
    } else {
      stdfs::create_directories(dest.parent_path(), ec);
      if (!ec) {
        stdfs::copy_file(src, dest, stdfs::copy_options::overwrite_existing, ec);
      }
    }
    if (ec) {
      throw WorkdirIOError("cannot copy " + src.string() + " to " + dest.string() + ": " +
                           ec.message());
    }
  }
  if (ec) {
    throw WorkdirIOError("cannot walk " + snapshot.string() + ": " + ec.message());
  }
}

std::string stage_all(const Repository &repo) {
  const auto &root = repo.root();
  std::set<std::string> paths;
  enumerate_paths(root, paths);

  Index idx{root};
  for (const auto &rel : paths) {
    const std::uint32_t mode = is_owner_executable(root / rel) ? consts::kModeExec
                                                               : consts::kModeFile;
    idx.add_path(root, rel, repo, mode);
  }
  idx.save();
  return repo.write_tree_from_index(idx);
}

} // namespace gitreplay::worktree
