#include "gitreplay/replay.hpp"

#include "gitreplay/errors.hpp"
#include "gitreplay/refs.hpp"
#include "gitreplay/signature.hpp"
#include "gitreplay/worktree.hpp"

#include <utility>

namespace stdfs = std::filesystem;

namespace gitreplay {

namespace {

stdfs::path resolve_folder(const stdfs::path &base_dir, const stdfs::path &folder) {
  return folder.is_absolute() ? folder : base_dir / folder;
}

bool is_within(const stdfs::path &child, const stdfs::path &parent) {
  std::error_code ec;
  const auto c = stdfs::weakly_canonical(stdfs::absolute(child), ec);
  const auto p = stdfs::weakly_canonical(stdfs::absolute(parent), ec);
  const auto rel = c.lexically_relative(p);
  return !rel.empty() && *rel.begin() != "..";
}

} // namespace

Replayer::Replayer(const Repository &repo, stdfs::path base_dir, Settings settings)
    : repo_(repo), base_dir_(std::move(base_dir)), settings_(std::move(settings)) {}

stdfs::path Replayer::snapshot_path(const CommitMeta &meta) const {
  return resolve_folder(base_dir_, meta.folder);
}

std::vector<std::string> Replayer::resolve_parents(const CommitMeta &meta) const {
  std::vector<std::string> parents;
  parents.reserve(meta.parents.size());
  for (const auto &orig : meta.parents) {
    const auto it = remap_.find(orig);
    if (it != remap_.end()) {
      parents.push_back(it->second);
    } else if (settings_.missing_parents == MissingParentPolicy::Fail) {
      throw DanglingParentReference("commit " + meta.sha + " lists parent " + orig +
                                    " which no earlier record produced");
    }
  }
  return parents;
}

std::string Replayer::apply(const CommitMeta &meta) {
  const auto &root = repo_.root();

  // 1-3: working area mirrors the snapshot, then gets staged as a whole
  try {
    worktree::clear(root);
    worktree::copy_snapshot(snapshot_path(meta), root, settings_.meta_file);
    last_tree_ = worktree::stage_all(repo_);
  } catch (const std::exception &e) {
    throw WorkdirIOError("commit " + meta.sha + ": " + e.what());
  }

  // 4
  if (const auto problem = identity_problem(meta.author_name, meta.author_email);
      !problem.empty()) {
    throw CommitCreationError("commit " + meta.sha + ": " + problem);
  }
  const auto ident = format_signature(Signature{.name = meta.author_name,
                                                .email = meta.author_email,
                                                .when = timeutil::to_engine_time(meta.date)});

  // 5
  const auto parents = resolve_parents(meta);

  // 6
  std::string new_id;
  try {
    new_id = repo_.write_commit(last_tree_, parents, ident, ident, meta.message);
    const auto head_ref = head_symbolic_target(root);
    update_ref(root, head_ref.value_or(heads_ref(consts::kDefaultBranch)), new_id);
  } catch (const std::exception &e) {
    throw CommitCreationError("commit " + meta.sha + ": " + e.what());
  }

  // 7
  remap_.emplace(meta.sha, new_id);
  return new_id;
}

ReplayResult replay_manifest(const RepoManifest &manifest, const stdfs::path &target,
                             const stdfs::path &base_dir, const Settings &settings,
                             const ReplayProgress &progress) {
  if (manifest.commits.empty()) {
    throw EmptyManifest("manifest for '" + manifest.name + "' lists no commits");
  }

  // the working area is wiped for every record
  for (const auto &meta : manifest.commits) {
    if (is_within(resolve_folder(base_dir, meta.folder), target)) {
      throw WorkdirIOError("snapshot " + meta.folder.string() + " lies inside the target " +
                           target.string());
    }
  }

  std::error_code ec;
  stdfs::create_directories(target, ec);
  if (ec) {
    throw WorkdirIOError("cannot create " + target.string() + ": " + ec.message());
  }
  const Repository repo{target};
  repo.init(manifest.branch);

  Replayer replayer{repo, base_dir, settings};
  ReplayResult result;
  std::size_t index = 0;
  for (const auto &meta : manifest.commits) {
    ++index;
    result.head = replayer.apply(meta);
    if (replayer.last_tree() != meta.tree_sha) {
      result.tree_mismatches.push_back(meta.sha);
    }
    if (progress) {
      progress(index, manifest.commits.size(), meta, result.head);
    }
  }

  update_ref(repo.root(), heads_ref(manifest.branch), result.head);
  result.remap = replayer.remap();
  return result;
}

stdfs::path rebuild_target(const RepoManifest &manifest, const stdfs::path &base_dir) {
  const stdfs::path name{manifest.name};
  if (manifest.name.empty() || manifest.name == "." || manifest.name == ".." ||
      name.has_parent_path() || name.is_absolute()) {
    throw ManifestDecodeError("manifest name is not a plain directory name: '" + manifest.name +
                              "'");
  }
  return base_dir / name;
}

} // namespace gitreplay
