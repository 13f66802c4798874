#include "gitreplay/extract.hpp"

#include "gitreplay/errors.hpp"
#include "gitreplay/repo.hpp"
#include "gitreplay/tree_export.hpp"
#include "gitreplay/walker.hpp"

#include <array>
#include <cstdio>
#include <filesystem>
#include <utility>

namespace stdfs = std::filesystem;

namespace gitreplay {

namespace {

std::string repository_name(const Repository &repo) {
  std::error_code ec;
  auto canon = stdfs::weakly_canonical(stdfs::absolute(repo.root()), ec);
  if (ec) {
    canon = repo.root();
  }
  auto name = canon.filename().string();
  if (name.empty()) {
    name = canon.parent_path().filename().string();
  }
  return name;
}

void reset_dir(const stdfs::path &dir) {
  std::error_code ec;
  stdfs::remove_all(dir, ec);
  if (ec) {
    throw ExportIOError("cannot clean " + dir.string() + ": " + ec.message());
  }
}

} // namespace

std::string snapshot_dir_name(std::size_t index, const std::string &sha) {
  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "%04zu_", index);
  return std::string(buf.data()) + sha;
}

RepoManifest extract(const Repository &repo, const Settings &settings,
                     const ExtractProgress &progress) {
  const auto commits = collect_commits(repo, settings.branch);

  RepoManifest manifest;
  manifest.name = repository_name(repo);
  manifest.branch = settings.branch;
  manifest.commits.reserve(commits.size());

  std::size_t index = 0;
  for (const auto &commit : commits) {
    ++index;
    const stdfs::path folder = settings.export_dir / snapshot_dir_name(index, commit.id);

    reset_dir(folder);
    export_tree(repo, commit.info.tree_hex, folder);

    auto meta = capture(commit, folder);
    write_commit_meta(folder / settings.meta_file, meta);
    if (progress) {
      progress(index, commits.size(), meta);
    }
    manifest.commits.push_back(std::move(meta));
  }

  write_manifest(settings.manifest_path(), manifest);
  return manifest;
}

} // namespace gitreplay
