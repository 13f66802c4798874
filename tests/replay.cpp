#include "gitreplay/commit_meta.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/extract.hpp"
#include "gitreplay/refs.hpp"
#include "gitreplay/replay.hpp"
#include "gitreplay/walker.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "support.hpp"

namespace fs = std::filesystem;
using gitreplay::MissingParentPolicy;
using gitreplay::Repository;
using gitreplay::Settings;
using testsupport::check;
using testsupport::commit_files;

// Linear history C1 <- C2 <- C3, each commit adding one file.
static void linear_history(const fs::path &scratch) {
  Repository src{scratch / "linear-src"};
  fs::create_directories(src.root());
  src.init();
  const auto c1 = commit_files(src, {{"one.txt", "1\n"}}, {}, "C1", 1700000000);
  const auto c2 = commit_files(src, {{"one.txt", "1\n"}, {"two.txt", "2\n"}}, {c1}, "C2",
                               1700000060);
  const auto c3 = commit_files(src, {{"one.txt", "1\n"}, {"two.txt", "2\n"}, {"three.txt", "3\n"}},
                               {c2}, "C3", 1700000120);

  Settings settings;
  settings.export_dir = scratch / "linear-export";
  const auto manifest = gitreplay::extract(src, settings);
  check(manifest.commits.size() == 3, "three records");
  check(manifest.commits[0].sha == c1 && manifest.commits[2].sha == c3, "manifest order");
  check(manifest.commits[1].folder == settings.export_dir / ("0002_" + c2), "folder naming");
  check(fs::exists(settings.export_dir / ("0002_" + c2) / ".commit-meta.json"), "meta copy");
  check(fs::exists(settings.export_dir / "manifest.json"), "manifest written");

  const auto result =
      gitreplay::replay_manifest(gitreplay::read_manifest(settings.manifest_path()),
                                 scratch / "linear-out", scratch, settings);
  check(result.remap.size() == 3, "three mappings");
  check(result.tree_mismatches.empty(), "trees identical");

  const Repository out{scratch / "linear-out"};
  const auto rebuilt = gitreplay::collect_commits(out, "main");
  check(rebuilt.size() == 3, "branch head has three commits");
  check(rebuilt.back().id == result.head, "head is last replayed commit");
  check(rebuilt.back().info.parents == std::vector<std::string>{result.remap.at(c2)},
        "new C2 is the sole parent of new C3");
  const auto files = out.read_tree(rebuilt.back().info.tree_hex);
  check(files.size() == 3, "C3 tree holds all three files");
  check(gitreplay::resolve_ref(out.root(), "HEAD") == result.head, "HEAD follows branch");
}

// C3 merges two unrelated roots C1 and C2, in that order.
static void merge_of_roots(const fs::path &scratch) {
  Repository src{scratch / "merge-src"};
  fs::create_directories(src.root());
  src.init();
  const auto c1 = commit_files(src, {{"left.txt", "L\n"}}, {}, "left root", 1700000000);
  const auto c2 = commit_files(src, {{"right.txt", "R\n"}}, {}, "right root", 1700000030, 0,
                               "right");
  const auto c3 = commit_files(src, {{"left.txt", "L\n"}, {"right.txt", "R\n"}}, {c1, c2},
                               "merge", 1700000090);

  Settings settings;
  settings.export_dir = scratch / "merge-export";
  const auto manifest = gitreplay::extract(src, settings);
  check(manifest.commits.size() == 3 && manifest.commits.back().sha == c3, "merge manifest");

  const auto result =
      gitreplay::replay_manifest(manifest, scratch / "merge-out", scratch, settings);
  const Repository out{scratch / "merge-out"};
  const auto head = out.read_commit(result.head);
  check(head.parents.size() == 2, "merge keeps two parents");
  check(head.parents[0] == result.remap.at(c1) && head.parents[1] == result.remap.at(c2),
        "parent order preserved");
}

static gitreplay::CommitMeta orphan_record(const fs::path &snapshot) {
  testsupport::write_file(snapshot / "file.txt", "content\n");
  return gitreplay::CommitMeta{
      .sha = std::string(40, 'a'),
      .parents = {std::string(40, 'f')},
      .author_name = "Orphan",
      .author_email = "orphan@example.com",
      .date = {.instant = std::chrono::sys_seconds{std::chrono::seconds{1700000000}},
               .offset = std::chrono::minutes{-300}},
      .message = "lost parent",
      .tree_sha = std::string(40, 'b'),
      .folder = snapshot,
  };
}

static void missing_parent(const fs::path &scratch) {
  const auto record = orphan_record(scratch / "orphan-snap");
  const gitreplay::RepoManifest manifest{.name = "orphan", .branch = "main", .commits = {record}};

  Settings strict;
  bool threw = false;
  try {
    (void)gitreplay::replay_manifest(manifest, scratch / "orphan-strict", scratch, strict);
  } catch (const gitreplay::DanglingParentReference &) {
    threw = true;
  }
  check(threw, "fail policy raises DanglingParentReference");

  Settings lenient;
  lenient.missing_parents = MissingParentPolicy::Drop;
  const auto result =
      gitreplay::replay_manifest(manifest, scratch / "orphan-drop", scratch, lenient);
  const Repository out{scratch / "orphan-drop"};
  const auto head = out.read_commit(result.head);
  check(head.parents.empty(), "drop policy yields one parent fewer");
  check(result.tree_mismatches.size() == 1, "fabricated tree_sha reported");
}

// A directory carrying the metadata file name is left out along with its contents.
static void reserved_directory(const fs::path &scratch) {
  const fs::path snap = scratch / "reserved-snap";
  auto record = orphan_record(snap);
  record.parents.clear();
  testsupport::write_file(snap / ".commit-meta.json" / "inner.txt", "hidden\n");
  testsupport::write_file(snap / "sub" / ".commit-meta.json", "{}\n");
  testsupport::write_file(snap / "sub" / "kept.txt", "kept\n");

  const auto result = gitreplay::replay_manifest(
      {.name = "reserved", .branch = "main", .commits = {record}}, scratch / "reserved-out",
      scratch, Settings{});
  const Repository out{scratch / "reserved-out"};
  const auto files = testsupport::snapshot_of(out.root());
  check(files.size() == 2, "only file.txt and sub/kept.txt materialized");
  check(files.contains("file.txt") && files.contains("sub/kept.txt"), "regular files kept");
  check(!fs::exists(out.root() / ".commit-meta.json"), "reserved directory skipped");
  const auto tree = out.read_tree(out.read_commit(result.head).tree_hex);
  for (const auto &entry : tree) {
    check(entry.name != ".commit-meta.json", "reserved name absent from the tree");
  }
}

static void refusals(const fs::path &scratch) {
  const gitreplay::RepoManifest empty{.name = "empty", .branch = "main", .commits = {}};
  bool threw = false;
  try {
    (void)gitreplay::replay_manifest(empty, scratch / "empty-out", scratch, Settings{});
  } catch (const gitreplay::EmptyManifest &) {
    threw = true;
  }
  check(threw, "EmptyManifest");
  check(!fs::exists(scratch / "empty-out"), "target untouched for empty manifest");

  auto record = orphan_record(scratch / "bad-ident-snap");
  record.parents.clear();
  record.author_name = "Eve <evil>";
  const gitreplay::RepoManifest bad{.name = "bad", .branch = "main", .commits = {record}};
  threw = false;
  try {
    (void)gitreplay::replay_manifest(bad, scratch / "bad-out", scratch, Settings{});
  } catch (const gitreplay::CommitCreationError &) {
    threw = true;
  }
  check(threw, "CommitCreationError for unusable identity");

  auto lost = orphan_record(scratch / "lost-snap");
  lost.parents.clear();
  lost.folder = scratch / "no-such-snap";
  threw = false;
  try {
    (void)gitreplay::replay_manifest({.name = "lost", .branch = "main", .commits = {lost}},
                                     scratch / "lost-out", scratch, Settings{});
  } catch (const gitreplay::WorkdirIOError &) {
    threw = true;
  }
  check(threw, "WorkdirIOError for a missing snapshot folder");

  const fs::path nested_target = scratch / "nested-out";
  auto nested = orphan_record(nested_target / "snap");
  nested.parents.clear();
  threw = false;
  try {
    (void)gitreplay::replay_manifest({.name = "nested", .branch = "main", .commits = {nested}},
                                     nested_target, scratch, Settings{});
  } catch (const gitreplay::WorkdirIOError &) {
    threw = true;
  }
  check(threw, "WorkdirIOError for a snapshot inside the target");
  check(!fs::exists(nested_target / ".git"), "no repository created over the snapshot");
  check(testsupport::slurp(nested_target / "snap" / "file.txt") == "content\n",
        "snapshot left intact");

  const fs::path taken = scratch / "taken-out";
  fs::create_directories(taken);
  Repository{taken}.init();
  auto fresh = orphan_record(scratch / "taken-snap");
  fresh.parents.clear();
  threw = false;
  try {
    (void)gitreplay::replay_manifest({.name = "taken", .branch = "main", .commits = {fresh}},
                                     taken, scratch, Settings{});
  } catch (const gitreplay::WorkdirIOError &) {
    threw = true;
  }
  check(threw, "WorkdirIOError for a target that already has .git");
  check(!gitreplay::resolve_ref(taken, "refs/heads/main"), "existing repository not written to");

  threw = false;
  try {
    (void)gitreplay::rebuild_target({.name = "../escape", .branch = "main", .commits = {}},
                                    scratch);
  } catch (const gitreplay::ManifestDecodeError &) {
    threw = true;
  }
  check(threw, "manifest name must be a plain directory");
  check(gitreplay::rebuild_target({.name = "proj", .branch = "main", .commits = {}}, scratch) ==
            scratch / "proj",
        "target beside export");
}

int main() {
  testsupport::ScratchDir scratch{"gitreplay_replay"};
  try {
    linear_history(scratch.path);
    merge_of_roots(scratch.path);
    missing_parent(scratch.path);
    reserved_directory(scratch.path);
    refusals(scratch.path);
    std::cout << "replay OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
