#pragma once
#include "gitreplay/time.hpp"
#include "gitreplay/walker.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitreplay {

// Everything needed to recreate one original commit.
struct CommitMeta {
  std::string sha;                  // original commit id
  std::vector<std::string> parents; // original parent ids, first parent first
  std::string author_name;
  std::string author_email;
  timeutil::ZonedTime date;         // authorship instant + its own offset
  std::string message;              // trailing whitespace trimmed
  std::string tree_sha;             // original tree id, for verification
  std::filesystem::path folder;     // exported snapshot of the tree
};

struct RepoManifest {
  std::string name;
  std::string branch;
  std::vector<CommitMeta> commits; // parents always precede children
};

// Read-only snapshot of `commit`'s metadata. Absent, empty or non-UTF-8 author
// name/email become "unknown"; invalid UTF-8 in the message is replaced by
// U+FFFD. Throws InvalidTimestamp for an unreadable or unrepresentable date.
auto capture(const Commit& commit, const std::filesystem::path& snapshot_dir) -> CommitMeta;

// JSON mapping (ADL hooks for nlohmann::ordered_json). from_json throws
// ManifestDecodeError for missing keys, wrong types, bad ids or dates.
void to_json(nlohmann::ordered_json& j, const CommitMeta& meta);
void from_json(const nlohmann::ordered_json& j, CommitMeta& meta);
void to_json(nlohmann::ordered_json& j, const RepoManifest& manifest);
void from_json(const nlohmann::ordered_json& j, RepoManifest& manifest);

// Pretty-printed record text and its inverse.
auto serialize(const CommitMeta& meta) -> std::string;
auto serialize(const RepoManifest& manifest) -> std::string;
auto deserialize_commit_meta(std::string_view text) -> CommitMeta;
auto deserialize_manifest(std::string_view text) -> RepoManifest;

// File helpers. Writers throw ExportIOError, readers ManifestDecodeError.
void write_commit_meta(const std::filesystem::path& path, const CommitMeta& meta);
void write_manifest(const std::filesystem::path& path, const RepoManifest& manifest);
auto read_manifest(const std::filesystem::path& path) -> RepoManifest;

} // namespace gitreplay
