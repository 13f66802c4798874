#include "gitreplay/commit_meta.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"
#include "gitreplay/signature.hpp"
#include "gitreplay/util.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>

namespace gitreplay {

using nlohmann::ordered_json;

namespace {

std::string identity_or_unknown(const std::string &value) {
  if (value.empty() || !strutil::is_valid_utf8(value)) {
    return std::string(consts::kUnknownIdentity);
  }
  return value;
}

std::string checked_id(const ordered_json &j, const char *what) {
  auto id = j.get<std::string>();
  if (!looks_hex40(id)) {
    throw ManifestDecodeError(std::string("bad ") + what + " id: '" + id + "'");
  }
  return id;
}

template <class T> T decode_text(std::string_view text) {
  try {
    return ordered_json::parse(text.begin(), text.end()).get<T>();
  } catch (const ordered_json::exception &e) {
    throw ManifestDecodeError(e.what());
  }
}

void write_text(const std::filesystem::path &path, const std::string &text) {
  try {
    fs::write_file_atomic(path, fs::bytes_of(text));
  } catch (const std::exception &e) {
    throw ExportIOError("cannot write " + path.string() + ": " + e.what());
  }
}

} // namespace

CommitMeta capture(const Commit &commit, const std::filesystem::path &snapshot_dir) {
  const auto sig = parse_signature(commit.info.author);
  const auto when = sig ? std::optional{sig->when} : parse_signature_time(commit.info.author);
  if (!when) {
    throw InvalidTimestamp("commit " + commit.id + ": no readable author date in '" +
                           commit.info.author + "'");
  }

  CommitMeta meta;
  meta.sha = commit.id;
  meta.parents = commit.info.parents;
  meta.author_name = sig ? identity_or_unknown(sig->name) : std::string(consts::kUnknownIdentity);
  meta.author_email =
      sig ? identity_or_unknown(sig->email) : std::string(consts::kUnknownIdentity);
  try {
    meta.date = timeutil::from_engine_time(*when);
  } catch (const InvalidTimestamp &e) {
    throw InvalidTimestamp("commit " + commit.id + ": " + e.what());
  }
  meta.message = strutil::sanitize_utf8(strutil::rstrip_whitespace(commit.info.message));
  meta.tree_sha = commit.info.tree_hex;
  meta.folder = snapshot_dir;
  return meta;
}

void to_json(ordered_json &j, const CommitMeta &meta) {
  j = ordered_json{
      {"sha", meta.sha},
      {"parents", meta.parents},
      {"author_name", meta.author_name},
      {"author_email", meta.author_email},
      {"date", timeutil::format_iso8601(meta.date)},
      {"message", meta.message},
      {"tree_sha", meta.tree_sha},
      {"folder", meta.folder.generic_string()},
  };
}

void from_json(const ordered_json &j, CommitMeta &meta) {
  if (!j.is_object()) {
    throw ManifestDecodeError("commit record is not an object");
  }
  meta.sha = checked_id(j.at("sha"), "commit");
  const auto &parents = j.at("parents");
  if (!parents.is_array()) {
    throw ManifestDecodeError("commit " + meta.sha + ": 'parents' is not an array");
  }
  meta.parents.clear();
  for (const auto &p : parents) {
    meta.parents.push_back(checked_id(p, "parent"));
  }
  meta.author_name = j.at("author_name").get<std::string>();
  meta.author_email = j.at("author_email").get<std::string>();
  try {
    meta.date = timeutil::parse_iso8601(j.at("date").get<std::string>());
  } catch (const InvalidTimestamp &e) {
    throw ManifestDecodeError("commit " + meta.sha + ": " + e.what());
  }
  meta.message = j.at("message").get<std::string>();
  meta.tree_sha = checked_id(j.at("tree_sha"), "tree");
  meta.folder = j.at("folder").get<std::string>();
}

void to_json(ordered_json &j, const RepoManifest &manifest) {
  j = ordered_json{
      {"name", manifest.name},
      {"branch", manifest.branch},
      {"commits", manifest.commits},
  };
}

void from_json(const ordered_json &j, RepoManifest &manifest) {
  if (!j.is_object()) {
    throw ManifestDecodeError("manifest is not an object");
  }
  manifest.name = j.at("name").get<std::string>();
  manifest.branch = j.at("branch").get<std::string>();
  const auto &commits = j.at("commits");
  if (!commits.is_array()) {
    throw ManifestDecodeError("manifest 'commits' is not an array");
  }
  manifest.commits.clear();
  manifest.commits.reserve(commits.size());
  for (const auto &c : commits) {
    manifest.commits.push_back(c.get<CommitMeta>());
  }
}

std::string serialize(const CommitMeta &meta) {
  return ordered_json(meta).dump(2) + "\n";
}

std::string serialize(const RepoManifest &manifest) {
  return ordered_json(manifest).dump(2) + "\n";
}

CommitMeta deserialize_commit_meta(std::string_view text) {
  return decode_text<CommitMeta>(text);
}

RepoManifest deserialize_manifest(std::string_view text) {
  return decode_text<RepoManifest>(text);
}

void write_commit_meta(const std::filesystem::path &path, const CommitMeta &meta) {
  write_text(path, serialize(meta));
}

void write_manifest(const std::filesystem::path &path, const RepoManifest &manifest) {
  write_text(path, serialize(manifest));
}

RepoManifest read_manifest(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw ManifestDecodeError("cannot open manifest: " + path.string());
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) {
    throw ManifestDecodeError("cannot read manifest: " + path.string());
  }
  return deserialize_manifest(ss.str());
}

} // namespace gitreplay
