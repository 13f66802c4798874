#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gitreplay {

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Read HEAD file as raw string (e.g., "ref: refs/heads/main\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist yet.
std::optional<std::string> read_HEAD(const std::filesystem::path& repo_root);

// Ref name HEAD points at ("refs/heads/main"), or nullopt when HEAD is
// missing or detached.
std::optional<std::string> head_symbolic_target(const std::filesystem::path& repo_root);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const std::filesystem::path& repo_root, const std::string& refname);

// Read a loose ref file (e.g., "refs/heads/main") -> 40-hex OID (without trailing newline).
std::optional<std::string> read_ref(const std::filesystem::path& repo_root, const std::string& refname);

// Look `refname` up in .git/packed-refs.
std::optional<std::string> read_packed_ref(const std::filesystem::path& repo_root,
                                           const std::string& refname);

// Loose ref first, then packed-refs; follows "ref: " indirections.
std::optional<std::string> resolve_ref(const std::filesystem::path& repo_root,
                                       const std::string& refname);

// Overwrite/create a loose ref with the given 40-hex OID (adds trailing newline on disk).
void update_ref(const std::filesystem::path& repo_root, const std::string& refname, const std::string& hex_oid);

} // namespace gitreplay
