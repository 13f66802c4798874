#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitreplay::consts {

// Directory and file names
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kPackDir       = "pack";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kPackedRefs    = "packed-refs";

// Export layout defaults (all overridable through Settings)
inline constexpr std::string_view kDefaultBranch   = "main";
inline constexpr std::string_view kExportDir       = "export";
inline constexpr std::string_view kManifestFile    = "manifest.json";
inline constexpr std::string_view kMetaFile        = ".commit-meta.json";
inline constexpr std::string_view kSettingsFile    = "gitreplay.conf";
inline constexpr std::string_view kUnknownIdentity = "unknown";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";
inline constexpr std::string_view kTypeTag     = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644; // regular file
inline constexpr std::uint32_t kModeExec    = 0100755; // executable file
inline constexpr std::uint32_t kModeSymlink = 0120000; // symbolic link
inline constexpr std::uint32_t kModeGitlink = 0160000; // submodule commit
inline constexpr std::uint32_t kModeTree    = 0040000; // directory entry in tree

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// Object store fanout
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// Commit header prefixes (used in parsing/formatting)
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kHeadsPrefix     = "refs/heads/";

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// Index file (DIRC v2)
inline constexpr std::string_view kIndexSignature = "DIRC";
inline constexpr std::uint32_t kIndexVersion      = 2;

// Pack files (v2 idx / v2 pack)
inline constexpr std::string_view kPackSignature    = "PACK";
inline constexpr std::string_view kPackIdxSignature = "\377tOc";
inline constexpr std::uint32_t kPackVersion         = 2;
inline constexpr int kPackCommit   = 1;
inline constexpr int kPackTree     = 2;
inline constexpr int kPackBlob     = 3;
inline constexpr int kPackTag      = 4;
inline constexpr int kPackOfsDelta = 6;
inline constexpr int kPackRefDelta = 7;

// Timezone offsets must stay strictly inside one day
inline constexpr int kMaxOffsetMinutes = 24 * 60 - 1;

} // namespace gitreplay::consts
