#pragma once
#include "gitreplay/consts.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gitreplay {

// What replay does with a parent id no earlier record produced.
enum class MissingParentPolicy {
  Fail, // throw DanglingParentReference
  Drop, // silently leave the parent out
};

struct Settings {
  std::string branch{consts::kDefaultBranch};
  std::filesystem::path export_dir{consts::kExportDir};
  std::string manifest_file{consts::kManifestFile};
  std::string meta_file{consts::kMetaFile};
  MissingParentPolicy missing_parents = MissingParentPolicy::Fail;

  [[nodiscard]] auto manifest_path() const -> std::filesystem::path {
    return export_dir / manifest_file;
  }
};

// "fail" / "drop"; throws ConfigError otherwise
auto parse_missing_policy(std::string_view text) -> MissingParentPolicy;
auto missing_policy_name(MissingParentPolicy policy) -> std::string_view;

// Read `key: value` lines from `path` on top of the defaults. A missing file
// yields the defaults. Blank lines and lines starting with '#' are ignored;
// unknown keys and empty values throw ConfigError.
auto load_settings(const std::filesystem::path& path) -> Settings;

} // namespace gitreplay
