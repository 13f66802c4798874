#include "gitreplay/commit_meta.hpp"
#include "gitreplay/config.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/replay.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_rebuild(int argc, char **argv) {
  const auto cwd = std::filesystem::current_path();
  try {
    auto settings = gitreplay::load_settings(cwd / gitreplay::consts::kSettingsFile);

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--export-dir" && i + 1 < argc) {
        settings.export_dir = argv[++i];
      } else if (a == "--missing-parents" && i + 1 < argc) {
        settings.missing_parents = gitreplay::parse_missing_policy(argv[++i]);
      } else {
        std::cerr << "usage: gitreplay rebuild [--export-dir <dir>] "
                     "[--missing-parents fail|drop]\n";
        return 2;
      }
    }

    const auto manifest_path = settings.export_dir.is_absolute()
                                   ? settings.manifest_path()
                                   : cwd / settings.manifest_path();
    const auto manifest = gitreplay::read_manifest(manifest_path);
    const auto target = gitreplay::rebuild_target(manifest, cwd);

    const auto result = gitreplay::replay_manifest(
        manifest, target, cwd, settings,
        [](std::size_t index, std::size_t total, const gitreplay::CommitMeta &meta,
           const std::string &new_id) {
          std::cout << "[" << index << "/" << total << "] " << meta.sha.substr(0, 7) << " -> "
                    << new_id.substr(0, 7) << "\n";
        });

    for (const auto &sha : result.tree_mismatches) {
      std::cerr << "rebuild: warning: tree of " << sha.substr(0, 7)
                << " differs from the recorded tree_sha\n";
    }
    std::cout << "Rebuilt " << result.remap.size() << " commit(s) into " << target
              << " (branch '" << manifest.branch << "' at " << result.head.substr(0, 7)
              << ", missing parents: " << gitreplay::missing_policy_name(settings.missing_parents)
              << ")\n";
    return 0;
  } catch (const gitreplay::ConfigError &e) {
    std::cerr << "rebuild: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "rebuild: " << e.what() << "\n";
    return 1;
  }
}
