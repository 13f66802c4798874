#include "gitreplay/config.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/extract.hpp"
#include "gitreplay/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_extract(int argc, char **argv) {
  const auto cwd = std::filesystem::current_path();
  try {
    auto settings = gitreplay::load_settings(cwd / gitreplay::consts::kSettingsFile);

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--branch" && i + 1 < argc) {
        settings.branch = argv[++i];
      } else if (a == "--export-dir" && i + 1 < argc) {
        settings.export_dir = argv[++i];
      } else {
        std::cerr << "usage: gitreplay extract [--branch <name>] [--export-dir <dir>]\n";
        return 2;
      }
    }

    const gitreplay::Repository repo{cwd};
    if (!repo.is_initialized()) {
      std::cerr << "extract: not a git repository: " << cwd << "\n";
      return 1;
    }

    const auto manifest = gitreplay::extract(
        repo, settings,
        [](std::size_t index, std::size_t total, const gitreplay::CommitMeta &meta) {
          std::cout << "[" << index << "/" << total << "] " << meta.sha.substr(0, 7) << " -> "
                    << meta.folder.generic_string() << "\n";
        });
    std::cout << "Exported " << manifest.commits.size() << " commit(s) of '" << settings.branch
              << "' to " << settings.manifest_path().generic_string() << "\n";
    return 0;
  } catch (const gitreplay::ConfigError &e) {
    std::cerr << "extract: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "extract: " << e.what() << "\n";
    return 1;
  }
}
