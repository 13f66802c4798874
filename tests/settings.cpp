#include "gitreplay/config.hpp"
#include "gitreplay/errors.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include "support.hpp"

namespace fs = std::filesystem;
using gitreplay::MissingParentPolicy;
using testsupport::check;
using testsupport::write_file;

static bool rejects(const fs::path &p, const std::string &text) {
  write_file(p, text);
  try {
    (void)gitreplay::load_settings(p);
  } catch (const gitreplay::ConfigError &) {
    return true;
  }
  return false;
}

int main() {
  testsupport::ScratchDir scratch{"gitreplay_settings"};
  const fs::path conf = scratch.path / "gitreplay.conf";

  try {
    // Defaults when no file exists
    const auto defaults = gitreplay::load_settings(conf);
    check(defaults.branch == "main", "default branch");
    check(defaults.export_dir == fs::path("export"), "default export dir");
    check(defaults.manifest_path() == fs::path("export") / "manifest.json", "manifest path");
    check(defaults.meta_file == ".commit-meta.json", "default meta file");
    check(defaults.missing_parents == MissingParentPolicy::Fail, "default policy");

    write_file(conf, "# replay settings\n"
                     "\n"
                     "branch: trunk\n"
                     "export_dir:   out/history  \r\n"
                     "manifest_file: index.json\n"
                     "meta_file: META.json\n"
                     "  missing_parents: drop\n");
    const auto s = gitreplay::load_settings(conf);
    check(s.branch == "trunk", "branch");
    check(s.export_dir == fs::path("out/history"), "export dir trimmed");
    check(s.manifest_path() == fs::path("out/history") / "index.json", "custom manifest path");
    check(s.meta_file == "META.json", "meta file");
    check(s.missing_parents == MissingParentPolicy::Drop, "policy");

    check(rejects(conf, "colour: blue\n"), "unknown key");
    check(rejects(conf, "branch\n"), "missing colon");
    check(rejects(conf, "branch:\n"), "empty value");
    check(rejects(conf, "missing_parents: maybe\n"), "bad policy");

    // A directory in place of the settings file
    const fs::path conf_dir = scratch.path / "nested" / "gitreplay.conf";
    fs::create_directories(conf_dir);
    bool threw = false;
    try {
      (void)gitreplay::load_settings(conf_dir);
    } catch (const gitreplay::ConfigError &) {
      threw = true;
    }
    check(threw, "directory as settings file");

    check(gitreplay::parse_missing_policy("fail") == MissingParentPolicy::Fail, "parse fail");
    check(gitreplay::missing_policy_name(MissingParentPolicy::Drop) == "drop", "policy name");

    std::cout << "settings OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
