#include "gitreplay/errors.hpp"
#include "gitreplay/refs.hpp"
#include "gitreplay/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include "support.hpp"

namespace fs = std::filesystem;
using testsupport::check;
using testsupport::slurp;

int main() {
  testsupport::ScratchDir scratch{"gitreplay_init_test"};
  const fs::path repo_root = scratch.path;

  try {
    gitreplay::Repository repo{repo_root};
    check(!repo.is_initialized(), "repo unexpectedly initialized before init()");

    repo.init("trunk");

    const fs::path gitdir = repo_root / ".git";
    for (const auto &dir : {gitdir, gitdir / "objects", gitdir / "refs", gitdir / "refs/heads",
                            gitdir / "refs/tags"}) {
      check(fs::is_directory(dir), dir.string() + " missing");
    }

    check(slurp(gitdir / "HEAD") == "ref: refs/heads/trunk\n", "HEAD content");
    check(gitreplay::head_symbolic_target(repo_root) == "refs/heads/trunk", "HEAD target");
    check(slurp(gitdir / "config").rfind("[core]\n", 0) == 0, "config starts with [core]");
    check(!gitreplay::resolve_ref(repo_root, "refs/heads/trunk"), "unborn branch");

    // Calling init again should throw
    bool threw = false;
    try {
      repo.init();
    } catch (const gitreplay::WorkdirIOError &) {
      threw = true;
    }
    check(threw, "init did not throw on already-initialized repo");

    // Ref round trip through update_ref / resolve_ref
    const std::string id(40, 'e');
    gitreplay::update_ref(repo_root, gitreplay::heads_ref("trunk"), id);
    check(slurp(gitdir / "refs/heads/trunk") == id + "\n", "loose ref file");
    check(gitreplay::resolve_ref(repo_root, "HEAD") == id, "HEAD resolves through symref");

    std::cout << "init test OK: " << repo_root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
