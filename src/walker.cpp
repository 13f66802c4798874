#include "gitreplay/walker.hpp"

#include "gitreplay/errors.hpp"
#include "gitreplay/refs.hpp"

#include <unordered_set>
#include <utility>

namespace gitreplay {

std::vector<Commit> collect_commits(const Repository &repo, std::string_view branch) {
  const auto head = resolve_ref(repo.root(), heads_ref(branch));
  if (!head) {
    throw RefNotFound("branch not found: " + std::string(branch));
  }
  return collect_commits_from(repo, *head);
}

std::vector<Commit> collect_commits_from(const Repository &repo, const std::string &head_hex) {
  struct Frame {
    Commit commit;
    std::size_t next_parent = 0;
  };

  std::vector<Commit> out;
  std::unordered_set<std::string> seen{head_hex};
  std::vector<Frame> stack;
  stack.push_back(Frame{.commit = {head_hex, repo.read_commit(head_hex)}});

  while (!stack.empty()) {
    Frame &top = stack.back();
    if (top.next_parent < top.commit.info.parents.size()) {
      const std::string parent = top.commit.info.parents[top.next_parent++];
      if (seen.insert(parent).second) {
        auto info = repo.read_commit(parent);
        stack.push_back(Frame{.commit = {parent, std::move(info)}});
      }
      continue;
    }
    // All parents emitted: the commit itself can follow them.
    out.push_back(std::move(top.commit));
    stack.pop_back();
  }
  return out;
}

} // namespace gitreplay
