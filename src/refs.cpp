#include "gitreplay/refs.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/fs.hpp"
#include "gitreplay/util.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace gitreplay {

// Symbolic refs pointing at symbolic refs are rare; bound the chain anyway.
static constexpr int kMaxSymrefDepth = 5;

static std::filesystem::path git_dir(const std::filesystem::path &root) {
  return root / consts::kGitDir;
}

static std::filesystem::path head_file(const std::filesystem::path &root) {
  return git_dir(root) / consts::kHeadFile;
}

static std::filesystem::path ref_path(const std::filesystem::path &root,
                                      const std::string &refname) {
  return git_dir(root) / refname;
}

static std::string read_text(const std::filesystem::path &p) {
  const auto bytes = fs::read_file(p);
  return {bytes.begin(), bytes.end()};
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

std::optional<std::string> read_HEAD(const std::filesystem::path &repo_root) {
  const auto p = head_file(repo_root);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  return read_text(p);
}

std::optional<std::string> head_symbolic_target(const std::filesystem::path &repo_root) {
  auto head_txt = read_HEAD(repo_root);
  if (!head_txt || head_txt->rfind(consts::kRefPrefix, 0) != 0) {
    return std::nullopt;
  }
  std::string rn = head_txt->substr(consts::kRefPrefix.size());
  strutil::rstrip_newlines(rn);
  return rn;
}

void set_HEAD_symbolic(const std::filesystem::path &repo_root, const std::string &refname) {
  const std::string ref_str = std::string(consts::kRefPrefix) + refname + "\n";
  fs::write_file_atomic(head_file(repo_root), fs::bytes_of(ref_str));
}

std::optional<std::string> read_ref(const std::filesystem::path &repo_root,
                                    const std::string &refname) {
  const auto p = ref_path(repo_root, refname);
  if (!fs::exists(p) || std::filesystem::is_directory(p)) {
    return std::nullopt;
  }
  std::string s = read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

std::optional<std::string> read_packed_ref(const std::filesystem::path &repo_root,
                                           const std::string &refname) {
  const auto p = git_dir(repo_root) / consts::kPackedRefs;
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  // "<40-hex> <refname>" lines; '#' header and '^' peeled-tag lines are skipped.
  std::istringstream iss(read_text(p));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#' || line[0] == '^') {
      continue;
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos) {
      continue;
    }
    if (std::string_view(line).substr(sp + 1) == refname && looks_hex40(line.substr(0, sp))) {
      return line.substr(0, sp);
    }
  }
  return std::nullopt;
}

std::optional<std::string> resolve_ref(const std::filesystem::path &repo_root,
                                       const std::string &refname) {
  std::string name = refname;
  for (int depth = 0; depth < kMaxSymrefDepth; ++depth) {
    auto value = read_ref(repo_root, name);
    if (!value) {
      return read_packed_ref(repo_root, name);
    }
    if (value->rfind(consts::kRefPrefix, 0) == 0) {
      name = value->substr(consts::kRefPrefix.size());
      continue;
    }
    if (!looks_hex40(*value)) {
      return std::nullopt;
    }
    return value;
  }
  return std::nullopt;
}

void update_ref(const std::filesystem::path &repo_root, const std::string &refname,
                const std::string &hex_oid) {
  const std::string s = hex_oid + "\n";
  fs::write_file_atomic(ref_path(repo_root, refname), fs::bytes_of(s));
}

} // namespace gitreplay
