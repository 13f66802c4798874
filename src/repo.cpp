#include "gitreplay/repo.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"
#include "gitreplay/index.hpp"
#include "gitreplay/refs.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace gfs   = gitreplay::fs;

namespace {
[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

// Git orders tree entries as if directory names ended in '/'.
[[nodiscard]] auto tree_sort_key(const gitreplay::TreeEntry& e) -> std::string {
  return e.mode == gitreplay::consts::kModeTree ? e.name + "/" : e.name;
}

constexpr std::string_view kInitialConfig =
    "[core]\n"
    "\trepositoryformatversion = 0\n"
    "\tfilemode = true\n"
    "\tbare = false\n";
} // namespace

namespace gitreplay {

Repository::Repository(stdfs::path root) : root_(std::move(root)), store_(root_ / consts::kGitDir) {}

auto Repository::is_initialized() const -> bool { return stdfs::exists(git_dir()); }

void Repository::init(std::string_view initial_branch) const {
  if (is_initialized()) {
    throw WorkdirIOError("a repository already exists at: " + git_dir().string());
  }

  std::error_code ec;
  for (const auto& dir : {objects_dir(), heads_dir(), tags_dir()}) {
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw WorkdirIOError("create " + dir.string() + " failed: " + ec.message());
    }
  }

  try {
    set_HEAD_symbolic(root_, heads_ref(initial_branch));
    gfs::write_file_atomic(config_file(), gfs::bytes_of(kInitialConfig));
  } catch (const std::exception& e) {
    throw WorkdirIOError("init " + git_dir().string() + ": " + e.what());
  }
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw ObjectError("tree parse: bad mode '" + std::string(s) + "'");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  return store_.write(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  auto [type, data] = store_.read(hex_oid);
  if (type != consts::kTypeBlob) {
    throw ObjectError("object is not a blob: " + std::string(hex_oid));
  }
  return std::move(data);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries, [](const TreeEntry& a, const TreeEntry& b) {
    return tree_sort_key(a) < tree_sort_key(b);
  });

  std::string data;
  for (const auto& e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }

  return store_.write(consts::kTypeTree, gfs::bytes_of(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const auto [type, data] = store_.read(hex_oid);
  if (type != consts::kTypeTree) {
    throw ObjectError("object is not a tree: " + std::string(hex_oid));
  }

  std::vector<TreeEntry> out;
  auto p   = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw ObjectError("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw ObjectError("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw ObjectError("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;

  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += consts::kLF;

  for (const auto& p : parent_hexes) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += consts::kLF;
  }

  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += consts::kLF;

  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";

  txt += message;

  return store_.write(consts::kTypeCommit, gfs::bytes_of(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const auto obj = store_.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw ObjectError("object is not a commit: " + std::string(commit_hex));
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  // Headers end at the first empty line. Continuation lines of multi-line
  // headers (gpgsig, mergetag) start with a space and are skipped with them.
  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.rfind(consts::kTreePrefix, 0) == 0) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.rfind(consts::kParentPrefix, 0) == 0) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.rfind(consts::kAuthorPrefix, 0) == 0) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.rfind(consts::kCommitterPrefix, 0) == 0) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  if (info.tree_hex.size() != consts::kOidHexLen) {
    throw ObjectError("commit has no tree: " + std::string(commit_hex));
  }
  return info;
}

auto Repository::write_tree_from_index(const Index& index) const -> std::string {
  const auto build = [&](const auto& self, const std::vector<IndexEntry>& group) -> std::string {
    std::map<std::string, std::vector<IndexEntry>> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto& e : group) {
      auto [first, rest] = split_first(e.path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.mode = e.mode, .name = std::move(first), .id = e.id});
      } else {
        IndexEntry child = e;
        child.path = std::move(rest);
        subdirs[first].push_back(std::move(child));
      }
    }

    for (const auto& [dirname, child_entries] : subdirs) {
      const std::string subtree_hex = self(self, child_entries);

      TreeEntry te{};
      te.mode = consts::kModeTree;
      te.name = dirname;
      if (!from_hex(subtree_hex, te.id)) {
        throw std::runtime_error("bad subtree hex oid");
      }
      tree_entries.push_back(std::move(te));
    }

    return write_tree(tree_entries);
  };

  return build(build, index.entries());
}

} // namespace gitreplay
