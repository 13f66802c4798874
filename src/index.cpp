#include "gitreplay/index.hpp"

#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"
#include "gitreplay/hash.hpp"
#include "gitreplay/repo.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#if !defined(_WIN32)
#include <sys/stat.h>
#endif

namespace gitreplay {

namespace {

constexpr std::size_t kHeaderLen = 12;
constexpr std::size_t kEntryFixedLen = 62; // stat fields + oid + flags
constexpr std::uint16_t kNameMask = 0x0FFF;

void put32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24U));
  out.push_back(static_cast<std::uint8_t>(v >> 16U));
  out.push_back(static_cast<std::uint8_t>(v >> 8U));
  out.push_back(static_cast<std::uint8_t>(v));
}

void put16(std::vector<std::uint8_t> &out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8U));
  out.push_back(static_cast<std::uint8_t>(v));
}

std::uint32_t get32(const std::vector<std::uint8_t> &in, std::size_t at) {
  return (static_cast<std::uint32_t>(in[at]) << 24U) | (static_cast<std::uint32_t>(in[at + 1]) << 16U) |
         (static_cast<std::uint32_t>(in[at + 2]) << 8U) | static_cast<std::uint32_t>(in[at + 3]);
}

std::uint16_t get16(const std::vector<std::uint8_t> &in, std::size_t at) {
  return static_cast<std::uint16_t>((in[at] << 8U) | in[at + 1]);
}

StatInfo stat_of(const std::filesystem::path &p) {
  StatInfo si{};
#if !defined(_WIN32)
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) {
    throw std::runtime_error("stat failed: " + p.string());
  }
  si.ctime_s = static_cast<std::uint32_t>(st.st_ctim.tv_sec);
  si.ctime_ns = static_cast<std::uint32_t>(st.st_ctim.tv_nsec);
  si.mtime_s = static_cast<std::uint32_t>(st.st_mtim.tv_sec);
  si.mtime_ns = static_cast<std::uint32_t>(st.st_mtim.tv_nsec);
  si.dev = static_cast<std::uint32_t>(st.st_dev);
  si.ino = static_cast<std::uint32_t>(st.st_ino);
  si.uid = static_cast<std::uint32_t>(st.st_uid);
  si.gid = static_cast<std::uint32_t>(st.st_gid);
  si.size = static_cast<std::uint32_t>(st.st_size);
#else
  si.size = static_cast<std::uint32_t>(std::filesystem::file_size(p));
#endif
  return si;
}

} // namespace

Index::Index(std::filesystem::path repo_root) : repo_root_(std::move(repo_root)) {}

std::filesystem::path Index::index_path() const {
  return repo_root_ / consts::kGitDir / consts::kIndexFile;
}

void Index::load() {
  entries_.clear();
  const auto p = index_path();
  if (!fs::exists(p))
    return;

  const auto buf = fs::read_file(p);
  if (buf.size() < kHeaderLen + consts::kOidRawLen ||
      std::memcmp(buf.data(), consts::kIndexSignature.data(), 4) != 0) {
    throw ObjectError("index: bad signature: " + p.string());
  }
  if (get32(buf, 4) != consts::kIndexVersion) {
    throw ObjectError("index: only version 2 is supported");
  }
  const std::size_t body_len = buf.size() - consts::kOidRawLen;
  const oid expect = sha1(std::span(buf).first(body_len));
  if (std::memcmp(expect.data(), buf.data() + body_len, consts::kOidRawLen) != 0) {
    throw ObjectError("index: checksum mismatch");
  }

  const std::uint32_t count = get32(buf, 8);
  std::size_t pos = kHeaderLen;
  for (std::uint32_t i = 0; i < count; ++i) {
    if (pos + kEntryFixedLen > body_len) {
      throw ObjectError("index: truncated entry");
    }
    IndexEntry e{};
    e.stat.ctime_s = get32(buf, pos);
    e.stat.ctime_ns = get32(buf, pos + 4);
    e.stat.mtime_s = get32(buf, pos + 8);
    e.stat.mtime_ns = get32(buf, pos + 12);
    e.stat.dev = get32(buf, pos + 16);
    e.stat.ino = get32(buf, pos + 20);
    e.mode = get32(buf, pos + 24);
    e.stat.uid = get32(buf, pos + 28);
    e.stat.gid = get32(buf, pos + 32);
    e.stat.size = get32(buf, pos + 36);
    std::memcpy(e.id.data(), buf.data() + pos + 40, consts::kOidRawLen);
    const std::uint16_t flags = get16(buf, pos + 60);

    const std::size_t name_at = pos + kEntryFixedLen;
    const auto nul = std::find(buf.begin() + static_cast<std::ptrdiff_t>(name_at),
                               buf.begin() + static_cast<std::ptrdiff_t>(body_len),
                               static_cast<std::uint8_t>(consts::kNul));
    if (nul == buf.begin() + static_cast<std::ptrdiff_t>(body_len)) {
      throw ObjectError("index: unterminated path");
    }
    e.path.assign(buf.begin() + static_cast<std::ptrdiff_t>(name_at), nul);
    if ((flags & kNameMask) != kNameMask && (flags & kNameMask) != e.path.size()) {
      throw ObjectError("index: path length mismatch for " + e.path);
    }

    // 1..8 NUL bytes pad each entry to a multiple of eight.
    const std::size_t entry_len = kEntryFixedLen + e.path.size();
    pos += entry_len + (8 - (entry_len % 8));
    entries_.push_back(std::move(e));
  }
  // Extensions after the entries are not used here.
}

void Index::save() const {
  auto sorted = entries_;
  std::ranges::sort(sorted, [](const IndexEntry &a, const IndexEntry &b) { return a.path < b.path; });

  std::vector<std::uint8_t> out;
  const auto sig = fs::bytes_of(consts::kIndexSignature);
  out.insert(out.end(), sig.begin(), sig.end());
  put32(out, consts::kIndexVersion);
  put32(out, static_cast<std::uint32_t>(sorted.size()));

  for (const auto &e : sorted) {
    put32(out, e.stat.ctime_s);
    put32(out, e.stat.ctime_ns);
    put32(out, e.stat.mtime_s);
    put32(out, e.stat.mtime_ns);
    put32(out, e.stat.dev);
    put32(out, e.stat.ino);
    put32(out, e.mode);
    put32(out, e.stat.uid);
    put32(out, e.stat.gid);
    put32(out, e.stat.size);
    out.insert(out.end(), e.id.begin(), e.id.end());
    put16(out, static_cast<std::uint16_t>(std::min<std::size_t>(e.path.size(), kNameMask)));
    const auto name = fs::bytes_of(e.path);
    out.insert(out.end(), name.begin(), name.end());
    const std::size_t entry_len = kEntryFixedLen + e.path.size();
    out.insert(out.end(), 8 - (entry_len % 8), static_cast<std::uint8_t>(0));
  }

  const oid checksum = sha1(out);
  out.insert(out.end(), checksum.begin(), checksum.end());
  fs::write_file_atomic(index_path(), out);
}

void Index::add_path(const std::filesystem::path &wd, std::string_view relpath,
                     const Repository &repo, std::uint32_t mode) {
  const auto full = wd / std::filesystem::path(relpath);
  const auto bytes = fs::read_file(full);
  const auto hex_oid = repo.write_blob(bytes);

  oid bin{};
  if (!from_hex(hex_oid, bin)) {
    throw std::runtime_error("write_blob produced bad hex oid");
  }

  std::string path(relpath);
  const StatInfo st = stat_of(full);
  auto it = std::ranges::find_if(entries_, [&](const IndexEntry &e) { return e.path == path; });
  if (it != entries_.end()) {
    it->mode = mode;
    it->id = bin;
    it->stat = st;
  } else {
    entries_.push_back(IndexEntry{.mode = mode, .id = bin, .path = std::move(path), .stat = st});
  }
}

} // namespace gitreplay
