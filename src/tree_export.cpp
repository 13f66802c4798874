#include "gitreplay/tree_export.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/repo.hpp"

#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

namespace gitreplay {

namespace {

constexpr std::uint32_t kModeTypeMask = 0170000;
constexpr std::uint32_t kModeRegular = 0100000;

void make_dir(const stdfs::path &dir) {
  std::error_code ec;
  stdfs::create_directories(dir, ec);
  if (ec) {
    throw ExportIOError("cannot create directory " + dir.string() + ": " + ec.message());
  }
}

void write_blob_file(const stdfs::path &path, const std::vector<std::uint8_t> &bytes,
                     bool executable) {
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw ExportIOError("cannot open for write: " + path.string());
    }
    if (!bytes.empty()) {
      ofs.write(reinterpret_cast<const char *>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
    }
    ofs.flush();
    if (!ofs) {
      throw ExportIOError("write failed: " + path.string());
    }
  }
  if (executable) {
    std::error_code ec;
    stdfs::permissions(path,
                        stdfs::perms::owner_exec | stdfs::perms::group_exec |
                            stdfs::perms::others_exec,
                        stdfs::perm_options::add, ec);
    if (ec) {
      throw ExportIOError("chmod +x failed: " + path.string() + ": " + ec.message());
    }
  }
}

} // namespace

void export_tree(const Repository &repo, std::string_view tree_hex,
                 const stdfs::path &output_dir) {
  std::vector<std::pair<std::string, stdfs::path>> work;
  work.emplace_back(std::string(tree_hex), output_dir);

  while (!work.empty()) {
    auto [hex, dir] = std::move(work.back());
    work.pop_back();
    make_dir(dir);

    for (const auto &e : repo.read_tree(hex)) {
      if (e.name.empty() || e.name == "." || e.name == ".." || e.name == consts::kGitDir ||
          e.name.find('/') != std::string::npos) {
        throw ObjectError("tree " + hex + " has unsafe entry name '" + e.name + "'");
      }
      const stdfs::path target = dir / e.name;
      const std::uint32_t kind = e.mode & kModeTypeMask;
      if (kind == consts::kModeTree) {
        work.emplace_back(to_hex(e.id), target);
      } else if (kind == kModeRegular) {
        // Legacy trees may carry 100664 and friends; only the owner x bit matters.
        write_blob_file(target, repo.read_blob(to_hex(e.id)), (e.mode & 0100U) != 0);
      }
      // symlinks and gitlinks are skipped
    }
  }
}

} // namespace gitreplay
