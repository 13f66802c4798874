#include "gitreplay/object_store.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"
#include "gitreplay/pack.hpp"

#include <algorithm>
#include <stdexcept>

namespace gfs = gitreplay::fs;

namespace gitreplay {

namespace {

Object parse_loose(std::vector<std::uint8_t> store) {
  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw ObjectError("object_store: invalid header");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw ObjectError("object_store: invalid header");
  }
  std::string type(store.begin(), it_space);
  const std::string size_str(it_space + 1, it_nul);
  const auto payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  if (size_str != std::to_string(store.size() - payload_off)) {
    throw ObjectError("object_store: size mismatch");
  }
  return Object{.type = std::move(type), .data = {store.begin() + static_cast<std::ptrdiff_t>(payload_off), store.end()}};
}

} // namespace

ObjectStore::ObjectStore(std::filesystem::path gitdir) : gitdir_(std::move(gitdir)) {}
ObjectStore::~ObjectStore() = default;
ObjectStore::ObjectStore(ObjectStore &&) noexcept = default;
ObjectStore &ObjectStore::operator=(ObjectStore &&) noexcept = default;

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

const std::vector<std::unique_ptr<PackFile>> &ObjectStore::packs() const {
  if (!packs_loaded_) {
    const auto dir = gitdir_ / consts::kObjectsDir / consts::kPackDir;
    std::vector<std::filesystem::path> idx_files;
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
      for (const auto &entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".idx") {
          idx_files.push_back(entry.path());
        }
      }
    }
    // Fixed lookup order regardless of directory iteration order.
    std::ranges::sort(idx_files);
    for (const auto &p : idx_files) {
      packs_.push_back(std::make_unique<PackFile>(p));
    }
    packs_loaded_ = true;
  }
  return packs_;
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw ObjectError("object_store: bad oid hex: " + std::string(hex_oid));
  }

  const auto loose = path_for_oid(id);
  if (gfs::exists(loose)) {
    try {
      return parse_loose(gfs::z_decompress(gfs::read_file(loose)));
    } catch (const ObjectError &) {
      throw;
    } catch (const std::runtime_error &e) {
      throw ObjectError("object_store: " + std::string(hex_oid) + ": " + e.what());
    }
  }

  for (const auto &pack : packs()) {
    if (const auto off = pack->find_offset(id)) {
      return pack->read_at(*off);
    }
  }
  throw ObjectError("object not found: " + std::string(hex_oid));
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    return false;
  }
  if (gfs::exists(path_for_oid(id))) {
    return true;
  }
  return std::ranges::any_of(packs(), [&](const auto &pack) {
    return pack->find_offset(id).has_value();
  });
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  const auto hdr_bytes = gfs::bytes_of(hdr);
  store.insert(store.end(), hdr_bytes.begin(), hdr_bytes.end());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid store_id = sha1(store);
  const std::string hex = to_hex(store_id);
  if (!contains(hex)) {
    gfs::write_file_atomic(path_for_oid(store_id), gfs::z_compress(store));
  }
  return hex;
}

} // namespace gitreplay
