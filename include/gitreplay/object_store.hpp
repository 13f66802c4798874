#pragma once
#include "gitreplay/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitreplay {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

class PackFile; // fwd, see pack.hpp

// Object database under <gitdir>/objects: loose objects are read and written,
// packs under objects/pack are read-only and consulted when no loose copy exists.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir);
  ~ObjectStore();
  ObjectStore(ObjectStore&&) noexcept;
  ObjectStore& operator=(ObjectStore&&) noexcept;

  // Read object identified by 40-hex; returns type and payload.
  // Throws ObjectError if it is missing or cannot be decoded.
  Object read(std::string_view hex_oid) const;

  // Write object with given type/payload as a loose object. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  // Get filesystem path of the loose object for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  const std::vector<std::unique_ptr<PackFile>>& packs() const;

  std::filesystem::path gitdir_;
  mutable std::vector<std::unique_ptr<PackFile>> packs_;
  mutable bool packs_loaded_ = false;
};

} // namespace gitreplay
