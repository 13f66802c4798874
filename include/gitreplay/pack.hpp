#pragma once
#include "gitreplay/hash.hpp"
#include "gitreplay/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace gitreplay {

// Read-only view of one packfile pair: "pack-<sha>.idx" (version 2) and the
// matching "pack-<sha>.pack" (version 2). The index is loaded eagerly; pack
// entries are read from disk on demand.
class PackFile {
public:
  explicit PackFile(std::filesystem::path idx_path);

  [[nodiscard]] std::optional<std::uint64_t> find_offset(const oid& id) const;

  // Fully resolved object (delta chains applied) stored at `offset`.
  Object read_at(std::uint64_t offset) const;

  [[nodiscard]] std::size_t size() const { return ids_.size(); }
  [[nodiscard]] const std::filesystem::path& pack_path() const { return pack_path_; }

private:
  struct RawEntry {
    int type = 0;
    std::vector<std::uint8_t> data; // inflated payload or delta instructions
    std::uint64_t base_offset = 0;  // OFS_DELTA
    oid base_id{};                  // REF_DELTA
  };

  RawEntry read_raw(std::uint64_t offset) const;
  std::uint64_t entry_end(std::uint64_t offset) const;

  std::filesystem::path pack_path_;
  std::vector<oid> ids_;                    // sorted, as stored in the idx
  std::vector<std::uint64_t> offsets_;      // parallel to ids_
  std::vector<std::uint64_t> sorted_offsets_;
  std::uint64_t pack_size_ = 0;
};

// Apply a git delta (source size, target size, copy/insert opcodes) to `base`.
std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta);

} // namespace gitreplay
