#include "gitreplay/pack.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

namespace gfs = gitreplay::fs;

namespace gitreplay {

namespace {

constexpr std::size_t kFanoutEntries = 256;
constexpr std::size_t kIdxHeaderLen = 8;
constexpr std::size_t kPackHeaderLen = 12;
constexpr std::uint32_t kLargeOffsetFlag = 0x80000000U;

std::uint32_t be32(std::span<const std::uint8_t> buf, std::size_t at) {
  if (at + 4 > buf.size()) {
    throw ObjectError("pack: truncated 32-bit field");
  }
  return (static_cast<std::uint32_t>(buf[at]) << 24U) |
         (static_cast<std::uint32_t>(buf[at + 1]) << 16U) |
         (static_cast<std::uint32_t>(buf[at + 2]) << 8U) | static_cast<std::uint32_t>(buf[at + 3]);
}

std::uint64_t be64(std::span<const std::uint8_t> buf, std::size_t at) {
  return (static_cast<std::uint64_t>(be32(buf, at)) << 32U) | be32(buf, at + 4);
}

bool has_magic(std::span<const std::uint8_t> buf, std::string_view magic) {
  return buf.size() >= magic.size() && std::memcmp(buf.data(), magic.data(), magic.size()) == 0;
}

std::string_view type_name(int type) {
  switch (type) {
  case consts::kPackCommit:
    return consts::kTypeCommit;
  case consts::kPackTree:
    return consts::kTypeTree;
  case consts::kPackBlob:
    return consts::kTypeBlob;
  case consts::kPackTag:
    return consts::kTypeTag;
  default:
    throw ObjectError("pack: unsupported object type " + std::to_string(type));
  }
}

// Little-endian base-128 size used in delta headers.
std::size_t delta_varint(std::span<const std::uint8_t> delta, std::size_t &pos) {
  std::size_t value = 0;
  unsigned shift = 0;
  for (;;) {
    if (pos >= delta.size()) {
      throw ObjectError("delta: truncated size header");
    }
    if (shift >= 64) {
      throw ObjectError("delta: size header too long");
    }
    const std::uint8_t byte = delta[pos++];
    value |= static_cast<std::size_t>(byte & 0x7FU) << shift;
    shift += 7;
    if ((byte & 0x80U) == 0) {
      return value;
    }
  }
}

} // namespace

std::vector<std::uint8_t> apply_delta(std::span<const std::uint8_t> base,
                                      std::span<const std::uint8_t> delta) {
  std::size_t pos = 0;
  const std::size_t src_size = delta_varint(delta, pos);
  const std::size_t dst_size = delta_varint(delta, pos);
  if (src_size != base.size()) {
    throw ObjectError("delta: base size mismatch");
  }

  std::vector<std::uint8_t> out;
  out.reserve(dst_size);
  while (pos < delta.size()) {
    const std::uint8_t cmd = delta[pos++];
    if (cmd & 0x80U) {
      std::size_t copy_off = 0;
      std::size_t copy_len = 0;
      for (unsigned i = 0; i < 4; ++i) {
        if (cmd & (1U << i)) {
          if (pos >= delta.size()) throw ObjectError("delta: truncated copy offset");
          copy_off |= static_cast<std::size_t>(delta[pos++]) << (8 * i);
        }
      }
      for (unsigned i = 0; i < 3; ++i) {
        if (cmd & (0x10U << i)) {
          if (pos >= delta.size()) throw ObjectError("delta: truncated copy length");
          copy_len |= static_cast<std::size_t>(delta[pos++]) << (8 * i);
        }
      }
      if (copy_len == 0) {
        copy_len = 0x10000;
      }
      if (copy_off + copy_len > base.size()) {
        throw ObjectError("delta: copy outside base object");
      }
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(copy_off),
                 base.begin() + static_cast<std::ptrdiff_t>(copy_off + copy_len));
    } else if (cmd != 0) {
      if (pos + cmd > delta.size()) {
        throw ObjectError("delta: truncated insert");
      }
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(pos),
                 delta.begin() + static_cast<std::ptrdiff_t>(pos + cmd));
      pos += cmd;
    } else {
      throw ObjectError("delta: reserved opcode 0");
    }
  }

  if (out.size() != dst_size) {
    throw ObjectError("delta: result size mismatch");
  }
  return out;
}

PackFile::PackFile(std::filesystem::path idx_path)
    : pack_path_(std::filesystem::path(idx_path).replace_extension(".pack")) {
  const auto idx = gfs::read_file(idx_path);
  if (!has_magic(idx, consts::kPackIdxSignature) || be32(idx, 4) != 2) {
    throw ObjectError("not a version 2 pack index: " + idx_path.string());
  }

  const std::size_t count = be32(idx, kIdxHeaderLen + (kFanoutEntries - 1) * 4);
  const std::size_t ids_at = kIdxHeaderLen + kFanoutEntries * 4;
  const std::size_t crc_at = ids_at + count * consts::kOidRawLen;
  const std::size_t off_at = crc_at + count * 4;
  const std::size_t large_at = off_at + count * 4;
  if (idx.size() < large_at + 2 * consts::kOidRawLen) {
    throw ObjectError("truncated pack index: " + idx_path.string());
  }

  ids_.resize(count);
  offsets_.resize(count);
  for (std::size_t i = 0; i < count; ++i) {
    std::memcpy(ids_[i].data(), idx.data() + ids_at + i * consts::kOidRawLen,
                consts::kOidRawLen);
    const std::uint32_t small = be32(idx, off_at + i * 4);
    if (small & kLargeOffsetFlag) {
      offsets_[i] = be64(idx, large_at + static_cast<std::size_t>(small & ~kLargeOffsetFlag) * 8);
    } else {
      offsets_[i] = small;
    }
  }

  sorted_offsets_ = offsets_;
  std::ranges::sort(sorted_offsets_);

  std::error_code ec;
  pack_size_ = std::filesystem::file_size(pack_path_, ec);
  if (ec) {
    throw ObjectError("pack file missing for index: " + idx_path.string());
  }
}

std::optional<std::uint64_t> PackFile::find_offset(const oid &id) const {
  const auto it = std::ranges::lower_bound(ids_, id);
  if (it == ids_.end() || *it != id) {
    return std::nullopt;
  }
  return offsets_[static_cast<std::size_t>(it - ids_.begin())];
}

std::uint64_t PackFile::entry_end(std::uint64_t offset) const {
  const auto it = std::ranges::upper_bound(sorted_offsets_, offset);
  // The pack ends with a 20-byte checksum trailer.
  return it == sorted_offsets_.end() ? pack_size_ - consts::kOidRawLen : *it;
}

PackFile::RawEntry PackFile::read_raw(std::uint64_t offset) const {
  const std::uint64_t end = entry_end(offset);
  if (offset < kPackHeaderLen || end <= offset || end > pack_size_) {
    throw ObjectError("pack: bad entry offset " + std::to_string(offset));
  }

  std::ifstream ifs(pack_path_, std::ios::binary);
  if (!ifs) {
    throw ObjectError("pack: open failed: " + pack_path_.string());
  }
  std::vector<std::uint8_t> header(kPackHeaderLen);
  ifs.read(reinterpret_cast<char *>(header.data()), static_cast<std::streamsize>(header.size()));
  if (!ifs || !has_magic(header, consts::kPackSignature) ||
      be32(header, 4) != consts::kPackVersion) {
    throw ObjectError("pack: not a version 2 pack: " + pack_path_.string());
  }

  std::vector<std::uint8_t> buf(static_cast<std::size_t>(end - offset));
  ifs.seekg(static_cast<std::streamoff>(offset));
  ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!ifs) {
    throw ObjectError("pack: short read at offset " + std::to_string(offset));
  }

  // Type and inflated size: 3 type bits, then base-128 size starting with 4 bits.
  std::size_t pos = 0;
  std::uint8_t byte = buf[pos++];
  RawEntry entry;
  entry.type = (byte >> 4U) & 0x7U;
  std::size_t size = byte & 0x0FU;
  unsigned shift = 4;
  while (byte & 0x80U) {
    if (pos >= buf.size()) throw ObjectError("pack: truncated entry header");
    if (shift >= 64) throw ObjectError("pack: entry size header too long");
    byte = buf[pos++];
    size |= static_cast<std::size_t>(byte & 0x7FU) << shift;
    shift += 7;
  }

  if (entry.type == consts::kPackOfsDelta) {
    if (pos >= buf.size()) throw ObjectError("pack: truncated delta offset");
    byte = buf[pos++];
    std::uint64_t back = byte & 0x7FU;
    while (byte & 0x80U) {
      if (pos >= buf.size()) throw ObjectError("pack: truncated delta offset");
      if (back >= (std::uint64_t{1} << 56U)) throw ObjectError("pack: delta offset too long");
      byte = buf[pos++];
      back = ((back + 1) << 7U) | (byte & 0x7FU);
    }
    if (back == 0 || back > offset) {
      throw ObjectError("pack: delta base outside pack");
    }
    entry.base_offset = offset - back;
  } else if (entry.type == consts::kPackRefDelta) {
    if (pos + consts::kOidRawLen > buf.size()) throw ObjectError("pack: truncated delta base");
    std::memcpy(entry.base_id.data(), buf.data() + pos, consts::kOidRawLen);
    pos += consts::kOidRawLen;
  }

  try {
    entry.data = gfs::z_inflate_prefix(std::span(buf).subspan(pos), size);
  } catch (const std::runtime_error &e) {
    throw ObjectError("pack: entry at " + std::to_string(offset) + ": " + e.what());
  }
  return entry;
}

Object PackFile::read_at(std::uint64_t offset) const {
  // Walk down to the non-delta base, remembering every delta on the way.
  std::vector<std::vector<std::uint8_t>> deltas;
  RawEntry entry = read_raw(offset);
  while (entry.type == consts::kPackOfsDelta || entry.type == consts::kPackRefDelta) {
    std::uint64_t base_at = entry.base_offset;
    if (entry.type == consts::kPackRefDelta) {
      const auto found = find_offset(entry.base_id);
      if (!found) {
        throw ObjectError("pack: delta base " + to_hex(entry.base_id) + " not in " +
                          pack_path_.filename().string());
      }
      base_at = *found;
    }
    deltas.push_back(std::move(entry.data));
    entry = read_raw(base_at);
  }

  Object obj{.type = std::string(type_name(entry.type)), .data = std::move(entry.data)};
  for (auto it = deltas.rbegin(); it != deltas.rend(); ++it) {
    obj.data = apply_delta(obj.data, *it);
  }
  return obj;
}

} // namespace gitreplay
