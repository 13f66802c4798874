#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"
#include "gitreplay/hash.hpp"
#include "gitreplay/pack.hpp"
#include "gitreplay/repo.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "support.hpp"

namespace fs = std::filesystem;
using bytes = std::vector<std::uint8_t>;
using gitreplay::oid;
using testsupport::check;

static void put32(bytes &out, std::uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::uint8_t>(v >> shift));
  }
}

static void append(bytes &out, std::string_view s) {
  out.insert(out.end(), s.begin(), s.end());
}

static void varint(bytes &out, std::size_t v) {
  while (v >= 0x80) {
    out.push_back(static_cast<std::uint8_t>(0x80 | (v & 0x7F)));
    v >>= 7;
  }
  out.push_back(static_cast<std::uint8_t>(v));
}

static oid blob_id(std::string_view data) {
  return gitreplay::sha1(gitreplay::object_header("blob", data.size()) + std::string(data));
}

struct PackBuilder {
  struct Entry {
    oid id;
    std::uint64_t offset;
    std::uint32_t crc;
  };

  bytes pack;
  std::vector<Entry> entries;

  PackBuilder() {
    append(pack, "PACK");
    put32(pack, 2);
    put32(pack, 0); // patched in finish()
  }

  std::uint64_t add(const oid &id, int type, const bytes &payload, const bytes &delta_base = {}) {
    const std::uint64_t offset = pack.size();
    bytes raw;
    std::size_t size = payload.size();
    std::uint8_t first = static_cast<std::uint8_t>((type << 4) | (size & 0x0F));
    size >>= 4;
    while (size) {
      raw.push_back(first | 0x80);
      first = static_cast<std::uint8_t>(size & 0x7F);
      size >>= 7;
    }
    raw.push_back(first);
    raw.insert(raw.end(), delta_base.begin(), delta_base.end());
    const auto z = gitreplay::fs::z_compress(payload);
    raw.insert(raw.end(), z.begin(), z.end());

    entries.push_back({id, offset,
                       static_cast<std::uint32_t>(
                           crc32(0L, raw.data(), static_cast<uInt>(raw.size())))});
    pack.insert(pack.end(), raw.begin(), raw.end());
    return offset;
  }

  // Entry whose header and body are taken as given
  void add_raw(const oid &id, const bytes &raw) {
    entries.push_back({id, pack.size(),
                       static_cast<std::uint32_t>(
                           crc32(0L, raw.data(), static_cast<uInt>(raw.size())))});
    pack.insert(pack.end(), raw.begin(), raw.end());
  }

  // Negative offset encoding used by OFS_DELTA entries
  static bytes ofs_base(std::uint64_t back) {
    bytes out{static_cast<std::uint8_t>(back & 0x7F)};
    while (back >>= 7) {
      --back;
      out.insert(out.begin(), static_cast<std::uint8_t>(0x80 | (back & 0x7F)));
    }
    return out;
  }

  void finish(const fs::path &dir, const std::string &name) {
    pack[8] = 0;
    pack[9] = 0;
    pack[10] = 0;
    pack[11] = static_cast<std::uint8_t>(entries.size());
    const oid pack_sum = gitreplay::sha1(pack);
    pack.insert(pack.end(), pack_sum.begin(), pack_sum.end());

    std::ranges::sort(entries, [](const Entry &a, const Entry &b) { return a.id < b.id; });
    bytes idx;
    append(idx, gitreplay::consts::kPackIdxSignature);
    put32(idx, 2);
    for (int b = 0; b < 256; ++b) {
      put32(idx, static_cast<std::uint32_t>(std::ranges::count_if(
                     entries, [b](const Entry &e) { return e.id[0] <= b; })));
    }
    for (const auto &e : entries) idx.insert(idx.end(), e.id.begin(), e.id.end());
    for (const auto &e : entries) put32(idx, e.crc);
    for (const auto &e : entries) put32(idx, static_cast<std::uint32_t>(e.offset));
    idx.insert(idx.end(), pack_sum.begin(), pack_sum.end());
    const oid idx_sum = gitreplay::sha1(idx);
    idx.insert(idx.end(), idx_sum.begin(), idx_sum.end());

    gitreplay::fs::write_file_atomic(dir / (name + ".pack"), pack);
    gitreplay::fs::write_file_atomic(dir / (name + ".idx"), idx);
  }
};

int main() {
  testsupport::ScratchDir scratch{"gitreplay_pack"};
  const fs::path root = scratch.path;

  try {
    gitreplay::Repository repo{root};
    repo.init();

    const std::string base = "hello world\n";
    const std::string ofs_target = base + "again\n";
    const std::string ref_target = "HELLO world\n";
    const std::string chained = ofs_target + "!";

    PackBuilder pb;
    const auto base_at = pb.add(blob_id(base), gitreplay::consts::kPackBlob,
                                bytes(base.begin(), base.end()));

    // copy base[0..12) + insert "again\n"
    bytes d1;
    varint(d1, base.size());
    varint(d1, ofs_target.size());
    d1.insert(d1.end(), {0x90, 12, 6});
    append(d1, "again\n");
    const auto d1_at = pb.add(blob_id(ofs_target), gitreplay::consts::kPackOfsDelta, d1,
                              PackBuilder::ofs_base(pb.pack.size() - base_at));

    // insert "HELLO " + copy base[6..12), base named by id
    bytes d2;
    varint(d2, base.size());
    varint(d2, ref_target.size());
    d2.push_back(6);
    append(d2, "HELLO ");
    d2.insert(d2.end(), {0x91, 6, 6});
    const oid base_id = blob_id(base);
    pb.add(blob_id(ref_target), gitreplay::consts::kPackRefDelta, d2,
           bytes(base_id.begin(), base_id.end()));

    // delta on top of a delta
    bytes d3;
    varint(d3, ofs_target.size());
    varint(d3, chained.size());
    d3.insert(d3.end(), {0x90, static_cast<std::uint8_t>(ofs_target.size()), 1, '!'});
    pb.add(blob_id(chained), gitreplay::consts::kPackOfsDelta, d3,
           PackBuilder::ofs_base(pb.pack.size() - d1_at));

    const fs::path pack_dir = root / ".git/objects/pack";
    fs::create_directories(pack_dir);
    pb.finish(pack_dir, "pack-test");

    auto as_text = [](const std::vector<std::uint8_t> &v) { return std::string(v.begin(), v.end()); };
    for (const auto &want : {base, ofs_target, ref_target, chained}) {
      const auto hex = gitreplay::to_hex(blob_id(want));
      check(repo.objects().contains(hex), "contains " + hex);
      check(as_text(repo.read_blob(hex)) == want, "packed blob '" + want + "'");
    }

    // Writing an object the pack already holds yields the same id
    const auto again = repo.write_blob(gitreplay::fs::bytes_of(base));
    check(again == gitreplay::to_hex(base_id), "same id for packed content");
    check(as_text(repo.read_blob(again)) == base, "read after write");

    bool threw = false;
    try {
      (void)repo.read_blob(std::string(40, '0'));
    } catch (const gitreplay::ObjectError &) {
      threw = true;
    }
    check(threw, "missing object reported");

    // Reserved opcode 0 in a delta is refused
    threw = false;
    try {
      const bytes bad{12, 12, 0};
      (void)gitreplay::apply_delta(bytes(base.begin(), base.end()), bad);
    } catch (const gitreplay::ObjectError &) {
      threw = true;
    }
    check(threw, "opcode 0 rejected");

    // Size header that never terminates within 64 bits
    threw = false;
    try {
      bytes overlong(11, 0x80);
      overlong.push_back(0x01);
      (void)gitreplay::apply_delta(bytes(base.begin(), base.end()), overlong);
    } catch (const gitreplay::ObjectError &e) {
      threw = std::string(e.what()).find("too long") != std::string::npos;
    }
    check(threw, "overlong delta size rejected");

    // Same for the size in a pack entry header
    const fs::path corrupt_root = root / "corrupt";
    gitreplay::Repository corrupt{corrupt_root};
    corrupt.init();
    PackBuilder bad_pack;
    bytes raw{static_cast<std::uint8_t>(0x80 | (gitreplay::consts::kPackBlob << 4))};
    raw.insert(raw.end(), 12, 0x80);
    raw.push_back(0x01);
    const auto z = gitreplay::fs::z_compress(gitreplay::fs::bytes_of(base));
    raw.insert(raw.end(), z.begin(), z.end());
    const oid bad_id = blob_id("not really this\n");
    bad_pack.add_raw(bad_id, raw);
    const fs::path corrupt_pack_dir = corrupt_root / ".git/objects/pack";
    fs::create_directories(corrupt_pack_dir);
    bad_pack.finish(corrupt_pack_dir, "pack-corrupt");
    threw = false;
    try {
      (void)corrupt.read_blob(gitreplay::to_hex(bad_id));
    } catch (const gitreplay::ObjectError &e) {
      threw = std::string(e.what()).find("too long") != std::string::npos;
    }
    check(threw, "overlong entry size rejected");

    std::cout << "pack read OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
