#include "gitreplay/fs.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace gitreplay::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.parent_path().empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    throw std::runtime_error("not a regular file: " + p.string());
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0) {
    throw std::runtime_error("size query failed: " + p.string());
  }
  const auto n = static_cast<std::size_t>(end);
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n && !ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n))) {
    throw std::runtime_error("short read: " + p.string());
  }
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::size_t cap = std::max<std::size_t>(data.size() * 3, 64);
  for (int i = 0; i < 16; ++i) {
    std::vector<std::uint8_t> out(cap);
    auto dest_len = static_cast<uLongf>(out.size());
    const int rc = uncompress(out.data(), &dest_len, reinterpret_cast<const Bytef *>(data.data()),
                              static_cast<uLong>(data.size()));
    if (rc == Z_OK) {
      out.resize(dest_len);
      return out;
    }
    if (rc == Z_BUF_ERROR) {
      cap *= 2;
      continue;
    }
    throw std::runtime_error("zlib uncompress failed");
  }
  throw std::runtime_error("zlib uncompress overflow");
}

std::vector<std::uint8_t> z_inflate_prefix(std::span<const std::uint8_t> data,
                                           std::size_t expected_size) {
  std::vector<std::uint8_t> out(expected_size);
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) {
    throw std::runtime_error("zlib inflateInit failed");
  }
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  // One spare byte so an oversized stream is detected instead of truncated.
  std::uint8_t spare = 0;
  zs.next_out = expected_size ? out.data() : &spare;
  zs.avail_out = expected_size ? static_cast<uInt>(expected_size) : 1U;

  int rc = inflate(&zs, Z_FINISH);
  if (rc == Z_BUF_ERROR && zs.avail_out == 0 && expected_size) {
    zs.next_out = &spare;
    zs.avail_out = 1;
    rc = inflate(&zs, Z_FINISH);
  }
  const auto produced = static_cast<std::size_t>(zs.total_out);
  inflateEnd(&zs);

  if (rc != Z_STREAM_END) {
    throw std::runtime_error("zlib inflate failed (rc=" + std::to_string(rc) + ")");
  }
  if (produced != expected_size) {
    throw std::runtime_error("zlib inflate size mismatch: expected " +
                             std::to_string(expected_size) + ", got " + std::to_string(produced));
  }
  return out;
}

} // namespace gitreplay::fs
