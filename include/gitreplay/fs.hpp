#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace gitreplay::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// View a string's bytes without copying.
inline std::span<const std::uint8_t> bytes_of(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// Inflate one zlib stream that starts at the front of `data` and may be
// followed by unrelated bytes (pack entries). `expected_size` is the inflated
// length announced by the caller; a mismatch throws.
std::vector<std::uint8_t> z_inflate_prefix(std::span<const std::uint8_t> data,
                                           std::size_t expected_size);

} // namespace gitreplay::fs
