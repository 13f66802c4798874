#pragma once
#include <string>
#include <string_view>

namespace gitreplay {

// Validate 40-char lowercase hex
auto looks_hex40(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip trailing ASCII whitespace (space, \t, \n, \v, \f, \r)
  auto rstrip_whitespace(std::string_view str) -> std::string;

  // Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF
  auto is_valid_utf8(std::string_view str) -> bool;

  // Copy of `str` with every invalid UTF-8 sequence replaced by U+FFFD
  auto sanitize_utf8(std::string_view str) -> std::string;
}

}
