#pragma once
#include "gitreplay/time.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gitreplay {

// Author or committer identity as stored in a commit header.
struct Signature {
  std::string name;
  std::string email;
  timeutil::EngineTime when;
};

// Build "Name <email> 1714412345 +0300"
auto format_signature(const Signature& sig) -> std::string;

// Parse the text after "author " / "committer ". Returns std::nullopt when the
// line has no "<email>" part or no "<seconds> <+HHMM>" trailer.
auto parse_signature(std::string_view line) -> std::optional<Signature>;

// Only the trailing "<seconds> <+HHMM>" of a signature line, for lines whose
// identity part is damaged.
auto parse_signature_time(std::string_view line) -> std::optional<timeutil::EngineTime>;

// Reason a name/email cannot be written into a commit, or empty if it can.
auto identity_problem(std::string_view name, std::string_view email) -> std::string;

} // namespace gitreplay
