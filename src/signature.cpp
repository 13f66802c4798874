#include "gitreplay/signature.hpp"

#include "gitreplay/errors.hpp"

#include <charconv>
#include <cstdint>

namespace gitreplay {

static std::string_view trim_spaces(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t'))
    sv.remove_suffix(1);
  return sv;
}

std::string format_signature(const Signature &sig) {
  return sig.name + " <" + sig.email + "> " + std::to_string(sig.when.seconds) + " " +
         timeutil::tz_offset_string(sig.when.offset_minutes);
}

std::optional<timeutil::EngineTime> parse_signature_time(std::string_view line) {
  // "... <seconds> <tz>": the last two space-separated fields
  const std::string_view rest = trim_spaces(line);
  const auto tz_sp = rest.rfind(' ');
  if (tz_sp == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view tz = rest.substr(tz_sp + 1);
  const std::string_view head = trim_spaces(rest.substr(0, tz_sp));
  const auto secs_sp = head.rfind(' ');
  const std::string_view secs =
      secs_sp == std::string_view::npos ? head : head.substr(secs_sp + 1);

  std::int64_t seconds = 0;
  const auto [ptr, ec] = std::from_chars(secs.data(), secs.data() + secs.size(), seconds);
  if (secs.empty() || ec != std::errc{} || ptr != secs.data() + secs.size()) {
    return std::nullopt;
  }
  try {
    return timeutil::EngineTime{.seconds = seconds,
                                .offset_minutes = timeutil::parse_tz_offset(tz)};
  } catch (const InvalidTimestamp &) {
    return std::nullopt;
  }
}

std::optional<Signature> parse_signature(std::string_view line) {
  const auto lt = line.find('<');
  if (lt == std::string_view::npos) {
    return std::nullopt;
  }
  const auto gt = line.find('>', lt + 1);
  if (gt == std::string_view::npos) {
    return std::nullopt;
  }
  const auto when = parse_signature_time(line.substr(line.rfind('>') + 1));
  if (!when) {
    return std::nullopt;
  }

  Signature sig;
  sig.name = std::string(trim_spaces(line.substr(0, lt)));
  sig.email = std::string(line.substr(lt + 1, gt - lt - 1));
  sig.when = *when;
  return sig;
}

std::string identity_problem(std::string_view name, std::string_view email) {
  for (const auto part : {name, email}) {
    if (part.find_first_of("<>\n") != std::string_view::npos) {
      return "identity may not contain '<', '>' or newlines: " + std::string(part);
    }
  }
  if (trim_spaces(name).empty() || trim_spaces(email).empty()) {
    return "identity needs a non-empty name and email";
  }
  return {};
}

} // namespace gitreplay
