#include "gitreplay/config.hpp"

#include "gitreplay/errors.hpp"
#include "gitreplay/fs.hpp"

#include <cstdint>
#include <sstream>
#include <vector>

namespace {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace

namespace gitreplay {

MissingParentPolicy parse_missing_policy(std::string_view text) {
  if (text == "fail")
    return MissingParentPolicy::Fail;
  if (text == "drop")
    return MissingParentPolicy::Drop;
  throw ConfigError("missing_parents must be 'fail' or 'drop', got '" + std::string(text) + "'");
}

std::string_view missing_policy_name(MissingParentPolicy policy) {
  return policy == MissingParentPolicy::Drop ? "drop" : "fail";
}

auto load_settings(const std::filesystem::path &path) -> Settings {
  Settings out{};
  if (!fs::exists(path))
    return out;

  std::vector<std::uint8_t> bytes;
  try {
    bytes = fs::read_file(path);
  } catch (const std::exception &e) {
    throw ConfigError("cannot read " + path.string() + ": " + e.what());
  }
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#')
      continue; // allow comments

    const auto where = path.string() + ":" + std::to_string(lineno);
    const auto colon = stripped.find(':');
    if (colon == std::string::npos)
      throw ConfigError(where + ": expected 'key: value'");
    const std::string key = trim(std::string_view(stripped).substr(0, colon));
    const std::string value = trim(std::string_view(stripped).substr(colon + 1));
    if (value.empty())
      throw ConfigError(where + ": empty value for '" + key + "'");

    if (key == "branch") {
      out.branch = value;
    } else if (key == "export_dir") {
      out.export_dir = value;
    } else if (key == "manifest_file") {
      out.manifest_file = value;
    } else if (key == "meta_file") {
      out.meta_file = value;
    } else if (key == "missing_parents") {
      out.missing_parents = parse_missing_policy(value);
    } else {
      throw ConfigError(where + ": unknown key '" + key + "'");
    }
  }
  return out;
}

} // namespace gitreplay
