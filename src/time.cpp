#include "gitreplay/time.hpp"

#include "gitreplay/consts.hpp"
#include "gitreplay/errors.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>

namespace chr = std::chrono;

namespace gitreplay::timeutil {

namespace {

constexpr chr::sys_seconds kMinInstant{
    chr::sys_days{chr::year{0} / chr::January / 1}};
constexpr chr::sys_seconds kMaxInstant{
    chr::sys_days{chr::year{10000} / chr::January / 1} - chr::seconds{1}};

bool in_calendar_range(std::int64_t seconds) {
  return seconds >= kMinInstant.time_since_epoch().count() &&
         seconds <= kMaxInstant.time_since_epoch().count();
}

// Parse exactly `width` decimal digits at text[pos].
int digits(std::string_view text, std::size_t pos, std::size_t width, std::string_view what) {
  if (pos + width > text.size()) {
    throw InvalidTimestamp("timestamp too short: missing " + std::string(what));
  }
  int value = 0;
  const char *first = text.data() + pos;
  const auto [ptr, ec] = std::from_chars(first, first + width, value);
  if (ec != std::errc{} || ptr != first + width || *first == '-' || *first == '+') {
    throw InvalidTimestamp("bad " + std::string(what) + " in timestamp: " + std::string(text));
  }
  return value;
}

void expect(std::string_view text, std::size_t pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    throw InvalidTimestamp("malformed timestamp: " + std::string(text));
  }
}

} // namespace

EngineTime to_engine_time(const ZonedTime &zt) {
  return EngineTime{.seconds = zt.instant.time_since_epoch().count(),
                    .offset_minutes = static_cast<int>(zt.offset.count())};
}

ZonedTime from_engine_time(const EngineTime &et) {
  if (std::abs(et.offset_minutes) > consts::kMaxOffsetMinutes) {
    throw InvalidTimestamp("invalid timezone offset: " + std::to_string(et.offset_minutes) +
                           " minutes");
  }
  if (!in_calendar_range(et.seconds) ||
      !in_calendar_range(et.seconds + static_cast<std::int64_t>(et.offset_minutes) * 60)) {
    throw InvalidTimestamp("commit timestamp out of range: " + std::to_string(et.seconds));
  }
  return ZonedTime{.instant = chr::sys_seconds{chr::seconds{et.seconds}},
                   .offset = chr::minutes{et.offset_minutes}};
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, (m / 60) % 100, m % 60);
  return std::string(buf);
}

int parse_tz_offset(std::string_view text) {
  if (text.size() != 5 || (text[0] != '+' && text[0] != '-')) {
    throw InvalidTimestamp("malformed timezone offset: " + std::string(text));
  }
  const int hh = digits(text, 1, 2, "offset hours");
  const int mm = digits(text, 3, 2, "offset minutes");
  if (mm >= 60) {
    throw InvalidTimestamp("malformed timezone offset: " + std::string(text));
  }
  const int total = hh * 60 + mm;
  return text[0] == '-' ? -total : total;
}

std::string format_iso8601(const ZonedTime &zt) {
  const auto local = zt.instant + zt.offset;
  const auto day = chr::floor<chr::days>(local);
  const chr::year_month_day ymd{day};
  const chr::hh_mm_ss hms{local - day};

  const int off = static_cast<int>(zt.offset.count());
  const int abs_off = off >= 0 ? off : -off;

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d%c%02d:%02d",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()),
                off >= 0 ? '+' : '-', abs_off / 60, abs_off % 60);
  return std::string(buf);
}

ZonedTime parse_iso8601(std::string_view text) {
  // YYYY-MM-DDTHH:MM:SS then Z or ±HH:MM
  const int y = digits(text, 0, 4, "year");
  expect(text, 4, '-');
  const int mo = digits(text, 5, 2, "month");
  expect(text, 7, '-');
  const int d = digits(text, 8, 2, "day");
  expect(text, 10, 'T');
  const int h = digits(text, 11, 2, "hour");
  expect(text, 13, ':');
  const int mi = digits(text, 14, 2, "minute");
  expect(text, 16, ':');
  const int s = digits(text, 17, 2, "second");

  int offset = 0;
  const std::string_view tail = text.substr(std::min<std::size_t>(19, text.size()));
  if (tail == "Z") {
    offset = 0;
  } else if (tail.size() == 6 && (tail[0] == '+' || tail[0] == '-') && tail[3] == ':') {
    const int oh = digits(tail, 1, 2, "offset hours");
    const int om = digits(tail, 4, 2, "offset minutes");
    if (om >= 60) {
      throw InvalidTimestamp("invalid timezone offset in: " + std::string(text));
    }
    offset = (tail[0] == '-' ? -1 : 1) * (oh * 60 + om);
  } else {
    throw InvalidTimestamp("missing or malformed offset in: " + std::string(text));
  }

  const chr::year_month_day ymd{chr::year{y}, chr::month{static_cast<unsigned>(mo)},
                                chr::day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
    throw InvalidTimestamp("no such calendar time: " + std::string(text));
  }

  const auto local = chr::sys_seconds{chr::sys_days{ymd}} + chr::hours{h} + chr::minutes{mi} +
                     chr::seconds{s};
  const auto instant = local - chr::minutes{offset};
  return from_engine_time(
      EngineTime{.seconds = instant.time_since_epoch().count(), .offset_minutes = offset});
}

} // namespace gitreplay::timeutil
