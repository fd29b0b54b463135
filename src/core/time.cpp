#include "blobfeed/core/time.hpp"

#include <cstdio>

namespace blobfeed::core {

namespace {

auto digits(std::string_view s, std::size_t pos, std::size_t n, int& out) -> bool {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

auto bad(std::string_view text) -> std::unexpected<error> {
  return std::unexpected(error{error_code::invalid_argument,
                               "malformed timestamp \"" + std::string(text) + "\"", "core.time"});
}

} // namespace

auto parse_timestamp(std::string_view s) -> std::expected<timestamp, error> {
  using namespace std::chrono;
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
  if (!digits(s, 0, 4, y) || s.size() < 19 || s[4] != '-' || !digits(s, 5, 2, mo) || s[7] != '-' ||
      !digits(s, 8, 2, d) || (s[10] != 'T' && s[10] != 't') || !digits(s, 11, 2, h) || s[13] != ':' ||
      !digits(s, 14, 2, mi) || s[16] != ':' || !digits(s, 17, 2, sec)) {
    return bad(s);
  }
  std::size_t pos = 19;
  std::int64_t frac_ns = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    std::size_t n = 0;
    std::int64_t scale = 100'000'000;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (n == 9) return bad(s);
      frac_ns += (s[pos] - '0') * scale;
      scale /= 10;
      ++pos; ++n;
    }
    if (n == 0) return bad(s);
  }
  const auto zone = s.substr(pos);
  if (zone != "Z" && zone != "z" && zone != "+00:00") return bad(s);

  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || sec > 60) return bad(s);
  return timestamp{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{sec} + nanoseconds{frac_ns};
}

auto format_timestamp(timestamp t) -> std::string {
  using namespace std::chrono;
  const auto day_point = floor<days>(t);
  const year_month_day ymd{day_point};
  const hh_mm_ss<nanoseconds> tod{t - day_point};
  const auto ticks = tod.subseconds().count() / 100; // 100 ns resolution
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%07lldZ",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                static_cast<int>(tod.minutes().count()), static_cast<int>(tod.seconds().count()),
                static_cast<long long>(ticks));
  return buf;
}

} // namespace blobfeed::core
