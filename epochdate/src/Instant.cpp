#include "epochdate/Instant.hpp"
#include "epochdate/Calendar.hpp"
#include "epochdate/Zone.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>

namespace epochdate {

static constexpr std::int64_t kDay = 24 * 3600;

// UTC, else the offset itself: -0500, +0530
static std::string zone_abbrev(int offset) {
  if (offset == 0) return "UTC";
  const char sign = offset < 0 ? '-' : '+';
  const int mag = offset < 0 ? -offset : offset;
  char buf[16];
  if (mag % 60)
    std::snprintf(buf, sizeof(buf), "%c%02d%02d%02d", sign, mag / 3600, mag / 60 % 60, mag % 60);
  else
    std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, mag / 3600, mag / 60 % 60);
  return buf;
}

// `zone` must outlive every use of the returned tm
static std::tm to_tm(const Instant& t, const std::string& zone) {
  const std::int64_t wall = t.seconds + t.offset;
  const std::int64_t days = floor_div(wall, kDay);
  const std::int64_t sod = wall - days * kDay;
  const CivilDate c = civil_from_days(days);

  std::tm out{};
  out.tm_year = c.y - 1900;
  out.tm_mon  = c.m - 1;
  out.tm_mday = c.d;
  out.tm_hour = static_cast<int>(sod / 3600);
  out.tm_min  = static_cast<int>(sod / 60 % 60);
  out.tm_sec  = static_cast<int>(sod % 60);
  out.tm_wday = static_cast<int>(((days % 7) + 11) % 7); // 1970-01-01 was a Thursday
  out.tm_yday = static_cast<int>(days - days_from_civil(c.y, 1, 1));
  out.tm_isdst = 0;
  out.tm_gmtoff = t.offset;
  out.tm_zone = zone.c_str();
  return out;
}

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// %F, %T, %D and %R spelled out, so that their inner fields get checked too
static std::string expand_layout(std::string_view layout) {
  std::string out;
  for (std::size_t i = 0; i < layout.size(); ++i) {
    if (layout[i] == '%' && i + 1 < layout.size()) {
      switch (layout[i + 1]) {
        case 'F': out += "%Y-%m-%d"; ++i; continue;
        case 'T': out += "%H:%M:%S"; ++i; continue;
        case 'D': out += "%m/%d/%y"; ++i; continue;
        case 'R': out += "%H:%M"; ++i; continue;
        case '%': out += "%%"; ++i; continue;
      }
    }
    out += layout[i];
  }
  return out;
}

// Digits a numeric field takes when it is written without the '-' flag.
static int field_width(char conv) {
  switch (conv) {
    case 'Y': return 4;
    case 'j': return 3;
    case 'm': case 'd': case 'H': case 'M': case 'S':
    case 'y': case 'I': case 'C': return 2;
  }
  return 0;
}

// strptime skips blanks before numbers and reads short fields;
// check each field of `text` against the layout first.
static bool matches_layout(const std::string& layout, const char* p) {
  for (std::size_t i = 0; i < layout.size(); ++i) {
    const char c = layout[i];
    if (c != '%') {
      if (is_space(c)) {
        while (is_space(*p)) ++p;
      } else if (*p++ != c) {
        return false;
      }
      continue;
    }

    const std::size_t start = i++;
    bool padded = true;
    while (i < layout.size() && std::string("-_0^#").find(layout[i]) != std::string::npos) {
      if (layout[i] == '-') padded = false;
      ++i;
    }
    if (i < layout.size() && (layout[i] == 'E' || layout[i] == 'O')) ++i;
    if (i >= layout.size()) return false;
    const char conv = layout[i];

    if (conv == 'n' || conv == 't') {
      while (is_space(*p)) ++p;
      continue;
    }
    if (is_space(*p)) return false;

    const int width = padded ? field_width(conv) : 0;
    for (int k = 0; k < width; ++k)
      if (!std::isdigit(static_cast<unsigned char>(p[k]))) return false;

    std::tm scratch{};
    const std::string directive = layout.substr(start, i - start + 1);
    const char* q = ::strptime(p, directive.c_str(), &scratch);
    if (!q || (width && q - p != width)) return false;
    p = q;
  }
  return *p == '\0';
}

bool operator==(const Instant& a, const Instant& b) {
  return a.seconds == b.seconds;
}

Instant instant_at(std::int64_t seconds, const Zone& zone) {
  return Instant{seconds, zone.offsetAt(seconds)};
}

Instant wall_clock(int y, int m, int d, int hh, int mm, int ss, const Zone& zone) {
  const std::int64_t wall = days_from_civil(y, m, d) * kDay
    + static_cast<std::int64_t>(hh) * 3600 + mm * 60 + ss;
  // 2 passes: the offset at the wall reading approximates the one at the instant
  const int guess = zone.offsetAt(wall);
  const int offset = zone.offsetAt(wall - guess);
  return instant_at(wall - offset, zone);
}

Instant now(const Zone& zone) {
  using namespace std::chrono;
  const auto s = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  return instant_at(static_cast<std::int64_t>(s), zone);
}

std::string format_instant(const Instant& t, std::string_view layout) {
  if (layout.empty()) return "";
  const std::string zone = zone_abbrev(t.offset);
  const std::tm tm = to_tm(t, zone);
  const std::string fmt(layout);

  // strftime reports 0 both for "too small" and for an empty result
  for (std::size_t size = 64; size <= 64 * 1024; size *= 4) {
    std::vector<char> buf(size);
    const std::size_t n = std::strftime(buf.data(), buf.size(), fmt.c_str(), &tm);
    if (n > 0) return std::string(buf.data(), n);
  }
  return "";
}

Error parse_instant(std::string_view layout, std::string_view text, Instant& out) {
  const std::string fmt = expand_layout(layout);
  const std::string s(text);
  if (!matches_layout(fmt, s.c_str())) return Error::Parse;

  std::tm tm{};
  tm.tm_year = -1900;   // fields missing from the layout: 0000-01-01T00:00:00Z
  tm.tm_mday = 1;

  const char* end = ::strptime(s.c_str(), fmt.c_str(), &tm);
  if (!end || *end != '\0') return Error::Parse;

  const int year = tm.tm_year + 1900;
  const int month = tm.tm_mon + 1;
  if (tm.tm_mday < 1 || tm.tm_mday > days_in_month(year, month)) return Error::Parse;
  if (tm.tm_hour < 0 || tm.tm_hour > 23) return Error::Parse;
  if (tm.tm_min < 0 || tm.tm_min > 59) return Error::Parse;
  if (tm.tm_sec < 0 || tm.tm_sec > 59) return Error::Parse;

  const int offset = static_cast<int>(tm.tm_gmtoff);  // set by %z only
  const std::int64_t wall = days_from_civil(year, month, tm.tm_mday) * kDay
    + static_cast<std::int64_t>(tm.tm_hour) * 3600 + tm.tm_min * 60 + tm.tm_sec;

  out = Instant{wall - offset, offset};
  return Error::None;
}

} // namespace epochdate
