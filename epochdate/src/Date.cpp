#include "epochdate/Date.hpp"
#include "epochdate/Zone.hpp"

#include <iostream>
#include <ostream>

namespace epochdate {

bool unix_in_range(std::int64_t seconds) {
  return seconds >= 0 && seconds <= kMaxUnix;
}

Error from_unix(std::int64_t seconds, Date& out) {
  if (!unix_in_range(seconds)) return Error::OutOfRange;
  out = Date(static_cast<std::uint16_t>(seconds / kSecondsPerDay));
  return Error::None;
}

Error from_calendar_date(int year, int month, int day, Date& out) {
  return from_unix(days_from_civil(year, month, day) * kSecondsPerDay, out);
}

Error from_instant(const Instant& t, Date& out) {
  return from_unix(t.seconds + t.offset, out);
}

Error parse(std::string_view layout, std::string_view text, Date& out) {
  Instant t;
  if (Error e = parse_instant(layout, text, t); e != Error::None) return e;
  return from_instant(t, out);
}

Error today_checked(std::int64_t nowSeconds, const Zone& zone, Date& out) {
  return from_instant(instant_at(nowSeconds, zone), out);
}

Error today_checked(Date& out) {
  return today_checked(now(local()).seconds, local(), out);
}

Date today(std::int64_t nowSeconds, const Zone& zone) {
  Date d;
  if (today_checked(nowSeconds, zone, d) != Error::None) {
#ifndef EPOCHDATE_QUIET
    std::cerr << "[epochdate] current date in " << zone.name()
              << " is past 2149-06-06, using 1970-01-01\n";
#endif
    return Date{};
  }
  return d;
}

Date today() {
  return today(now(local()).seconds, local());
}

Date today_utc() {
  return today(now(utc()).seconds, utc());
}

Instant to_utc(Date d) {
  return Instant{to_unix(d), 0};
}

// Midnight of d on the zone's wall clock, not the UTC midnight seen from the zone.
Instant to_zone(Date d, const Zone& zone) {
  const std::int64_t t = to_unix(d);
  return instant_at(t - zone.offsetAt(t), zone);
}

Instant to_local(Date d) {
  return to_zone(d, local());
}

CivilDate calendar_parts(Date d) {
  return civil_from_days(d.days());
}

std::int64_t to_unix(Date d) {
  return static_cast<std::int64_t>(d.days()) * kSecondsPerDay;
}

std::int64_t to_unix_nanos(Date d) {
  return to_unix(d) * 1000000000LL;
}

std::string format(Date d, std::string_view layout) {
  return format_instant(to_utc(d), layout);
}

std::string to_string(Date d) {
  return format(d, kRFC3339);
}

std::ostream& operator<<(std::ostream& os, Date d) {
  return os << to_string(d);
}

Date add_days(Date d, int delta) {
  return Date(static_cast<std::uint16_t>(d.days() + delta));
}

int days_between_inclusive(Date start, Date end) {
  if (end < start) return 0;
  return end.days() - start.days() + 1;
}

} // namespace epochdate
