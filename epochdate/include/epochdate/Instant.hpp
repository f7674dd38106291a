#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "epochdate/Error.hpp"

namespace epochdate {

class Zone;

// strftime layout of a full instant, e.g. 1970-01-01T00:00:00+0000
inline constexpr const char* kInstantISO = "%Y-%m-%dT%H:%M:%S%z";

// A point in time together with the UTC offset observed in its zone.
// The wall clock reading is seconds + offset.
struct Instant {
  std::int64_t seconds = 0;   // since 1970-01-01T00:00:00Z
  int offset = 0;             // seconds east of UTC
};

// Same absolute instant, whatever the offsets.
bool operator==(const Instant& a, const Instant& b);

Instant instant_at(std::int64_t seconds, const Zone& zone);

// The instant whose wall clock in `zone` reads y-m-d hh:mm:ss.
Instant wall_clock(int y, int m, int d, int hh, int mm, int ss, const Zone& zone);

Instant now(const Zone& zone);

// strftime-style. %z renders the instant's own offset, %Z renders
// "UTC" at offset 0 and the offset (-0500, +0530) otherwise.
std::string format_instant(const Instant& t, std::string_view layout);

// strptime-style. Text without %z is read as UTC.
// Error::Parse on mismatch, trailing text or an impossible calendar field.
// Whitespace in the text must be matched by whitespace in the layout, and
// numeric fields take their full width (%Y 4 digits, %m 2, ...) unless the
// layout asks for the unpadded form (%-m).
Error parse_instant(std::string_view layout, std::string_view text, Instant& out);

} // namespace epochdate
