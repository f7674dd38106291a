#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "epochdate/Calendar.hpp"
#include "epochdate/Error.hpp"
#include "epochdate/Instant.hpp"

namespace epochdate {

class Zone;

inline constexpr std::int64_t kSecondsPerDay = 60 * 60 * 24;
inline constexpr std::int64_t kMaxUnix = (std::int64_t(1) << 16) * kSecondsPerDay - 1;

inline constexpr const char* kRFC3339 = "%Y-%m-%d";
inline constexpr const char* kAmericanShort = "%-m-%-d-%y";

// Days since 1970-01-01, 1970-01-01 through 2149-06-06 in 2 bytes.
// Built from an instant, the date kept is the one on the instant's own wall clock.
class Date {
public:
    constexpr Date() = default;
    constexpr explicit Date(std::uint16_t days) : days_(days) {}

    constexpr std::uint16_t days() const { return days_; }

private:
    std::uint16_t days_ = 0;
};

constexpr bool operator==(Date a, Date b) { return a.days() == b.days(); }
constexpr bool operator!=(Date a, Date b) { return a.days() != b.days(); }
constexpr bool operator<(Date a, Date b) { return a.days() < b.days(); }

bool unix_in_range(std::int64_t seconds);

// Construction. On error `out` is left untouched.
Error from_unix(std::int64_t seconds, Date& out);
Error from_calendar_date(int year, int month, int day, Date& out);
Error from_instant(const Instant& t, Date& out);
Error parse(std::string_view layout, std::string_view text, Date& out);

// Current date in the given zone; 1970-01-01 once past 2149-06-06.
Date today(std::int64_t nowSeconds, const Zone& zone);
Date today();       // local zone
Date today_utc();
// Same as today() but reports Error::OutOfRange instead of substituting.
Error today_checked(std::int64_t nowSeconds, const Zone& zone, Date& out);
Error today_checked(Date& out);

// Conversions. Each returns midnight of the date.
Instant to_utc(Date d);
Instant to_zone(Date d, const Zone& zone);
Instant to_local(Date d);

CivilDate calendar_parts(Date d);
std::int64_t to_unix(Date d);
std::int64_t to_unix_nanos(Date d);

std::string format(Date d, std::string_view layout);
std::string to_string(Date d); // YYYY-MM-DD
std::ostream& operator<<(std::ostream& os, Date d);

// Wraps around the 16-bit range.
Date add_days(Date d, int delta);
int days_between_inclusive(Date start, Date end); // start..end, 0 if end < start

} // namespace epochdate
