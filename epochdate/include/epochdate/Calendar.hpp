#pragma once
#include <cstdint>

namespace epochdate {

struct CivilDate {
  int y=0, m=0, d=0;
};

bool operator==(const CivilDate& a, const CivilDate& b);

bool is_leap_year(int year);
int days_in_month(int year, int month); // 0 if month is not 1..12

// Proleptic Gregorian days since 1970-01-01.
// Month and day are normalized: 2021-13-01 is 2022-01-01, 2021-02-29 is 2021-03-01.
std::int64_t days_from_civil(int year, int month, int day);
CivilDate civil_from_days(std::int64_t days);

// floor division, correct for negative seconds
std::int64_t floor_div(std::int64_t a, std::int64_t b);

} // namespace epochdate
