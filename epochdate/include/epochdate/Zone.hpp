#pragma once
#include <cstdint>
#include <string>

namespace epochdate {

// A timezone: the UTC offset (seconds east) in effect at a given instant.
class Zone {
public:
    virtual ~Zone() = default;

    virtual int offsetAt(std::int64_t unixSeconds) const = 0;
    virtual std::string name() const = 0;
};

class FixedZone : public Zone {
public:
    FixedZone(std::string name, int offsetSeconds);

    int offsetAt(std::int64_t) const override { return offset_; }
    std::string name() const override { return name_; }

private:
    std::string name_;
    int offset_;
};

// Any TZ value understood by tzset(): a tzdb name ("Europe/Paris")
// or a POSIX rule ("EST5EDT,M3.2.0,M11.1.0").
// Each lookup swaps the process TZ variable under a global lock.
class TzZone : public Zone {
public:
    explicit TzZone(std::string tz);

    int offsetAt(std::int64_t unixSeconds) const override;
    std::string name() const override { return tz_; }

private:
    std::string tz_;
};

const Zone& utc();
const Zone& local(); // process zone, follows TZ / /etc/localtime

} // namespace epochdate
