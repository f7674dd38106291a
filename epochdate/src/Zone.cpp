#include "epochdate/Zone.hpp"

#include <cstdlib>
#include <ctime>
#include <mutex>
#include <optional>
#include <utility>

namespace epochdate {

namespace {

// tzset()/localtime_r() read process-wide state
std::mutex& tz_mutex() {
    static std::mutex m;
    return m;
}

// Sets TZ for the lifetime of the guard and restores the previous value.
class TzGuard {
public:
    explicit TzGuard(const std::string& tz) : lock_(tz_mutex()) {
        if (const char* old = std::getenv("TZ")) oldTz_ = old;
        ::setenv("TZ", tz.c_str(), 1);
        ::tzset();
    }
    ~TzGuard() {
        if (oldTz_) ::setenv("TZ", oldTz_->c_str(), 1);
        else ::unsetenv("TZ");
        ::tzset();
    }

    TzGuard(const TzGuard&) = delete;
    TzGuard& operator=(const TzGuard&) = delete;

private:
    std::lock_guard<std::mutex> lock_;
    std::optional<std::string> oldTz_;
};

// caller holds tz_mutex(); 0 if the libc cannot represent the instant
int libc_offset(std::int64_t unixSeconds) {
    const std::time_t t = static_cast<std::time_t>(unixSeconds);
    std::tm out{};
    if (!localtime_r(&t, &out)) return 0;
    return static_cast<int>(out.tm_gmtoff);
}

class LocalZone : public Zone {
public:
    int offsetAt(std::int64_t unixSeconds) const override {
        std::lock_guard<std::mutex> lock(tz_mutex());
        ::tzset();
        return libc_offset(unixSeconds);
    }
    std::string name() const override { return "Local"; }
};

} // namespace

FixedZone::FixedZone(std::string name, int offsetSeconds)
    : name_(std::move(name)), offset_(offsetSeconds) {}

TzZone::TzZone(std::string tz) : tz_(std::move(tz)) {}

int TzZone::offsetAt(std::int64_t unixSeconds) const {
    TzGuard guard(tz_);
    return libc_offset(unixSeconds);
}

const Zone& utc() {
    static const FixedZone zone("UTC", 0);
    return zone;
}

const Zone& local() {
    static const LocalZone zone;
    return zone;
}

} // namespace epochdate
