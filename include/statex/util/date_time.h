#ifndef STATEX_DATE_TIME_H
#define STATEX_DATE_TIME_H

#include <chrono>

namespace statex {
    using value_clock = std::chrono::system_clock;
    // Microsecond precision, the same resolution the value layer formats and compares at
    using date_time_t = std::chrono::time_point<value_clock, std::chrono::microseconds>;
    using time_delta_t = std::chrono::microseconds;
    using date_t = std::chrono::year_month_day;

    constexpr date_time_t min_date_time() noexcept { return date_time_t{}; }

    inline date_time_t now() {
        return std::chrono::time_point_cast<std::chrono::microseconds>(value_clock::now());
    }

    inline date_time_t make_date_time(date_t date, time_delta_t time_of_day = time_delta_t{0}) {
        return date_time_t{std::chrono::sys_days{date}.time_since_epoch()} + time_of_day;
    }
} // namespace statex
#endif  // STATEX_DATE_TIME_H
