#include "place_discovery/opening_hours.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace place_discovery {

namespace {
constexpr long long k_minutes_per_day{24 * 60};
constexpr long long k_minutes_per_week{7 * k_minutes_per_day};
// 1970-01-01 was a Thursday; shifting by three days puts Monday at zero.
constexpr long long k_epoch_monday_offset_minutes{3 * k_minutes_per_day};

long long positive_modulo(long long value, long long modulus) {
    const long long remainder = value % modulus;
    return remainder < 0 ? remainder + modulus : remainder;
}

long long local_minutes_since_epoch(WallTime at, std::chrono::minutes utc_offset) {
    const auto minutes = std::chrono::floor<std::chrono::minutes>(at.time_since_epoch());
    return minutes.count() + utc_offset.count();
}

long long minute_of_week(long long local_minutes) {
    return positive_modulo(local_minutes + k_epoch_monday_offset_minutes, k_minutes_per_week);
}

long long interval_start(const OpeningInterval& interval) {
    return static_cast<long long>(interval.day) * k_minutes_per_day + interval.open_minute;
}

long long interval_length(const OpeningInterval& interval) {
    if (interval.close_minute > interval.open_minute) {
        return interval.close_minute - interval.open_minute;
    }
    return k_minutes_per_day - interval.open_minute + interval.close_minute;
}
}  // namespace

OpeningHours::OpeningHours(std::vector<OpeningInterval> intervals, std::chrono::minutes utc_offset)
    : list_intervals_(std::move(intervals)),
      utc_offset_(utc_offset) {
    for (const OpeningInterval& interval : list_intervals_) {
        if (interval.open_minute < 0 || interval.open_minute >= k_minutes_per_day
            || interval.close_minute < 0 || interval.close_minute > k_minutes_per_day) {
            throw std::invalid_argument(
                "Opening interval out of range: open=" + std::to_string(interval.open_minute)
                + " close=" + std::to_string(interval.close_minute)
            );
        }
    }
}

const std::vector<OpeningInterval>& OpeningHours::intervals() const noexcept {
    return list_intervals_;
}

std::chrono::minutes OpeningHours::utc_offset() const noexcept {
    return utc_offset_;
}

bool OpeningHours::is_open_at(WallTime at) const {
    const long long now_of_week = minute_of_week(local_minutes_since_epoch(at, utc_offset_));
    for (const OpeningInterval& interval : list_intervals_) {
        const long long elapsed = positive_modulo(now_of_week - interval_start(interval), k_minutes_per_week);
        if (elapsed < interval_length(interval)) {
            return true;
        }
    }
    return false;
}

std::optional<WallTime> OpeningHours::next_opening_time(WallTime at) const {
    const long long local_minutes = local_minutes_since_epoch(at, utc_offset_);
    const long long now_of_week = minute_of_week(local_minutes);
    const long long lookahead_minutes = std::chrono::duration_cast<std::chrono::minutes>(k_opening_lookahead).count();

    std::optional<long long> best_wait;
    for (const OpeningInterval& interval : list_intervals_) {
        long long wait = positive_modulo(interval_start(interval) - now_of_week, k_minutes_per_week);
        if (wait == 0) {
            wait = k_minutes_per_week;
        }
        if (wait > lookahead_minutes) {
            continue;
        }
        if (!best_wait.has_value() || wait < *best_wait) {
            best_wait = wait;
        }
    }

    if (!best_wait.has_value()) {
        return std::nullopt;
    }
    const auto floored = std::chrono::floor<std::chrono::minutes>(at);
    return WallTime{floored + std::chrono::minutes{*best_wait}};
}

}  // namespace place_discovery
