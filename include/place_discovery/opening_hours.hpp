// === Opening Hours ===========================================================
//
// Weekly business-hours schedule attached to a place. Answers the two queries
// the filter engine needs: whether the place is open at a given instant and
// when it next opens within the look-ahead window.

#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "place_discovery/types.hpp"

namespace place_discovery {

/** @brief Day of week, Monday first, matching ISO 8601 ordering. */
enum class Weekday {
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday
};

/**
 * @brief A single open period starting on @p day.
 *
 * Minutes are counted from local midnight. When @p close_minute is not after
 * @p open_minute the period wraps past midnight into the following day.
 */
struct OpeningInterval final {
    Weekday day{Weekday::Monday};
    int open_minute{};   /**< Opening time in minutes after midnight [0, 1440). */
    int close_minute{};  /**< Closing time in minutes after midnight [0, 1440]. */
};

/** @brief Weekly schedule expressed in the place's local time. */
class OpeningHours final {
  public:
    /**
     * @brief Build a schedule from @p intervals.
     *
     * @param intervals Weekly open periods; validated on construction.
     * @param utc_offset Offset of the place's local time from UTC.
     * @throws std::invalid_argument when an interval has out-of-range minutes.
     */
    explicit OpeningHours(std::vector<OpeningInterval> intervals, std::chrono::minutes utc_offset = std::chrono::minutes{0});

    [[nodiscard]] const std::vector<OpeningInterval>& intervals() const noexcept;
    [[nodiscard]] std::chrono::minutes utc_offset() const noexcept;

    /** @brief True when any interval covers @p at. */
    [[nodiscard]] bool is_open_at(WallTime at) const;

    /**
     * @brief Earliest opening strictly after @p at within the look-ahead window.
     *
     * Returns std::nullopt when the place does not open again within
     * k_opening_lookahead of @p at.
     */
    [[nodiscard]] std::optional<WallTime> next_opening_time(WallTime at) const;

    static constexpr std::chrono::hours k_opening_lookahead{24};

  private:
    std::vector<OpeningInterval> list_intervals_;
    std::chrono::minutes utc_offset_;
};

}  // namespace place_discovery
