// === Travel Times ============================================================
//
// Result of a travel-time computation from a reference location to a place.

#pragma once

#include <optional>
#include <vector>

namespace place_discovery {

/** @brief Transport modes a travel-time backend can be asked for. */
enum class TransitMode {
    Walking,
    Driving
};

using TransitModeList = std::vector<TransitMode>;

/** @brief Travel durations in seconds; a mode is absent when not computed. */
struct TravelTimes final {
    std::optional<double> walking_time_s{};
    std::optional<double> driving_time_s{};

    /** @brief Shortest known duration across modes, if any. */
    [[nodiscard]] std::optional<double> shortest_time_s() const noexcept;
};

}  // namespace place_discovery
