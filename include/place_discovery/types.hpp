// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// library (clock primitives, geographic coordinates, distance helpers).

#pragma once

#include <chrono>

namespace place_discovery {

/**
 * @brief Alias for the steady clock used for deadlines and timeouts.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for the wall clock used for business-hours queries.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock timestamps.
 */
using WallTime = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeoCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Great-circle (haversine) distance between two coordinates in metres.
 */
[[nodiscard]] double distance_m(const GeoCoordinate& from, const GeoCoordinate& to);

}  // namespace place_discovery
