// === Place Filter ============================================================
//
// Classifies places into one coarse filter bucket from their category tags and
// applies the caller's enabled-bucket set plus the business-hours gate.

#pragma once

#include <optional>
#include <set>
#include <string_view>

#include "place_discovery/place.hpp"
#include "place_discovery/types.hpp"

namespace place_discovery {

/** @brief Coarse filter bucket every admitted place falls into. */
enum class PlaceFilter {
    Discover,
    EatAndDrink,
    Shop,
    Services,
    LocalEvents
};

/** @brief Id prefix of synthetic discover entries; always classified as Services. */
inline constexpr std::string_view k_synthetic_discover_prefix{"proxdiscover-"};
/** @brief Id prefix of places adapted from events; always classified as LocalEvents. */
inline constexpr std::string_view k_synthetic_event_prefix{"proxevent-"};

/** @brief Caller-supplied filter configuration consulted on every recompute. */
struct FilterSet final {
    std::set<PlaceFilter> enabled_filters{PlaceFilter::Discover, PlaceFilter::LocalEvents};
    bool top_rated_only{false};
};

[[nodiscard]] std::string_view to_string(PlaceFilter filter) noexcept;

/** @brief Bucket for a raw category tag, or std::nullopt if the tag is unknown. */
[[nodiscard]] std::optional<PlaceFilter> filter_for_category(std::string_view category);

/**
 * @brief Bucket for @p place.
 *
 * Synthetic id prefixes win; otherwise the first category tag present in the
 * tag table decides. Returns std::nullopt when no tag is known.
 */
[[nodiscard]] std::optional<PlaceFilter> classify(const Place& place);

/**
 * @brief Business-hours gate.
 *
 * False only when the place publishes hours, is closed at @p now and has no
 * next opening time within the look-ahead window.
 */
[[nodiscard]] bool passes_hours_gate(const Place& place, WallTime now);

/** @brief Places that pass the hours gate and fall in an enabled bucket, order preserved. */
[[nodiscard]] PlaceList filter_places(const PlaceList& places, const std::set<PlaceFilter>& enabled_filters, WallTime now);

}  // namespace place_discovery
