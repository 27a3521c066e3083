// === Place ===================================================================
//
// Declares the point-of-interest record ranked and filtered by the store,
// together with the review-provider data that feeds the composite score.
// Places are immutable once admitted and shared as `PlacePtr` handles.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "place_discovery/opening_hours.hpp"
#include "place_discovery/types.hpp"

namespace place_discovery {

inline constexpr std::string_view k_provider_yelp{"yelp"};
inline constexpr std::string_view k_provider_tripadvisor{"tripadvisor"};

/** @brief Rating data reported by a single third-party review provider. */
struct ReviewProvider final {
    std::string name{};             /**< Provider identifier, e.g. "yelp". */
    std::optional<double> rating{}; /**< Average rating on a 0-5 scale, if known. */
    int total_review_count{};       /**< Number of reviews backing the rating. */
};

/**
 * @brief Point of interest with location, categories, hours and reviews.
 */
struct Place final {
    std::string id{};                       /**< Globally unique, stable key. */
    std::string name{};                     /**< Display name. */
    GeoCoordinate coordinate{};             /**< Geographic position. */
    std::vector<std::string> categories{};  /**< Ordered category tag identifiers. */
    std::optional<OpeningHours> hours{};    /**< Weekly schedule, if published. */
    std::vector<ReviewProvider> providers{};/**< Review providers, "yelp" first when present. */

    /** @brief Provider record named @p provider_name, or nullptr. */
    [[nodiscard]] const ReviewProvider* provider(std::string_view provider_name) const noexcept;
};

using PlacePtr = std::shared_ptr<const Place>;
using PlaceList = std::vector<PlacePtr>;

}  // namespace place_discovery
