// === Place Presentation ======================================================
//
// Text helpers for place cards: the review summary shown per provider and the
// short category label.

#pragma once

#include <string>
#include <vector>

#include "place_discovery/place.hpp"

namespace place_discovery {

inline constexpr std::size_t k_max_displayed_categories{3};

/** @brief Review line content for one provider. */
struct ReviewSummary final {
    bool has_info{};       /**< False when the provider reports neither rating nor reviews. */
    double score{};        /**< Rating to draw; 0 when unknown. */
    bool has_rating{};     /**< False when reviews exist but no average rating does. */
    std::string label{};   /**< "No info available", "12 Reviews", "No Reviews", ... */
};

/** @brief Summarise @p provider; a null provider counts as having no info. */
[[nodiscard]] ReviewSummary describe_reviews(const ReviewProvider* provider, bool shortened = false);

/** @brief First k_max_displayed_categories categories joined with " • ". */
[[nodiscard]] std::string category_label(const std::vector<std::string>& categories);

}  // namespace place_discovery
