// === Rating Model ============================================================
//
// Composite quality score blending average rating and log-scaled review volume
// across the two review providers the ranking considers. Scores fall in
// [0, 1]; review volume is weighted twice as heavily as the rating itself.

#pragma once

#include "place_discovery/place.hpp"

namespace place_discovery {

inline constexpr double k_rating_weight{1.0};
inline constexpr double k_review_weight{2.0};

/**
 * @brief Per-ranking-call scoring context.
 *
 * The review-volume component is normalised against the busiest place of the
 * candidate set, so a context is built once per call from the full list.
 */
class RatingContext final {
  public:
    explicit RatingContext(const PlaceList& candidates);

    /** @brief Largest review count found in the candidate set. */
    [[nodiscard]] int max_review_count() const noexcept;

    /** @brief Composite score of @p place in [0, 1]. */
    [[nodiscard]] double composite_score(const Place& place) const;

  private:
    int max_review_count_{};
    double log_max_reviews_{};
};

/** @brief Review count considered by scoring (yelp plus tripadvisor). */
[[nodiscard]] int scored_review_count(const Place& place) noexcept;

/** @brief Review-count-weighted average rating scaled to [0, 1]. */
[[nodiscard]] double rating_score(const Place& place) noexcept;

}  // namespace place_discovery
