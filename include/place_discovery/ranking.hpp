// === Ranking Pipeline ========================================================
//
// Ordering strategies applied to place lists: great-circle distance, composite
// rating, and travel time. Every strategy is a stable sort, so places that
// compare equal keep their input order across repeated refreshes. Travel-time
// ranking is asynchronous and seeds itself with the distance order so places
// whose travel time never resolves still land somewhere sensible.

#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "place_discovery/logging.hpp"
#include "place_discovery/place.hpp"
#include "place_discovery/travel_time_cache.hpp"
#include "place_discovery/types.hpp"
#include "place_discovery/worker_pool.hpp"

namespace place_discovery {

/** @brief Stable sort by distance from @p origin. */
[[nodiscard]] PlaceList rank_by_distance(const PlaceList& places, const GeoCoordinate& origin, bool ascending = true);

/** @brief Stable sort by composite rating score, best first. */
[[nodiscard]] PlaceList rank_by_top_rated(const PlaceList& places);

using TravelTimeLookup = std::function<std::optional<double>(const Place&)>;

/**
 * @brief Stable re-order of @p seed by the travel time @p lookup reports.
 *
 * Places without a travel time sort as if infinitely far away and keep their
 * relative seed order.
 */
[[nodiscard]] PlaceList order_by_travel_time(const PlaceList& seed, const TravelTimeLookup& lookup, bool ascending = true);

/** @brief Asynchronous travel-time ranking backed by the shared cache. */
class TravelTimeRanker final {
  public:
    using Completion = std::function<void(PlaceList)>;

    /**
     * @param cache Shared travel-time cache.
     * @param worker_pool Pool the waiting stage runs on.
     * @param timeout Deadline applied to each batch of fetches.
     */
    TravelTimeRanker(TravelTimeCache& cache, WorkerPool& worker_pool, Duration timeout);

    [[nodiscard]] Duration timeout() const noexcept;

    /**
     * @brief Rank @p places by walking time from @p origin.
     *
     * Returns immediately; @p completion runs on a worker thread once every
     * fetch settled or the timeout elapsed. The result always holds exactly
     * the input places.
     */
    void rank(PlaceList places, const GeoCoordinate& origin, bool ascending, Completion completion);

    /** @brief Start walking-time fetches for @p places without waiting on them. */
    void prefetch(const PlaceList& places, const GeoCoordinate& origin);

  private:
    std::vector<TravelTimeFuture> request_walking_times(const PlaceList& places, const GeoCoordinate& origin);

    TravelTimeCache& cache_;
    WorkerPool& worker_pool_;
    Duration timeout_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace place_discovery
