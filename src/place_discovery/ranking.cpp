#include "place_discovery/ranking.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>
#include <vector>

#include "place_discovery/rating.hpp"

namespace place_discovery {

namespace {

const TransitModeList k_walking_only{TransitMode::Walking};

/** @brief Sort @p places stably on a precomputed key per element. */
PlaceList stable_sort_by_key(const PlaceList& places, const std::vector<double>& keys, bool ascending) {
    std::vector<std::size_t> order(places.size());
    for (std::size_t index = 0; index < order.size(); ++index) {
        order[index] = index;
    }
    std::stable_sort(order.begin(), order.end(), [&keys, ascending](std::size_t lhs, std::size_t rhs) {
        return ascending ? keys[lhs] < keys[rhs] : keys[lhs] > keys[rhs];
    });

    PlaceList sorted{};
    sorted.reserve(places.size());
    for (const std::size_t index : order) {
        sorted.push_back(places[index]);
    }
    return sorted;
}

}  // namespace

PlaceList rank_by_distance(const PlaceList& places, const GeoCoordinate& origin, bool ascending) {
    std::vector<double> distances{};
    distances.reserve(places.size());
    for (const PlacePtr& place : places) {
        distances.push_back(place == nullptr ? std::numeric_limits<double>::infinity() : distance_m(origin, place->coordinate));
    }
    return stable_sort_by_key(places, distances, ascending);
}

PlaceList rank_by_top_rated(const PlaceList& places) {
    const RatingContext context{places};
    std::vector<double> scores{};
    scores.reserve(places.size());
    for (const PlacePtr& place : places) {
        scores.push_back(place == nullptr ? 0.0 : context.composite_score(*place));
    }
    return stable_sort_by_key(places, scores, false);
}

PlaceList order_by_travel_time(const PlaceList& seed, const TravelTimeLookup& lookup, bool ascending) {
    std::vector<double> travel_times{};
    travel_times.reserve(seed.size());
    for (const PlacePtr& place : seed) {
        std::optional<double> travel_time_s{};
        if (place != nullptr) {
            travel_time_s = lookup(*place);
        }
        travel_times.push_back(travel_time_s.value_or(std::numeric_limits<double>::infinity()));
    }
    return stable_sort_by_key(seed, travel_times, ascending);
}

TravelTimeRanker::TravelTimeRanker(TravelTimeCache& cache, WorkerPool& worker_pool, Duration timeout)
    : cache_(cache),
      worker_pool_(worker_pool),
      timeout_(timeout),
      logger_(get_logger()) {}

Duration TravelTimeRanker::timeout() const noexcept {
    return timeout_;
}

void TravelTimeRanker::rank(PlaceList places, const GeoCoordinate& origin, bool ascending, Completion completion) {
    PlaceList seed = rank_by_distance(places, origin);
    std::vector<TravelTimeFuture> futures = request_walking_times(seed, origin);
    const SteadyClock::time_point deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(timeout_);

    worker_pool_.submit([this, seed = std::move(seed), futures = std::move(futures), deadline, ascending, completion = std::move(completion)]() {
        const std::size_t settled_count = wait_all_until(futures, deadline);
        if (settled_count < futures.size()) {
            logger_->warn(
                R"({{"component":"ranking","action":"travel_time_timeout","settled":{},"requested":{}}})",
                settled_count,
                futures.size()
            );
        }

        PlaceList ranked = order_by_travel_time(
            seed,
            [this](const Place& place) -> std::optional<double> {
                const std::optional<TravelTimes> travel_times = cache_.last_travel_times(place.id);
                if (!travel_times.has_value()) {
                    return std::nullopt;
                }
                return travel_times->shortest_time_s();
            },
            ascending
        );
        logger_->debug("Ranked {} places by travel time ({} resolved)", ranked.size(), settled_count);
        completion(std::move(ranked));
    });
}

void TravelTimeRanker::prefetch(const PlaceList& places, const GeoCoordinate& origin) {
    const std::vector<TravelTimeFuture> futures = request_walking_times(places, origin);
    logger_->debug("Prefetching travel times for {} places", futures.size());
}

std::vector<TravelTimeFuture> TravelTimeRanker::request_walking_times(const PlaceList& places, const GeoCoordinate& origin) {
    std::vector<TravelTimeFuture> futures{};
    futures.reserve(places.size());
    for (const PlacePtr& place : places) {
        if (place == nullptr) {
            continue;
        }
        futures.push_back(cache_.travel_times(*place, origin, k_walking_only));
    }
    return futures;
}

}  // namespace place_discovery
