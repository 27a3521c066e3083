// === Travel-Time Cache =======================================================
//
// Process-wide memo of travel-time computations keyed by place id. Concurrent
// requests for the same place share one in-flight future, so the backend is
// asked at most once per place while a computation is pending. Entries are
// never evicted; growth is bounded only by the number of distinct places seen.

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "place_discovery/data_sources.hpp"
#include "place_discovery/logging.hpp"
#include "place_discovery/travel_time.hpp"
#include "place_discovery/types.hpp"

namespace place_discovery {

using TravelTimeFuture = std::shared_future<TravelTimes>;

class TravelTimeCache final {
  public:
    /**
     * @param backend Routing backend; must outlive the cache.
     * @param reuse_radius_m Completed entries are reused while the new origin
     *        lies within this distance of the origin they were computed from.
     */
    TravelTimeCache(TravelTimeBackend& backend, double reuse_radius_m);

    /**
     * @brief Travel times for @p place from @p origin.
     *
     * Returns the pending future when one is in flight for the place id,
     * the cached future when it completed for a nearby origin, and otherwise
     * issues a new backend request that replaces the entry.
     */
    [[nodiscard]] TravelTimeFuture travel_times(const Place& place, const GeoCoordinate& origin, const TransitModeList& modes);

    /** @brief Last successfully resolved travel times for @p place_id, without waiting. */
    [[nodiscard]] std::optional<TravelTimes> last_travel_times(const std::string& place_id) const;

    [[nodiscard]] std::size_t size() const;
    /** @brief Number of requests issued to the backend so far. */
    [[nodiscard]] std::size_t backend_request_count() const;

  private:
    struct Entry final {
        TravelTimeFuture future;
        GeoCoordinate origin{};
    };

    TravelTimeFuture request_from_backend(const Place& place, const GeoCoordinate& origin, const TransitModeList& modes);

    TravelTimeBackend& backend_;
    double reuse_radius_m_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> map_entries_;
    std::size_t backend_request_count_{};
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief True when @p future holds a value or an exception. */
[[nodiscard]] bool is_settled(const TravelTimeFuture& future);

/**
 * @brief Wait until every future settles or @p deadline passes.
 *
 * Never fails: on expiry the unresolved futures are simply left pending.
 * @return Number of futures settled when the wait ended.
 */
std::size_t wait_all_until(const std::vector<TravelTimeFuture>& futures, SteadyClock::time_point deadline);

}  // namespace place_discovery
