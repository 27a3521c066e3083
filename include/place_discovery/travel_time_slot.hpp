// === Travel-Time Slot ========================================================
//
// Display slot that shows the travel time for whichever place it is currently
// bound to. Slots are recycled as lists scroll, so every request carries the
// slot generation it was issued under and results for an older generation are
// discarded instead of overwriting the newer binding.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "place_discovery/dispatch_queue.hpp"
#include "place_discovery/travel_time.hpp"
#include "place_discovery/travel_time_cache.hpp"
#include "place_discovery/types.hpp"
#include "place_discovery/worker_pool.hpp"

namespace place_discovery {

/** @brief Walking times at or below this many minutes are shown as walking distance. */
inline constexpr int k_max_walking_minutes{30};
/** @brief Walking times below this many minutes mean the user is already there. */
inline constexpr int k_you_are_here_walking_minutes{2};

/** @brief What a slot shows for a travel-time result. */
enum class TravelTimeDisplayKind {
    Loading,
    UserHere,
    WalkingDistance,
    DrivingDistance,
    NoData
};

struct TravelTimeDisplay final {
    TravelTimeDisplayKind kind{TravelTimeDisplayKind::Loading};
    std::optional<int> duration_minutes{};
};

/** @brief Map a travel-time result to its display; std::nullopt means the fetch failed. */
[[nodiscard]] TravelTimeDisplay classify_travel_times(const std::optional<TravelTimes>& travel_times);

class TravelTimeSlot final {
  public:
    using Generation = std::uint64_t;

    /** @brief Bind the slot to @p place_id and show the loading state. */
    Generation bind(const std::string& place_id);

    /** @brief Clear the binding so pending results for it are discarded. */
    void reset();

    /** @brief True while @p generation is still the slot's active binding. */
    [[nodiscard]] bool is_current(Generation generation) const;

    /**
     * @brief Show @p display if @p generation is still current.
     *
     * @return False when the slot was rebound in the meantime and the result was dropped.
     */
    bool apply(Generation generation, const TravelTimeDisplay& display);

    [[nodiscard]] std::optional<std::string> place_id() const;
    [[nodiscard]] TravelTimeDisplay display() const;

  private:
    mutable std::mutex mutex_;
    Generation generation_{};
    std::optional<std::string> optional_place_id_{};
    TravelTimeDisplay display_{};
};

using TravelTimeSlotPtr = std::shared_ptr<TravelTimeSlot>;

/**
 * @brief Populate @p slot with travel times for @p place from @p origin.
 *
 * A cached result is applied immediately on the calling thread. Otherwise the
 * slot shows the loading state, a worker waits up to @p timeout for the fetch,
 * and the result is applied on @p ui_queue only if the slot still shows the
 * same binding. The fetch itself is not cancelled when the slot is rebound.
 */
void request_travel_time_display(const TravelTimeSlotPtr& slot,
                                 const Place& place,
                                 const GeoCoordinate& origin,
                                 TravelTimeCache& cache,
                                 WorkerPool& worker_pool,
                                 DispatchQueue& ui_queue,
                                 Duration timeout);

}  // namespace place_discovery
