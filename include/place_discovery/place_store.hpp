// === Place Store =============================================================
//
// Stateful core holding every fetched place and the filtered, ranked subset
// shown to the user. The full list, the displayed list and the id-to-index map
// live in one state cell behind a single shared mutex: readers take it shared,
// commits take it exclusive and replace the cell as a unit, so no reader ever
// sees lists from two different commits or an index map that lags its list.
// Changes are published to a non-owning delegate on the UI dispatch queue,
// always after the lock is released and in commit order.

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "place_discovery/data_sources.hpp"
#include "place_discovery/dispatch_queue.hpp"
#include "place_discovery/logging.hpp"
#include "place_discovery/place.hpp"
#include "place_discovery/place_filter.hpp"
#include "place_discovery/ranking.hpp"
#include "place_discovery/types.hpp"
#include "place_discovery/worker_pool.hpp"

namespace place_discovery {

/** @brief Raised when an indexed lookup falls outside the displayed places. */
class PlaceNotFoundError final : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
};

/** @brief Receives the displayed places after every committed change. */
class PlaceStoreDelegate {
  public:
    virtual ~PlaceStoreDelegate() = default;

    /** @brief Called on the UI dispatch queue, once per commit. */
    virtual void on_places_updated(const PlaceList& displayed_places) = 0;
};

/** @brief Both place lists as captured by a single critical section. */
struct PlaceSnapshot final {
    PlaceList all_places{};
    PlaceList displayed_places{};
};

/** @brief Store tuning supplied by the configuration layer. */
struct PlaceStoreConfig final {
    double search_radius_km{4.0};                 /**< Radius of each places query. */
    Duration events_timeout{Duration{10.0}};      /**< Longest wait for the events provider. */
    std::function<WallTime()> clock{[]() { return WallClock::now(); }}; /**< Time source for the hours gate. */
};

/**
 * @brief Thread-safe manager of the ranked place collection.
 *
 * Must be owned by a std::shared_ptr: background stages hold weak references
 * to the store and drop their results if it has gone away.
 */
class PlaceStore final : public std::enable_shared_from_this<PlaceStore> {
  public:
    PlaceStore(PlaceStoreConfig config,
               PlaceDatabase& database,
               EventsProvider& events_provider,
               TravelTimeRanker& ranker,
               WorkerPool& worker_pool,
               DispatchQueue& ui_queue);

    /** @brief Register the non-owning change listener, replacing any previous one. */
    void set_delegate(std::weak_ptr<PlaceStoreDelegate> delegate);
    /** @brief Unregister the change listener. */
    void clear_delegate();

    /**
     * @brief Fetch places and events around @p location and commit them ranked by travel time.
     *
     * Returns immediately; the commit and notification happen later.
     * @throws std::logic_error when the store is not owned by a std::shared_ptr.
     */
    void update_from_location(const GeoCoordinate& location);

    /**
     * @brief Re-apply @p filters to the current places without fetching.
     *
     * Call from the UI-owning thread only.
     */
    void refresh(const FilterSet& filters);

    /** @brief Re-order the displayed places by distance unless top-rated mode is active. */
    void sort_by_location(const GeoCoordinate& location);

    /** @brief Commit an already ranked list as the full place list. */
    void apply_ranked_places(PlaceList ranked_places);

    /**
     * @brief Displayed place at @p index.
     *
     * @throws PlaceNotFoundError when @p index is not below count().
     */
    [[nodiscard]] PlacePtr place_at_index(std::size_t index) const;

    /**
     * @brief Look up a place by key; @p callback runs on the UI dispatch queue.
     *
     * Displayed places answer locally; anything else is fetched from the
     * database. The callback receives nullptr when the lookup fails.
     */
    void place_for_key(const std::string& key, std::function<void(PlacePtr)> callback);

    /**
     * @brief Place after @p place in the displayed list.
     *
     * Returns nullptr at the end of the list. A place that is no longer
     * displayed yields the first displayed place so detail views stay
     * navigable after the list changes.
     */
    [[nodiscard]] PlacePtr next_place(const Place& place) const;

    /** @brief Place before @p place, or nullptr at the start or when @p place is not displayed. */
    [[nodiscard]] PlacePtr previous_place(const Place& place) const;

    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] std::optional<std::size_t> index_of(const Place& place) const;
    [[nodiscard]] PlaceSnapshot snapshot() const;
    [[nodiscard]] FilterSet filters() const;

  private:
    /** @brief Everything the state lock protects, replaced as one unit. */
    struct PlaceState final {
        PlaceList all_places{};
        PlaceList displayed_places{};
        std::unordered_map<std::string, std::size_t> map_displayed_index{};
        FilterSet filters{};
    };

    using Mutation = std::function<bool(PlaceState&)>;

    PlaceList collect_places(const GeoCoordinate& location);
    void display_places(PlaceList places, const GeoCoordinate& location);
    /** @brief Apply @p mutation under the exclusive lock and publish if it reports a change. */
    void commit(const Mutation& mutation);
    void publish(PlaceList displayed_places);
    PlaceList compute_displayed(const PlaceState& state) const;
    static void assign_displayed(PlaceState& state, PlaceList displayed_places);

    PlaceStoreConfig config_;
    PlaceDatabase& database_;
    EventsProvider& events_provider_;
    TravelTimeRanker& ranker_;
    WorkerPool& worker_pool_;
    DispatchQueue& ui_queue_;

    mutable std::shared_mutex state_mutex_;
    PlaceState struct_state_;

    std::mutex commit_order_mutex_;  /**< Keeps notifications in commit order. */
    mutable std::mutex delegate_mutex_;
    std::weak_ptr<PlaceStoreDelegate> delegate_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace place_discovery
