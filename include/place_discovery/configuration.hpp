// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the store, the
// travel-time pipeline and the logging layer. `ConfigurationLoader` translates
// environment variables into these structures so downstream modules never
// touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <string>

#include "place_discovery/place_store.hpp"
#include "place_discovery/types.hpp"

namespace place_discovery {

/**
 * @brief Travel-time pipeline settings.
 */
struct TravelTimeConfig final {
    Duration batch_timeout{Duration{5.0}}; /**< Deadline for each batch of travel-time fetches. */
    double cache_reuse_radius_m{100.0};    /**< Origin drift tolerated before a cached result is refetched. */
};

/**
 * @brief Runtime knobs for the place discovery service.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};   /**< Destination directory for structured logs. */
    std::string log_level{};       /**< spdlog level name; empty keeps the default. */
    PlaceStoreConfig store{};      /**< Search radius and events timeout. */
    TravelTimeConfig travel_time{};/**< Travel-time batch deadline and cache tolerance. */
    /**
     * @brief Background worker thread count.
     *
     * Ranking batches and travel-time slot requests each hold a worker while
     * they wait, for up to travel_time.batch_timeout. Once every worker is
     * waiting, later ranking completions and place_for_key lookups queue
     * behind them, so size the pool above the number of slots a screen can
     * request at once.
     */
    std::size_t worker_threads{};
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialise logging and build the configuration. */
    static Configuration load();

  private:
    static double load_search_radius_km();
};

}  // namespace place_discovery
