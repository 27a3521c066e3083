// === Data Sources ============================================================
//
// Interfaces of the external collaborators the store consumes: the geo
// database, the events provider and the travel-routing backend. Concrete
// clients live outside this library; tests and the demo app provide their own.

#pragma once

#include <future>
#include <optional>
#include <string>
#include <vector>

#include "place_discovery/place.hpp"
#include "place_discovery/travel_time.hpp"
#include "place_discovery/types.hpp"

namespace place_discovery {

/** @brief One record of a places query: either a place or the reason it failed. */
struct PlaceFetch final {
    PlacePtr place{};
    std::string error_message{};

    [[nodiscard]] bool ok() const noexcept { return place != nullptr; }
};

/** @brief Geo database queried for places around a location. */
class PlaceDatabase {
  public:
    virtual ~PlaceDatabase() = default;

    /** @brief Places within @p radius_km of @p origin; the future may hold an exception. */
    virtual std::future<std::vector<PlaceFetch>> fetch_places(const GeoCoordinate& origin, double radius_km) = 0;
    /** @brief Single place by key; resolves to nullptr when unknown. */
    virtual std::future<PlacePtr> fetch_place(const std::string& key) = 0;
};

/** @brief Event listing returned by the events provider. */
struct Event final {
    std::string id{};
    std::string name{};
    GeoCoordinate coordinate{};
    std::vector<std::string> categories{};
    std::optional<OpeningHours> hours{};
};

/** @brief Adapt @p event into a place record so it can be filtered and ranked. */
[[nodiscard]] PlacePtr to_place(const Event& event);

/** @brief Source of local events near a coordinate. */
class EventsProvider {
  public:
    virtual ~EventsProvider() = default;

    virtual std::future<std::vector<Event>> search_events(const GeoCoordinate& origin) = 0;
};

/**
 * @brief Travel-routing backend.
 *
 * Implementations may fail the future or, on misbehaviour, never satisfy it;
 * callers must bound every wait.
 */
class TravelTimeBackend {
  public:
    virtual ~TravelTimeBackend() = default;

    virtual std::shared_future<TravelTimes> compute_travel_times(const Place& place,
                                                                 const GeoCoordinate& origin,
                                                                 const TransitModeList& modes) = 0;
};

}  // namespace place_discovery
