// === Demo Catalog ============================================================
//
// In-process stand-ins for the geo database, the events provider and the
// routing backend so the browser demo runs without network access. Places are
// laid out on a ring around the requested origin; travel times are straight
// line estimates at walking and driving speeds.

#pragma once

#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "place_discovery/data_sources.hpp"

namespace place_discovery::demo {

class DemoPlaceDatabase final : public PlaceDatabase {
  public:
    std::future<std::vector<PlaceFetch>> fetch_places(const GeoCoordinate& origin, double radius_km) override;
    std::future<PlacePtr> fetch_place(const std::string& key) override;

  private:
    std::mutex mutex_;
    std::vector<PlaceFetch> list_last_results_;
};

class DemoEventsProvider final : public EventsProvider {
  public:
    std::future<std::vector<Event>> search_events(const GeoCoordinate& origin) override;
};

class StraightLineTravelTimeBackend final : public TravelTimeBackend {
  public:
    std::shared_future<TravelTimes> compute_travel_times(const Place& place,
                                                         const GeoCoordinate& origin,
                                                         const TransitModeList& modes) override;
};

}  // namespace place_discovery::demo
