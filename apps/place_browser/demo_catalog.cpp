#include "demo_catalog.hpp"

#include <array>
#include <cmath>
#include <memory>
#include <numbers>
#include <string_view>
#include <utility>

namespace place_discovery::demo {

namespace {

constexpr double k_walking_speed_mps{1.4};
constexpr double k_driving_speed_mps{11.0};
constexpr double k_metres_per_degree_lat{111'320.0};

struct CatalogEntry final {
    std::string_view id;
    std::string_view name;
    std::string_view category;
    double bearing_deg;
    double distance_fraction;
    double yelp_rating;
    int yelp_reviews;
    int tripadvisor_reviews;
};

constexpr std::array<CatalogEntry, 8> k_catalog{{
    {"harbor-cafe", "Harbor Cafe", "restaurants", 20.0, 0.05, 4.5, 320, 120},
    {"old-town-park", "Old Town Park", "parks", 75.0, 0.20, 4.7, 1'450, 900},
    {"corner-books", "Corner Books", "shopping", 130.0, 0.10, 4.2, 88, 0},
    {"city-aquarium", "City Aquarium", "aquariums", 190.0, 0.60, 4.4, 5'200, 3'100},
    {"night-owl-bar", "Night Owl", "nightlife", 240.0, 0.35, 3.9, 210, 15},
    {"mission-landmark", "Mission Landmark", "landmarks", 300.0, 0.80, 4.8, 2'700, 4'050},
    {"quick-lube", "Quick Lube", "auto", 330.0, 0.15, 3.1, 40, 0},
    {"unlisted-stall", "Unlisted Stall", "streetvendors", 10.0, 0.02, 5.0, 1, 0},
}};

GeoCoordinate offset(const GeoCoordinate& origin, double bearing_deg, double distance_m) {
    const double bearing_rad = bearing_deg * std::numbers::pi / 180.0;
    const double lat_rad = origin.latitude_deg * std::numbers::pi / 180.0;
    const double delta_lat = distance_m * std::cos(bearing_rad) / k_metres_per_degree_lat;
    const double delta_lon = distance_m * std::sin(bearing_rad) / (k_metres_per_degree_lat * std::cos(lat_rad));
    return GeoCoordinate{origin.latitude_deg + delta_lat, origin.longitude_deg + delta_lon};
}

template <typename T>
std::future<T> ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

}  // namespace

std::future<std::vector<PlaceFetch>> DemoPlaceDatabase::fetch_places(const GeoCoordinate& origin, double radius_km) {
    std::vector<PlaceFetch> results{};
    for (const CatalogEntry& entry : k_catalog) {
        auto place = std::make_shared<Place>();
        place->id = std::string{entry.id};
        place->name = std::string{entry.name};
        place->coordinate = offset(origin, entry.bearing_deg, entry.distance_fraction * radius_km * 1'000.0);
        place->categories = {std::string{entry.category}};
        place->providers.push_back(ReviewProvider{std::string{k_provider_yelp}, entry.yelp_rating, entry.yelp_reviews});
        if (entry.tripadvisor_reviews > 0) {
            place->providers.push_back(ReviewProvider{std::string{k_provider_tripadvisor}, entry.yelp_rating - 0.2, entry.tripadvisor_reviews});
        }
        results.push_back(PlaceFetch{std::move(place), {}});
    }
    results.push_back(PlaceFetch{nullptr, "record missing coordinates"});
    {
        std::scoped_lock lock(mutex_);
        list_last_results_ = results;
    }
    return ready_future(std::move(results));
}

std::future<PlacePtr> DemoPlaceDatabase::fetch_place(const std::string& key) {
    std::scoped_lock lock(mutex_);
    for (const PlaceFetch& record : list_last_results_) {
        if (record.ok() && record.place->id == key) {
            return ready_future(record.place);
        }
    }
    return ready_future(PlacePtr{});
}

std::future<std::vector<Event>> DemoEventsProvider::search_events(const GeoCoordinate& origin) {
    std::vector<Event> events{};
    Event market{};
    market.id = "farmers-market";
    market.name = "Farmers Market";
    market.coordinate = offset(origin, 45.0, 400.0);
    market.categories = {"food"};
    events.push_back(std::move(market));
    return ready_future(std::move(events));
}

std::shared_future<TravelTimes> StraightLineTravelTimeBackend::compute_travel_times(const Place& place,
                                                                                   const GeoCoordinate& origin,
                                                                                   const TransitModeList& modes) {
    const double metres = distance_m(origin, place.coordinate);
    TravelTimes travel_times{};
    for (const TransitMode mode : modes) {
        if (mode == TransitMode::Walking) {
            travel_times.walking_time_s = metres / k_walking_speed_mps;
        } else {
            travel_times.driving_time_s = metres / k_driving_speed_mps;
        }
    }
    return ready_future(travel_times).share();
}

}  // namespace place_discovery::demo
