#include "place_discovery/data_sources.hpp"

#include <memory>

#include "place_discovery/place_filter.hpp"

namespace place_discovery {

PlacePtr to_place(const Event& event) {
    auto place = std::make_shared<Place>();
    place->id = std::string{k_synthetic_event_prefix} + event.id;
    place->name = event.name;
    place->coordinate = event.coordinate;
    place->categories = event.categories;
    place->hours = event.hours;
    place->providers.push_back(ReviewProvider{std::string{k_provider_yelp}, std::nullopt, 0});
    return place;
}

}  // namespace place_discovery
