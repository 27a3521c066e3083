#include "place_discovery/place_filter.hpp"

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

namespace place_discovery {

namespace {

using CategoryTable = std::unordered_map<std::string_view, PlaceFilter>;

const CategoryTable& category_table() {
    static const CategoryTable table = []() {
        CategoryTable built{};
        const auto assign = [&built](PlaceFilter filter, std::initializer_list<std::string_view> categories) {
            for (const std::string_view category : categories) {
                built.emplace(category, filter);
            }
        };

        assign(PlaceFilter::Discover, {
            "arts",
            "localflavor",

            // Active life
            "amusementparks", "aquariums", "battingcages", "beaches", "boating",
            "escapegames", "experiences", "flyboarding", "gliding", "golf",
            "hanggliding", "hiking", "horsebackriding", "hot_air_balloons",
            "jetskis", "lakes", "lasertag", "mini_golf", "mountainbiking",
            "paddleboarding", "paintball", "parasailing", "parks", "publicplazas",
            "rafting", "rock_climbing", "sailing", "scavengerhunts", "skatingrinks",
            "skiing", "skydiving", "sledding", "snorkeling", "surfing",
            "trampoline", "tubing", "waterparks", "wildlifehunting", "zipline",
            "zoos", "zorbing",

            // Hotels & travel
            "tours",

            // Public services & government
            "landmarks", "courthouses", "libraries", "townhall",

            // Nightlife
            "musicvenues",

            // Events & services
            "boatcharters", "silentdisco",
        });

        assign(PlaceFilter::EatAndDrink, {"food", "nightlife", "restaurants"});

        assign(PlaceFilter::Shop, {"shopping"});

        assign(PlaceFilter::Services, {
            "active", "adultentertainment", "auto", "beautysvc", "bicycles",
            "education", "eventservices", "financialservices", "health",
            "homeservices", "hotelstravel", "localservices", "professional",
            "massmedia", "pets", "publicservicesgovt", "realestate",
            "religiousorgs",

            // Food
            "convenience",
        });
        return built;
    }();
    return table;
}

bool has_prefix(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

}  // namespace

std::string_view to_string(PlaceFilter filter) noexcept {
    switch (filter) {
        case PlaceFilter::Discover:
            return "discover";
        case PlaceFilter::EatAndDrink:
            return "eatAndDrink";
        case PlaceFilter::Shop:
            return "shop";
        case PlaceFilter::Services:
            return "services";
        case PlaceFilter::LocalEvents:
            return "localEvents";
    }
    return "unknown";
}

std::optional<PlaceFilter> filter_for_category(std::string_view category) {
    const CategoryTable& table = category_table();
    const auto iterator_filter = table.find(category);
    if (iterator_filter == table.end()) {
        return std::nullopt;
    }
    return iterator_filter->second;
}

std::optional<PlaceFilter> classify(const Place& place) {
    if (has_prefix(place.id, k_synthetic_discover_prefix)) {
        return PlaceFilter::Services;
    }
    if (has_prefix(place.id, k_synthetic_event_prefix)) {
        return PlaceFilter::LocalEvents;
    }
    for (const std::string& category : place.categories) {
        if (const auto filter = filter_for_category(category); filter.has_value()) {
            return filter;
        }
    }
    return std::nullopt;
}

bool passes_hours_gate(const Place& place, WallTime now) {
    if (!place.hours.has_value()) {
        return true;
    }
    if (place.hours->is_open_at(now)) {
        return true;
    }
    return place.hours->next_opening_time(now).has_value();
}

PlaceList filter_places(const PlaceList& places, const std::set<PlaceFilter>& enabled_filters, WallTime now) {
    PlaceList filtered{};
    filtered.reserve(places.size());
    for (const PlacePtr& place : places) {
        if (place == nullptr || !passes_hours_gate(*place, now)) {
            continue;
        }
        const std::optional<PlaceFilter> filter = classify(*place);
        if (!filter.has_value() || enabled_filters.count(*filter) == 0) {
            continue;
        }
        filtered.push_back(place);
    }
    return filtered;
}

}  // namespace place_discovery
