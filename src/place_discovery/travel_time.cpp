#include "place_discovery/travel_time.hpp"

#include <algorithm>

namespace place_discovery {

std::optional<double> TravelTimes::shortest_time_s() const noexcept {
    if (walking_time_s.has_value() && driving_time_s.has_value()) {
        return std::min(*walking_time_s, *driving_time_s);
    }
    if (walking_time_s.has_value()) {
        return walking_time_s;
    }
    return driving_time_s;
}

}  // namespace place_discovery
