#include "place_discovery/place.hpp"

#include <algorithm>

namespace place_discovery {

const ReviewProvider* Place::provider(std::string_view provider_name) const noexcept {
    const auto iterator_provider = std::find_if(
        providers.begin(),
        providers.end(),
        [provider_name](const ReviewProvider& candidate) { return candidate.name == provider_name; }
    );
    if (iterator_provider == providers.end()) {
        return nullptr;
    }
    return &*iterator_provider;
}

}  // namespace place_discovery
