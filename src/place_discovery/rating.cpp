#include "place_discovery/rating.hpp"

#include <algorithm>
#include <cmath>

namespace place_discovery {

namespace {
constexpr double k_max_rating{5.0};

struct ProviderSignal final {
    double count{};
    double rating{};
};

ProviderSignal signal_for(const Place& place, std::string_view provider_name) {
    const ReviewProvider* entry = place.provider(provider_name);
    if (entry == nullptr) {
        return ProviderSignal{};
    }
    const double count = static_cast<double>(std::max(0, entry->total_review_count));
    const double rating = std::clamp(entry->rating.value_or(0.0), 0.0, k_max_rating);
    return ProviderSignal{count, rating};
}
}  // namespace

int scored_review_count(const Place& place) noexcept {
    const ReviewProvider* yelp = place.provider(k_provider_yelp);
    const ReviewProvider* tripadvisor = place.provider(k_provider_tripadvisor);
    const int yelp_count = yelp == nullptr ? 0 : std::max(0, yelp->total_review_count);
    const int tripadvisor_count = tripadvisor == nullptr ? 0 : std::max(0, tripadvisor->total_review_count);
    return yelp_count + tripadvisor_count;
}

double rating_score(const Place& place) noexcept {
    const ProviderSignal yelp = signal_for(place, k_provider_yelp);
    const ProviderSignal tripadvisor = signal_for(place, k_provider_tripadvisor);
    const double total_count = yelp.count + tripadvisor.count;
    if (total_count <= 0.0) {
        return 0.0;
    }
    return (yelp.rating * yelp.count + tripadvisor.rating * tripadvisor.count) / total_count / k_max_rating;
}

RatingContext::RatingContext(const PlaceList& candidates) {
    for (const PlacePtr& candidate : candidates) {
        if (candidate == nullptr) {
            continue;
        }
        max_review_count_ = std::max(max_review_count_, scored_review_count(*candidate));
    }
    log_max_reviews_ = max_review_count_ > 0 ? std::log10(static_cast<double>(max_review_count_)) : 0.0;
}

int RatingContext::max_review_count() const noexcept {
    return max_review_count_;
}

double RatingContext::composite_score(const Place& place) const {
    const int review_count = scored_review_count(place);
    double review_score = 0.0;
    // log10(1) == 0, so a candidate set whose busiest place has one review
    // normalises to zero as well.
    if (log_max_reviews_ > 0.0 && review_count > 0) {
        review_score = std::clamp(std::log10(static_cast<double>(review_count)) / log_max_reviews_, 0.0, 1.0);
    }
    return (rating_score(place) * k_rating_weight + review_score * k_review_weight) / (k_rating_weight + k_review_weight);
}

}  // namespace place_discovery
