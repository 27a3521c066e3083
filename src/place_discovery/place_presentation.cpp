#include "place_discovery/place_presentation.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace place_discovery {

ReviewSummary describe_reviews(const ReviewProvider* provider, bool shortened) {
    if (provider == nullptr || (provider->total_review_count == 0 && !provider->rating.has_value())) {
        return ReviewSummary{false, 0.0, false, shortened ? "No info" : "No info available"};
    }

    ReviewSummary summary{};
    summary.has_info = true;
    summary.has_rating = provider->rating.has_value();
    summary.score = provider->rating.value_or(0.0);
    if (provider->total_review_count > 0) {
        summary.label = fmt::format("{} Reviews", provider->total_review_count);
    } else {
        summary.label = "No Reviews";
    }
    return summary;
}

std::string category_label(const std::vector<std::string>& categories) {
    const std::size_t shown = std::min(categories.size(), k_max_displayed_categories);
    return fmt::format("{}", fmt::join(categories.begin(), categories.begin() + static_cast<std::ptrdiff_t>(shown), " • "));
}

}  // namespace place_discovery
