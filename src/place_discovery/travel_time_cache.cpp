#include "place_discovery/travel_time_cache.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace place_discovery {

namespace {
TravelTimeFuture failed_future(std::exception_ptr error) {
    std::promise<TravelTimes> promise;
    promise.set_exception(std::move(error));
    return promise.get_future().share();
}
}  // namespace

bool is_settled(const TravelTimeFuture& future) {
    return future.valid() && future.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
}

std::size_t wait_all_until(const std::vector<TravelTimeFuture>& futures, SteadyClock::time_point deadline) {
    std::size_t settled_count = 0;
    for (const TravelTimeFuture& future : futures) {
        if (!future.valid()) {
            continue;
        }
        if (future.wait_until(deadline) == std::future_status::ready) {
            ++settled_count;
        }
    }
    return settled_count;
}

TravelTimeCache::TravelTimeCache(TravelTimeBackend& backend, double reuse_radius_m)
    : backend_(backend),
      reuse_radius_m_(reuse_radius_m),
      logger_(get_logger()) {}

TravelTimeFuture TravelTimeCache::travel_times(const Place& place, const GeoCoordinate& origin, const TransitModeList& modes) {
    std::scoped_lock lock(mutex_);
    const auto iterator_entry = map_entries_.find(place.id);
    if (iterator_entry != map_entries_.end()) {
        const Entry& entry = iterator_entry->second;
        if (!is_settled(entry.future)) {
            return entry.future;
        }
        if (distance_m(entry.origin, origin) <= reuse_radius_m_) {
            return entry.future;
        }
        logger_->debug("Travel times for {} computed from a distant origin; refetching", place.id);
    }

    TravelTimeFuture future = request_from_backend(place, origin, modes);
    map_entries_.insert_or_assign(place.id, Entry{future, origin});
    return future;
}

std::optional<TravelTimes> TravelTimeCache::last_travel_times(const std::string& place_id) const {
    TravelTimeFuture future;
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_entry = map_entries_.find(place_id);
        if (iterator_entry == map_entries_.end()) {
            return std::nullopt;
        }
        future = iterator_entry->second.future;
    }
    if (!is_settled(future)) {
        return std::nullopt;
    }
    try {
        return future.get();
    } catch (const std::exception& exc) {
        logger_->debug("Travel times for {} failed: {}", place_id, exc.what());
        return std::nullopt;
    }
}

std::size_t TravelTimeCache::size() const {
    std::scoped_lock lock(mutex_);
    return map_entries_.size();
}

std::size_t TravelTimeCache::backend_request_count() const {
    std::scoped_lock lock(mutex_);
    return backend_request_count_;
}

TravelTimeFuture TravelTimeCache::request_from_backend(const Place& place, const GeoCoordinate& origin, const TransitModeList& modes) {
    ++backend_request_count_;
    try {
        TravelTimeFuture future = backend_.compute_travel_times(place, origin, modes);
        if (!future.valid()) {
            return failed_future(std::make_exception_ptr(std::runtime_error("Backend returned an empty future for " + place.id)));
        }
        return future;
    } catch (const std::exception& exc) {
        logger_->warn(R"({{"component":"travel_time_cache","place":"{}","error":"{}"}})", place.id, exc.what());
        return failed_future(std::current_exception());
    }
}

}  // namespace place_discovery
