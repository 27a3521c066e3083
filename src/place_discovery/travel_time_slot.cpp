#include "place_discovery/travel_time_slot.hpp"

#include <chrono>
#include <cmath>
#include <exception>

#include "place_discovery/logging.hpp"

namespace place_discovery {

namespace {
const TransitModeList k_display_modes{TransitMode::Walking, TransitMode::Driving};

int seconds_to_minutes(double seconds) {
    return static_cast<int>(std::lround(seconds / 60.0));
}

std::optional<TravelTimes> settled_value(const TravelTimeFuture& future) {
    try {
        return future.get();
    } catch (const std::exception& exc) {
        get_logger()->debug("Travel-time fetch for display failed: {}", exc.what());
        return std::nullopt;
    }
}
}  // namespace

TravelTimeDisplay classify_travel_times(const std::optional<TravelTimes>& travel_times) {
    if (!travel_times.has_value()) {
        return TravelTimeDisplay{TravelTimeDisplayKind::NoData, std::nullopt};
    }
    if (travel_times->walking_time_s.has_value()) {
        const int walking_minutes = seconds_to_minutes(*travel_times->walking_time_s);
        if (walking_minutes < k_you_are_here_walking_minutes) {
            return TravelTimeDisplay{TravelTimeDisplayKind::UserHere, std::nullopt};
        }
        if (walking_minutes <= k_max_walking_minutes) {
            return TravelTimeDisplay{TravelTimeDisplayKind::WalkingDistance, walking_minutes};
        }
    }
    if (travel_times->driving_time_s.has_value()) {
        return TravelTimeDisplay{TravelTimeDisplayKind::DrivingDistance, seconds_to_minutes(*travel_times->driving_time_s)};
    }
    return TravelTimeDisplay{TravelTimeDisplayKind::NoData, std::nullopt};
}

TravelTimeSlot::Generation TravelTimeSlot::bind(const std::string& place_id) {
    std::scoped_lock lock(mutex_);
    ++generation_;
    optional_place_id_ = place_id;
    display_ = TravelTimeDisplay{};
    return generation_;
}

void TravelTimeSlot::reset() {
    std::scoped_lock lock(mutex_);
    ++generation_;
    optional_place_id_.reset();
    display_ = TravelTimeDisplay{};
}

bool TravelTimeSlot::is_current(Generation generation) const {
    std::scoped_lock lock(mutex_);
    return optional_place_id_.has_value() && generation == generation_;
}

bool TravelTimeSlot::apply(Generation generation, const TravelTimeDisplay& display) {
    std::scoped_lock lock(mutex_);
    if (!optional_place_id_.has_value() || generation != generation_) {
        return false;
    }
    display_ = display;
    return true;
}

std::optional<std::string> TravelTimeSlot::place_id() const {
    std::scoped_lock lock(mutex_);
    return optional_place_id_;
}

TravelTimeDisplay TravelTimeSlot::display() const {
    std::scoped_lock lock(mutex_);
    return display_;
}

void request_travel_time_display(const TravelTimeSlotPtr& slot,
                                 const Place& place,
                                 const GeoCoordinate& origin,
                                 TravelTimeCache& cache,
                                 WorkerPool& worker_pool,
                                 DispatchQueue& ui_queue,
                                 Duration timeout) {
    const TravelTimeSlot::Generation generation = slot->bind(place.id);
    TravelTimeFuture future = cache.travel_times(place, origin, k_display_modes);
    if (is_settled(future)) {
        slot->apply(generation, classify_travel_times(settled_value(future)));
        return;
    }

    const SteadyClock::time_point deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(timeout);
    std::weak_ptr<TravelTimeSlot> weak_slot = slot;
    worker_pool.submit([weak_slot, generation, future, deadline, &ui_queue, place_id = place.id]() {
        std::optional<TravelTimes> travel_times{};
        if (future.wait_until(deadline) == std::future_status::ready) {
            travel_times = settled_value(future);
        } else {
            get_logger()->warn(R"({{"component":"travel_time_slot","place":"{}","error":"timed out"}})", place_id);
        }
        const TravelTimeDisplay display = classify_travel_times(travel_times);
        ui_queue.post([weak_slot, generation, display, place_id]() {
            std::shared_ptr<TravelTimeSlot> target = weak_slot.lock();
            if (target == nullptr) {
                return;
            }
            if (!target->apply(generation, display)) {
                get_logger()->debug("Discarding stale travel time for {}", place_id);
            }
        });
    });
}

}  // namespace place_discovery
