#include "place_discovery/place_store.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <unordered_set>
#include <utility>

namespace place_discovery {

namespace {
/** @brief Drop null entries and repeated ids, keeping the first occurrence. */
PlaceList unique_places(PlaceList places, std::size_t& dropped_count) {
    std::unordered_set<std::string> seen_ids{};
    PlaceList unique{};
    unique.reserve(places.size());
    dropped_count = 0;
    for (PlacePtr& place : places) {
        if (place == nullptr || !seen_ids.insert(place->id).second) {
            ++dropped_count;
            continue;
        }
        unique.push_back(std::move(place));
    }
    return unique;
}
}  // namespace

PlaceStore::PlaceStore(PlaceStoreConfig config,
                       PlaceDatabase& database,
                       EventsProvider& events_provider,
                       TravelTimeRanker& ranker,
                       WorkerPool& worker_pool,
                       DispatchQueue& ui_queue)
    : config_(std::move(config)),
      database_(database),
      events_provider_(events_provider),
      ranker_(ranker),
      worker_pool_(worker_pool),
      ui_queue_(ui_queue),
      logger_(get_logger()) {
    if (!config_.clock) {
        config_.clock = []() { return WallClock::now(); };
    }
}

void PlaceStore::set_delegate(std::weak_ptr<PlaceStoreDelegate> delegate) {
    std::scoped_lock lock(delegate_mutex_);
    delegate_ = std::move(delegate);
}

void PlaceStore::clear_delegate() {
    std::scoped_lock lock(delegate_mutex_);
    delegate_.reset();
}

void PlaceStore::update_from_location(const GeoCoordinate& location) {
    std::weak_ptr<PlaceStore> weak_self = weak_from_this();
    if (weak_self.expired()) {
        throw std::logic_error("PlaceStore::update_from_location requires the store to be owned by a std::shared_ptr");
    }

    logger_->info("Updating places for ({:.5f}, {:.5f}) within {} km",
                  location.latitude_deg,
                  location.longitude_deg,
                  config_.search_radius_km);
    worker_pool_.submit([weak_self, location]() {
        std::shared_ptr<PlaceStore> self = weak_self.lock();
        if (self == nullptr) {
            return;
        }
        PlaceList places = self->collect_places(location);
        self->display_places(std::move(places), location);
    });
}

void PlaceStore::refresh(const FilterSet& filters) {
    commit([this, &filters](PlaceState& state) {
        state.filters = filters;
        assign_displayed(state, compute_displayed(state));
        return true;
    });
}

void PlaceStore::sort_by_location(const GeoCoordinate& location) {
    commit([&location](PlaceState& state) {
        if (state.filters.top_rated_only) {
            return false;
        }
        assign_displayed(state, rank_by_distance(state.displayed_places, location));
        return true;
    });
}

void PlaceStore::apply_ranked_places(PlaceList ranked_places) {
    std::size_t dropped_count = 0;
    ranked_places = unique_places(std::move(ranked_places), dropped_count);
    if (dropped_count > 0) {
        logger_->warn(R"({{"component":"place_store","action":"apply_ranked_places","dropped_duplicates":{}}})", dropped_count);
    }
    commit([this, &ranked_places](PlaceState& state) {
        state.all_places = std::move(ranked_places);
        assign_displayed(state, compute_displayed(state));
        return true;
    });
}

PlacePtr PlaceStore::place_at_index(std::size_t index) const {
    std::shared_lock lock(state_mutex_);
    if (index >= struct_state_.displayed_places.size()) {
        throw PlaceNotFoundError("There is no place at index: " + std::to_string(index));
    }
    return struct_state_.displayed_places[index];
}

void PlaceStore::place_for_key(const std::string& key, std::function<void(PlacePtr)> callback) {
    {
        std::shared_lock lock(state_mutex_);
        const auto iterator_index = struct_state_.map_displayed_index.find(key);
        if (iterator_index != struct_state_.map_displayed_index.end()) {
            PlacePtr local_place = struct_state_.displayed_places[iterator_index->second];
            ui_queue_.post([callback = std::move(callback), local_place = std::move(local_place)]() { callback(local_place); });
            return;
        }
    }

    std::future<PlacePtr> future_place;
    try {
        future_place = database_.fetch_place(key);
    } catch (const std::exception& exc) {
        logger_->warn(R"({{"component":"place_store","action":"place_for_key","key":"{}","error":"{}"}})", key, exc.what());
        ui_queue_.post([callback = std::move(callback)]() { callback(nullptr); });
        return;
    }
    auto shared_place = std::make_shared<std::future<PlacePtr>>(std::move(future_place));
    worker_pool_.submit([this_logger = logger_, key, shared_place, callback = std::move(callback), &ui_queue = ui_queue_]() {
        PlacePtr place{};
        try {
            if (shared_place->valid()) {
                place = shared_place->get();
            }
        } catch (const std::exception& exc) {
            this_logger->warn(R"({{"component":"place_store","action":"place_for_key","key":"{}","error":"{}"}})", key, exc.what());
        }
        ui_queue.post([callback, place = std::move(place)]() { callback(place); });
    });
}

PlacePtr PlaceStore::next_place(const Place& place) const {
    std::shared_lock lock(state_mutex_);
    const PlaceList& displayed = struct_state_.displayed_places;
    const auto iterator_index = struct_state_.map_displayed_index.find(place.id);
    if (iterator_index == struct_state_.map_displayed_index.end()) {
        return displayed.empty() ? nullptr : displayed.front();
    }
    const std::size_t next_index = iterator_index->second + 1;
    if (next_index >= displayed.size()) {
        return nullptr;
    }
    return displayed[next_index];
}

PlacePtr PlaceStore::previous_place(const Place& place) const {
    std::shared_lock lock(state_mutex_);
    const auto iterator_index = struct_state_.map_displayed_index.find(place.id);
    if (iterator_index == struct_state_.map_displayed_index.end() || iterator_index->second == 0) {
        return nullptr;
    }
    return struct_state_.displayed_places[iterator_index->second - 1];
}

std::size_t PlaceStore::count() const {
    std::shared_lock lock(state_mutex_);
    return struct_state_.displayed_places.size();
}

std::optional<std::size_t> PlaceStore::index_of(const Place& place) const {
    std::shared_lock lock(state_mutex_);
    const auto iterator_index = struct_state_.map_displayed_index.find(place.id);
    if (iterator_index == struct_state_.map_displayed_index.end()) {
        return std::nullopt;
    }
    return iterator_index->second;
}

PlaceSnapshot PlaceStore::snapshot() const {
    std::shared_lock lock(state_mutex_);
    return PlaceSnapshot{struct_state_.all_places, struct_state_.displayed_places};
}

FilterSet PlaceStore::filters() const {
    std::shared_lock lock(state_mutex_);
    return struct_state_.filters;
}

PlaceList PlaceStore::collect_places(const GeoCoordinate& location) {
    std::future<std::vector<PlaceFetch>> future_places;
    std::future<std::vector<Event>> future_events;
    try {
        future_places = database_.fetch_places(location, config_.search_radius_km);
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"place_store","action":"fetch_places","error":"{}"}})", exc.what());
    }
    try {
        future_events = events_provider_.search_events(location);
    } catch (const std::exception& exc) {
        logger_->warn(R"({{"component":"place_store","action":"search_events","error":"{}"}})", exc.what());
    }

    PlaceList places{};
    try {
        std::vector<PlaceFetch> fetched = future_places.valid() ? future_places.get() : std::vector<PlaceFetch>{};
        places.reserve(fetched.size());
        std::size_t failed_count = 0;
        for (PlaceFetch& record : fetched) {
            if (!record.ok()) {
                ++failed_count;
                logger_->debug("Skipping place record: {}", record.error_message);
                continue;
            }
            places.push_back(std::move(record.place));
        }
        if (failed_count > 0) {
            logger_->warn(R"({{"component":"place_store","action":"fetch_places","failed_records":{}}})", failed_count);
        }
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"place_store","action":"fetch_places","error":"{}"}})", exc.what());
    }

    const auto events_wait = std::chrono::duration_cast<SteadyClock::duration>(config_.events_timeout);
    if (!future_events.valid()) {
        return places;
    }
    if (future_events.wait_for(events_wait) != std::future_status::ready) {
        logger_->warn(R"({{"component":"place_store","action":"search_events","error":"timed out after {}s"}})",
                      config_.events_timeout.count());
        return places;
    }
    try {
        const std::vector<Event> events = future_events.get();
        for (const Event& event : events) {
            places.push_back(to_place(event));
        }
        logger_->info("Fetched {} places including {} events", places.size(), events.size());
    } catch (const std::exception& exc) {
        logger_->warn(R"({{"component":"place_store","action":"search_events","error":"{}"}})", exc.what());
    }
    return places;
}

void PlaceStore::display_places(PlaceList places, const GeoCoordinate& location) {
    // Fetch the subset the user sees first ahead of the full sort so its
    // travel times are cached before the rest of the batch competes for them.
    const FilterSet current_filters = filters();
    const PlaceList visible_places = filter_places(places, current_filters.enabled_filters, config_.clock());
    ranker_.prefetch(visible_places, location);

    std::weak_ptr<PlaceStore> weak_self = weak_from_this();
    ranker_.rank(std::move(places), location, true, [weak_self](PlaceList ranked_places) {
        if (std::shared_ptr<PlaceStore> self = weak_self.lock(); self != nullptr) {
            self->apply_ranked_places(std::move(ranked_places));
        }
    });
}

void PlaceStore::commit(const Mutation& mutation) {
    std::scoped_lock order_lock(commit_order_mutex_);
    PlaceList displayed_places{};
    {
        std::unique_lock lock(state_mutex_);
        if (!mutation(struct_state_)) {
            return;
        }
        displayed_places = struct_state_.displayed_places;
    }
    publish(std::move(displayed_places));
}

void PlaceStore::publish(PlaceList displayed_places) {
    std::weak_ptr<PlaceStoreDelegate> delegate;
    {
        std::scoped_lock lock(delegate_mutex_);
        delegate = delegate_;
    }
    logger_->debug("Publishing {} displayed places", displayed_places.size());
    ui_queue_.post([delegate = std::move(delegate), displayed_places = std::move(displayed_places)]() {
        if (std::shared_ptr<PlaceStoreDelegate> listener = delegate.lock(); listener != nullptr) {
            listener->on_places_updated(displayed_places);
        }
    });
}

PlaceList PlaceStore::compute_displayed(const PlaceState& state) const {
    PlaceList filtered = filter_places(state.all_places, state.filters.enabled_filters, config_.clock());
    if (state.filters.top_rated_only) {
        return rank_by_top_rated(filtered);
    }
    return filtered;
}

void PlaceStore::assign_displayed(PlaceState& state, PlaceList displayed_places) {
    std::unordered_map<std::string, std::size_t> map_index{};
    map_index.reserve(displayed_places.size());
    for (std::size_t index = 0; index < displayed_places.size(); ++index) {
        map_index.insert_or_assign(displayed_places[index]->id, index);
    }
    state.displayed_places = std::move(displayed_places);
    state.map_displayed_index = std::move(map_index);
}

}  // namespace place_discovery
