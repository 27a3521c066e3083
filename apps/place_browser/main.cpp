#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "demo_catalog.hpp"
#include "place_discovery/configuration.hpp"
#include "place_discovery/dispatch_queue.hpp"
#include "place_discovery/logging.hpp"
#include "place_discovery/place_presentation.hpp"
#include "place_discovery/place_store.hpp"
#include "place_discovery/ranking.hpp"
#include "place_discovery/travel_time_cache.hpp"
#include "place_discovery/travel_time_slot.hpp"
#include "place_discovery/worker_pool.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

constexpr place_discovery::GeoCoordinate k_demo_origin{37.7749, -122.4194};
constexpr place_discovery::Duration k_poll_interval{0.1};

/** @brief Logs every published list and remembers how many arrived. */
class LoggingDelegate final : public place_discovery::PlaceStoreDelegate {
  public:
    void on_places_updated(const place_discovery::PlaceList& displayed_places) override {
        auto logger = place_discovery::get_logger();
        logger->info("Displayed places updated ({} entries)", displayed_places.size());
        for (const place_discovery::PlacePtr& place : displayed_places) {
            const place_discovery::ReviewSummary reviews =
                place_discovery::describe_reviews(place->provider(place_discovery::k_provider_yelp));
            logger->info("  {} [{}] {}", place->name, place_discovery::category_label(place->categories), reviews.label);
        }
        ++update_count;
    }

    int update_count{};
};

/** @brief Collaborators and pipeline wired together for one browsing session. */
struct BrowserSession final {
    explicit BrowserSession(const place_discovery::Configuration& configuration)
        : worker_pool(configuration.worker_threads),
          cache(backend, configuration.travel_time.cache_reuse_radius_m),
          ranker(cache, worker_pool, configuration.travel_time.batch_timeout),
          store(std::make_shared<place_discovery::PlaceStore>(configuration.store, database, events_provider, ranker, worker_pool, ui_queue)) {}

    // Background tasks reference the cache and ranker, so the pool must stop first.
    ~BrowserSession() {
        worker_pool.shutdown();
    }

    place_discovery::demo::DemoPlaceDatabase database{};
    place_discovery::demo::DemoEventsProvider events_provider{};
    place_discovery::demo::StraightLineTravelTimeBackend backend{};
    place_discovery::DispatchQueue ui_queue{};
    place_discovery::WorkerPool worker_pool;
    place_discovery::TravelTimeCache cache;
    place_discovery::TravelTimeRanker ranker;
    std::shared_ptr<place_discovery::PlaceStore> store;
};

/** @brief Drain the UI queue until @p delegate has seen @p expected updates. */
bool pump_until(place_discovery::DispatchQueue& ui_queue, const LoggingDelegate& delegate, int expected) {
    const auto deadline = place_discovery::SteadyClock::now() + std::chrono::seconds{30};
    while (delegate.update_count < expected && !should_terminate.load()) {
        if (place_discovery::SteadyClock::now() > deadline) {
            return false;
        }
        if (ui_queue.wait_for_pending(k_poll_interval)) {
            ui_queue.run_pending();
        }
    }
    return delegate.update_count >= expected;
}
}  // namespace

int main() {
    using namespace place_discovery;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }
        auto logger = get_logger();
        if (const auto path_log_file = log_file_path(); path_log_file.has_value()) {
            logger->info("Writing logs to {}", path_log_file->string());
        }

        BrowserSession session{configuration};
        DispatchQueue& ui_queue = session.ui_queue;
        const std::shared_ptr<PlaceStore>& store = session.store;
        auto delegate = std::make_shared<LoggingDelegate>();
        store->set_delegate(delegate);

        store->update_from_location(k_demo_origin);
        if (!pump_until(ui_queue, *delegate, 1)) {
            logger->error("No places arrived before the deadline");
            return EXIT_FAILURE;
        }

        if (store->count() > 0) {
            const PlacePtr first = store->place_at_index(0);
            const PlacePtr second = store->next_place(*first);
            logger->info("First place {} is followed by {}", first->name, second == nullptr ? "nothing" : second->name);

            auto slot = std::make_shared<TravelTimeSlot>();
            request_travel_time_display(slot, *first, k_demo_origin, session.cache, session.worker_pool, ui_queue, configuration.travel_time.batch_timeout);
            if (slot->display().kind == TravelTimeDisplayKind::Loading
                && ui_queue.wait_for_pending(configuration.travel_time.batch_timeout)) {
                ui_queue.run_pending();
            }
            const TravelTimeDisplay display = slot->display();
            logger->info("Travel time for {}: {} minutes", first->name, display.duration_minutes.value_or(0));
        }

        FilterSet filters{};
        filters.enabled_filters = {PlaceFilter::Discover, PlaceFilter::EatAndDrink, PlaceFilter::LocalEvents};
        filters.top_rated_only = true;
        store->refresh(filters);
        if (!pump_until(ui_queue, *delegate, 2)) {
            logger->warn("Filter refresh was not published");
        }

        store->clear_delegate();
        session.worker_pool.shutdown();
        ui_queue.run_pending();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
