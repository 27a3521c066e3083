#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "place_discovery/place_store.hpp"
#include "test_doubles.hpp"

using namespace place_discovery;
using namespace place_discovery::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    place_discovery::test::ensure_logger_initialized();
    return true;
}();

constexpr GeoCoordinate k_origin{51.5074, -0.1278};
constexpr Duration k_wait{5.0};

// Monday 2024-01-01 12:00 UTC.
const WallTime k_fixed_now = WallTime{std::chrono::seconds{1'704'110'400}};

std::vector<std::string> ids_of(const PlaceList& places) {
    std::vector<std::string> ids{};
    for (const PlacePtr& place : places) {
        ids.push_back(place->id);
    }
    return ids;
}

PlaceStoreConfig test_config() {
    PlaceStoreConfig config{};
    config.search_radius_km = 2.5;
    config.events_timeout = Duration{1.0};
    config.clock = []() { return k_fixed_now; };
    return config;
}

class RecordingDelegate final : public PlaceStoreDelegate {
  public:
    void on_places_updated(const PlaceList& displayed_places) override {
        std::scoped_lock lock(mutex_);
        list_updates_.push_back(ids_of(displayed_places));
    }

    std::size_t update_count() const {
        std::scoped_lock lock(mutex_);
        return list_updates_.size();
    }

    std::vector<std::string> last_update() const {
        std::scoped_lock lock(mutex_);
        return list_updates_.empty() ? std::vector<std::string>{} : list_updates_.back();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> list_updates_{};
};

/** @brief Store with fake collaborators; stops the pool before the rest goes away. */
struct StoreHarness final {
    explicit StoreHarness(PlaceStoreConfig config = test_config())
        : cache(backend, 100.0),
          worker_pool(2),
          ranker(cache, worker_pool, Duration{0.2}),
          store(std::make_shared<PlaceStore>(std::move(config), database, events, ranker, worker_pool, ui_queue)),
          delegate(std::make_shared<RecordingDelegate>()) {
        store->set_delegate(delegate);
    }

    ~StoreHarness() {
        worker_pool.shutdown();
    }

    /** @brief Run the UI queue until the delegate has seen @p expected updates. */
    void pump_until(std::size_t expected) {
        const auto deadline = SteadyClock::now() + std::chrono::seconds{10};
        while (delegate->update_count() < expected && SteadyClock::now() < deadline) {
            if (ui_queue.wait_for_pending(Duration{0.05})) {
                ui_queue.run_pending();
            }
        }
        REQUIRE(delegate->update_count() >= expected);
    }

    FakePlaceDatabase database{};
    FakeEventsProvider events{};
    ManualTravelTimeBackend backend{};
    TravelTimeCache cache;
    DispatchQueue ui_queue{};
    WorkerPool worker_pool;
    TravelTimeRanker ranker;
    std::shared_ptr<PlaceStore> store;
    std::shared_ptr<RecordingDelegate> delegate;
};

Event make_event(const std::string& id, const GeoCoordinate& coordinate) {
    Event event{};
    event.id = id;
    event.name = id;
    event.coordinate = coordinate;
    event.categories = {"festivals"};
    return event;
}

/** @brief restaurant (EatAndDrink), museum and landmark (Discover), and one event. */
PlaceList mixed_places() {
    return PlaceList{
        make_place("restaurant", north_of(k_origin, 100.0), {"restaurants"}),
        make_place("museum", north_of(k_origin, 200.0), {"arts"}),
        make_place("landmark", north_of(k_origin, 300.0), {"landmarks"}),
        to_place(make_event("fair", north_of(k_origin, 400.0))),
    };
}
}  // namespace

TEST_CASE("place_at_index returns displayed places and rejects out-of-range indices") {
    StoreHarness harness{};
    harness.store->apply_ranked_places(mixed_places());

    REQUIRE(harness.store->count() == 3);
    REQUIRE(harness.store->place_at_index(0)->id == "museum");
    REQUIRE(harness.store->place_at_index(2)->id == "proxevent-fair");
    REQUIRE_THROWS_AS(harness.store->place_at_index(3), PlaceNotFoundError);
    REQUIRE_THROWS_WITH(harness.store->place_at_index(3), "There is no place at index: 3");
    REQUIRE_THROWS_AS(harness.store->place_at_index(3), std::out_of_range);
}

TEST_CASE("index_of is the inverse of place_at_index") {
    StoreHarness harness{};
    const PlaceList places = mixed_places();
    harness.store->apply_ranked_places(places);

    for (std::size_t index = 0; index < harness.store->count(); ++index) {
        REQUIRE(harness.store->index_of(*harness.store->place_at_index(index)) == index);
    }
    REQUIRE_FALSE(harness.store->index_of(*places.front()).has_value());
}

TEST_CASE("next_place and previous_place walk the displayed list") {
    StoreHarness harness{};
    const PlaceList places = mixed_places();
    const PlacePtr& restaurant = places[0];
    const PlacePtr& museum = places[1];
    const PlacePtr& landmark = places[2];
    const PlacePtr& fair = places[3];

    SECTION("empty store has no neighbours") {
        REQUIRE(harness.store->next_place(*museum) == nullptr);
        REQUIRE(harness.store->previous_place(*museum) == nullptr);
    }

    SECTION("neighbours within the list") {
        harness.store->apply_ranked_places(places);
        REQUIRE(harness.store->next_place(*museum)->id == "landmark");
        REQUIRE(harness.store->next_place(*landmark)->id == "proxevent-fair");
        REQUIRE(harness.store->next_place(*fair) == nullptr);
        REQUIRE(harness.store->previous_place(*museum) == nullptr);
        REQUIRE(harness.store->previous_place(*landmark)->id == "museum");
    }

    SECTION("a place that is not displayed") {
        harness.store->apply_ranked_places(places);
        REQUIRE(harness.store->next_place(*restaurant)->id == "museum");
        REQUIRE(harness.store->previous_place(*restaurant) == nullptr);
    }
}

TEST_CASE("refresh re-filters the current places without fetching") {
    StoreHarness harness{};
    harness.store->apply_ranked_places(mixed_places());

    FilterSet eat_and_drink{};
    eat_and_drink.enabled_filters = {PlaceFilter::EatAndDrink};
    harness.store->refresh(eat_and_drink);

    REQUIRE(ids_of(harness.store->snapshot().displayed_places) == std::vector<std::string>{"restaurant"});
    REQUIRE(harness.store->snapshot().all_places.size() == 4);
    REQUIRE(harness.store->filters().enabled_filters == std::set<PlaceFilter>{PlaceFilter::EatAndDrink});
    REQUIRE(harness.database.fetch_count == 0);

    harness.pump_until(2);
    REQUIRE(harness.delegate->last_update() == std::vector<std::string>{"restaurant"});
}

TEST_CASE("top-rated mode orders the displayed places by composite score") {
    StoreHarness harness{};
    const PlaceList places{
        make_place("modest", north_of(k_origin, 100.0), {"arts"}, 3.0, 10),
        make_place("unrated", north_of(k_origin, 200.0), {"arts"}),
        make_place("acclaimed", north_of(k_origin, 300.0), {"arts"}, 5.0, 100),
    };
    harness.store->apply_ranked_places(places);

    FilterSet top_rated{};
    top_rated.top_rated_only = true;
    harness.store->refresh(top_rated);

    const PlaceSnapshot snapshot = harness.store->snapshot();
    REQUIRE(ids_of(snapshot.displayed_places) == std::vector<std::string>{"acclaimed", "modest", "unrated"});
    REQUIRE(ids_of(snapshot.all_places) == std::vector<std::string>{"modest", "unrated", "acclaimed"});
}

TEST_CASE("sort_by_location re-orders by distance unless top-rated mode is on") {
    StoreHarness harness{};
    const PlaceList places{
        make_place("far", north_of(k_origin, 900.0), {"arts"}, 5.0, 50),
        make_place("near", north_of(k_origin, 100.0), {"arts"}, 2.0, 5),
    };
    harness.store->apply_ranked_places(places);
    harness.pump_until(1);

    SECTION("distance mode") {
        harness.store->sort_by_location(k_origin);
        REQUIRE(ids_of(harness.store->snapshot().displayed_places) == std::vector<std::string>{"near", "far"});
        harness.pump_until(2);
        REQUIRE(harness.delegate->last_update() == std::vector<std::string>{"near", "far"});
    }

    SECTION("top-rated mode leaves the order alone and does not notify") {
        FilterSet top_rated{};
        top_rated.top_rated_only = true;
        harness.store->refresh(top_rated);
        harness.pump_until(2);

        harness.store->sort_by_location(k_origin);
        REQUIRE(harness.ui_queue.pending_count() == 0);
        REQUIRE(ids_of(harness.store->snapshot().displayed_places) == std::vector<std::string>{"far", "near"});
        REQUIRE(harness.delegate->update_count() == 2);
    }
}

TEST_CASE("apply_ranked_places drops repeated ids") {
    ScopedLogCapture capture{};
    StoreHarness harness{};
    const PlacePtr museum = make_place("museum", north_of(k_origin, 100.0), {"arts"});
    harness.store->apply_ranked_places(PlaceList{museum, nullptr, museum});
    REQUIRE(harness.store->count() == 1);
    REQUIRE(harness.store->snapshot().all_places.size() == 1);
    REQUIRE(capture.contains(R"({"component":"place_store","action":"apply_ranked_places","dropped_duplicates":2})"));
}

TEST_CASE("the delegate hears each commit once and nothing after it leaves") {
    StoreHarness harness{};
    harness.store->apply_ranked_places(mixed_places());
    harness.store->refresh(FilterSet{});
    REQUIRE(harness.delegate->update_count() == 0);

    REQUIRE(harness.ui_queue.run_pending() == 2);
    REQUIRE(harness.delegate->update_count() == 2);

    SECTION("cleared delegate") {
        harness.store->clear_delegate();
        harness.store->refresh(FilterSet{});
        harness.ui_queue.run_pending();
        REQUIRE(harness.delegate->update_count() == 2);
    }

    SECTION("expired delegate") {
        auto transient = std::make_shared<RecordingDelegate>();
        harness.store->set_delegate(transient);
        harness.store->refresh(FilterSet{});
        transient.reset();
        REQUIRE(harness.ui_queue.run_pending() == 1);
        REQUIRE(harness.delegate->update_count() == 2);
    }
}

TEST_CASE("update_from_location fetches, merges events and ranks by walking time") {
    StoreHarness harness{};
    harness.database.set_places(PlaceList{
        make_place("near", north_of(k_origin, 200.0), {"arts"}),
        make_place("far", north_of(k_origin, 1'500.0), {"landmarks"}),
        make_place("diner", north_of(k_origin, 300.0), {"restaurants"}),
    });
    harness.database.records.push_back(PlaceFetch{nullptr, "malformed record"});
    harness.events.events = {make_event("fair", north_of(k_origin, 50.0))};
    // Faster to walk to the far place than to the near one.
    harness.backend.answer_immediately("near", walking(900.0));
    harness.backend.answer_immediately("far", walking(300.0));
    harness.backend.answer_immediately("diner", walking(400.0));

    harness.store->update_from_location(k_origin);
    harness.pump_until(1);

    REQUIRE(harness.database.last_radius_km == Approx(2.5));
    REQUIRE(harness.delegate->last_update() == std::vector<std::string>{"far", "near", "proxevent-fair"});
    const PlaceSnapshot snapshot = harness.store->snapshot();
    REQUIRE(ids_of(snapshot.all_places) == std::vector<std::string>{"far", "diner", "near", "proxevent-fair"});
}

TEST_CASE("update_from_location proceeds without events that fail or stall") {
    PlaceStoreConfig config = test_config();
    config.events_timeout = Duration{0.1};
    StoreHarness harness{config};
    harness.database.set_places(PlaceList{make_place("museum", north_of(k_origin, 200.0), {"arts"})});
    harness.backend.answer_immediately("museum", walking(120.0));

    SECTION("events fail") {
        harness.events.mode = FakeEventsProvider::Mode::Fail;
    }

    SECTION("events never answer") {
        harness.events.mode = FakeEventsProvider::Mode::Hang;
    }

    harness.store->update_from_location(k_origin);
    harness.pump_until(1);
    REQUIRE(harness.delegate->last_update() == std::vector<std::string>{"museum"});
}

TEST_CASE("a failed places query commits an empty list") {
    ScopedLogCapture capture{};
    StoreHarness harness{};
    harness.store->apply_ranked_places(mixed_places());
    harness.pump_until(1);

    harness.database.fail_places = true;
    harness.store->update_from_location(k_origin);
    harness.pump_until(2);

    REQUIRE(harness.delegate->last_update().empty());
    REQUIRE(harness.store->count() == 0);
    REQUIRE(capture.contains(R"({"component":"place_store","action":"fetch_places","error":"database unavailable"})"));
}

TEST_CASE("update_from_location requires shared ownership") {
    FakePlaceDatabase database{};
    FakeEventsProvider events{};
    ManualTravelTimeBackend backend{};
    TravelTimeCache cache{backend, 100.0};
    DispatchQueue ui_queue{};
    WorkerPool worker_pool{1};
    TravelTimeRanker ranker{cache, worker_pool, Duration{0.2}};
    PlaceStore unowned{test_config(), database, events, ranker, worker_pool, ui_queue};

    REQUIRE_THROWS_AS(unowned.update_from_location(k_origin), std::logic_error);
    worker_pool.shutdown();
}

TEST_CASE("place_for_key answers locally or through the database") {
    StoreHarness harness{};
    const PlaceList places = mixed_places();
    harness.store->apply_ranked_places(places);
    harness.database.set_places(places);
    harness.ui_queue.run_pending();

    std::optional<PlacePtr> optional_result{};
    const auto record = [&optional_result](PlacePtr place) { optional_result = std::move(place); };
    const auto wait_for_result = [&]() {
        const auto deadline = SteadyClock::now() + std::chrono::seconds{5};
        while (!optional_result.has_value() && SteadyClock::now() < deadline) {
            if (harness.ui_queue.wait_for_pending(Duration{0.05})) {
                harness.ui_queue.run_pending();
            }
        }
        REQUIRE(optional_result.has_value());
    };

    SECTION("displayed place") {
        harness.store->place_for_key("museum", record);
        REQUIRE_FALSE(optional_result.has_value());
        REQUIRE(harness.ui_queue.run_pending() == 1);
        REQUIRE((*optional_result)->id == "museum");
    }

    SECTION("place outside the displayed list") {
        harness.store->place_for_key("restaurant", record);
        wait_for_result();
        REQUIRE(*optional_result != nullptr);
        REQUIRE((*optional_result)->id == "restaurant");
    }

    SECTION("unknown key") {
        harness.store->place_for_key("nowhere", record);
        wait_for_result();
        REQUIRE(*optional_result == nullptr);
    }
}

TEST_CASE("readers never observe a torn state while writers commit") {
    StoreHarness harness{};
    const PlaceList list_a{
        make_place("a1", north_of(k_origin, 100.0), {"arts"}),
        make_place("a2", north_of(k_origin, 200.0), {"restaurants"}),
        make_place("a3", north_of(k_origin, 300.0), {"landmarks"}),
        make_place("a4", north_of(k_origin, 400.0), {"shopping"}),
    };
    const PlaceList list_b{
        make_place("b1", north_of(k_origin, 100.0), {"libraries"}),
        make_place("b2", north_of(k_origin, 200.0), {"shopping"}),
    };
    // Location updates commit list_a again; walking times keep its order.
    harness.database.set_places(list_a);
    for (std::size_t index = 0; index < list_a.size(); ++index) {
        harness.backend.answer_immediately(list_a[index]->id, walking(60.0 * static_cast<double>(index + 1)));
    }

    FilterSet narrow_filters{};
    FilterSet wide_filters{};
    wide_filters.enabled_filters = {PlaceFilter::Discover, PlaceFilter::EatAndDrink, PlaceFilter::Shop, PlaceFilter::LocalEvents};
    const std::vector<std::vector<std::string>> list_valid_a{{"a1", "a3"}, {"a1", "a2", "a3", "a4"}};
    const std::vector<std::vector<std::string>> list_valid_b{{"b1"}, {"b1", "b2"}};

    constexpr int k_commits_per_writer{200};
    constexpr int k_refreshes{100};
    constexpr int k_location_updates{10};

    std::atomic<bool> writers_done{false};
    std::atomic<int> torn_reads{0};
    std::vector<std::thread> readers{};
    for (int reader = 0; reader < 4; ++reader) {
        readers.emplace_back([&]() {
            while (!writers_done.load()) {
                const PlaceSnapshot snapshot = harness.store->snapshot();
                if (snapshot.all_places.empty()) {
                    continue;
                }
                const std::vector<std::string> all_ids = ids_of(snapshot.all_places);
                const std::vector<std::string> displayed_ids = ids_of(snapshot.displayed_places);
                const bool is_list_a = all_ids == ids_of(list_a);
                if (!is_list_a && all_ids != ids_of(list_b)) {
                    ++torn_reads;
                    continue;
                }
                const auto& list_valid = is_list_a ? list_valid_a : list_valid_b;
                if (std::find(list_valid.begin(), list_valid.end(), displayed_ids) == list_valid.end()) {
                    ++torn_reads;
                }
            }
        });
    }

    std::thread writer_a([&]() {
        for (int commit = 0; commit < k_commits_per_writer; ++commit) {
            harness.store->apply_ranked_places(list_a);
        }
    });
    std::thread writer_b([&]() {
        for (int commit = 0; commit < k_commits_per_writer; ++commit) {
            harness.store->apply_ranked_places(list_b);
        }
    });
    std::thread writer_filters([&]() {
        for (int commit = 0; commit < k_refreshes; ++commit) {
            harness.store->refresh(commit % 2 == 0 ? wide_filters : narrow_filters);
        }
    });
    std::thread writer_location([&]() {
        for (int update = 0; update < k_location_updates; ++update) {
            harness.store->update_from_location(k_origin);
        }
    });
    writer_a.join();
    writer_b.join();
    writer_filters.join();
    writer_location.join();

    writers_done.store(true);
    for (std::thread& reader : readers) {
        reader.join();
    }

    // Location updates commit from the worker pool after their writer returns.
    const std::size_t expected_commits = 2 * k_commits_per_writer + k_refreshes + k_location_updates;
    harness.pump_until(expected_commits);

    REQUIRE(torn_reads.load() == 0);
    REQUIRE(harness.ui_queue.run_pending() == 0);
    REQUIRE(harness.delegate->update_count() == expected_commits);
}
