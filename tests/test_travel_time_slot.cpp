#include <chrono>
#include <memory>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "place_discovery/travel_time_slot.hpp"
#include "test_doubles.hpp"

using namespace place_discovery;
using namespace place_discovery::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    place_discovery::test::ensure_logger_initialized();
    return true;
}();

constexpr GeoCoordinate k_origin{48.8566, 2.3522};
constexpr Duration k_wait{2.0};

TravelTimes times(std::optional<double> walking_s, std::optional<double> driving_s) {
    TravelTimes travel_times{};
    travel_times.walking_time_s = walking_s;
    travel_times.driving_time_s = driving_s;
    return travel_times;
}

struct SlotHarness final {
    SlotHarness()
        : cache(backend, 100.0),
          worker_pool(2) {}

    ~SlotHarness() {
        worker_pool.shutdown();
    }

    /** @brief Wait for the worker to post, then run the UI queue. */
    void pump() {
        REQUIRE(ui_queue.wait_for_pending(k_wait));
        ui_queue.run_pending();
    }

    ManualTravelTimeBackend backend{};
    TravelTimeCache cache;
    DispatchQueue ui_queue{};
    WorkerPool worker_pool;
};
}  // namespace

TEST_CASE("classify_travel_times picks the display for a result") {
    REQUIRE(classify_travel_times(std::nullopt).kind == TravelTimeDisplayKind::NoData);
    REQUIRE(classify_travel_times(times(60.0, 30.0)).kind == TravelTimeDisplayKind::UserHere);

    const TravelTimeDisplay walking_display = classify_travel_times(times(600.0, 200.0));
    REQUIRE(walking_display.kind == TravelTimeDisplayKind::WalkingDistance);
    REQUIRE(walking_display.duration_minutes == 10);

    const TravelTimeDisplay driving_display = classify_travel_times(times(3'600.0, 900.0));
    REQUIRE(driving_display.kind == TravelTimeDisplayKind::DrivingDistance);
    REQUIRE(driving_display.duration_minutes == 15);

    REQUIRE(classify_travel_times(times(3'600.0, std::nullopt)).kind == TravelTimeDisplayKind::NoData);
    REQUIRE(classify_travel_times(times(std::nullopt, 420.0)).kind == TravelTimeDisplayKind::DrivingDistance);
}

TEST_CASE("TravelTimeSlot drops results for an older binding") {
    TravelTimeSlot slot{};
    const TravelTimeSlot::Generation first = slot.bind("cafe");
    const TravelTimeSlot::Generation second = slot.bind("bakery");

    REQUIRE_FALSE(slot.is_current(first));
    REQUIRE(slot.is_current(second));
    REQUIRE_FALSE(slot.apply(first, TravelTimeDisplay{TravelTimeDisplayKind::WalkingDistance, 5}));
    REQUIRE(slot.display().kind == TravelTimeDisplayKind::Loading);
    REQUIRE(slot.apply(second, TravelTimeDisplay{TravelTimeDisplayKind::WalkingDistance, 7}));
    REQUIRE(slot.display().duration_minutes == 7);
    REQUIRE(slot.place_id() == std::optional<std::string>{"bakery"});

    slot.reset();
    REQUIRE_FALSE(slot.apply(second, TravelTimeDisplay{TravelTimeDisplayKind::NoData, std::nullopt}));
    REQUIRE_FALSE(slot.place_id().has_value());
}

TEST_CASE("request_travel_time_display applies cached results immediately") {
    SlotHarness harness{};
    const PlacePtr place = make_place("louvre", north_of(k_origin, 400.0));
    harness.backend.answer_immediately("louvre", times(480.0, 120.0));
    auto slot = std::make_shared<TravelTimeSlot>();

    request_travel_time_display(slot, *place, k_origin, harness.cache, harness.worker_pool, harness.ui_queue, k_wait);

    REQUIRE(slot->display().kind == TravelTimeDisplayKind::WalkingDistance);
    REQUIRE(slot->display().duration_minutes == 8);
    REQUIRE(harness.ui_queue.pending_count() == 0);
    REQUIRE(harness.backend.last_modes == TransitModeList{TransitMode::Walking, TransitMode::Driving});
}

TEST_CASE("request_travel_time_display applies late results on the UI queue") {
    SlotHarness harness{};
    const PlacePtr place = make_place("orsay", north_of(k_origin, 900.0));
    auto slot = std::make_shared<TravelTimeSlot>();

    request_travel_time_display(slot, *place, k_origin, harness.cache, harness.worker_pool, harness.ui_queue, k_wait);
    REQUIRE(slot->display().kind == TravelTimeDisplayKind::Loading);

    harness.backend.resolve("orsay", times(1'200.0, 300.0));
    harness.pump();
    REQUIRE(slot->display().kind == TravelTimeDisplayKind::WalkingDistance);
    REQUIRE(slot->display().duration_minutes == 20);
}

TEST_CASE("request_travel_time_display discards results once the slot is reused") {
    SlotHarness harness{};
    const PlacePtr first = make_place("first", north_of(k_origin, 900.0));
    const PlacePtr second = make_place("second", north_of(k_origin, 1'900.0));
    auto slot = std::make_shared<TravelTimeSlot>();

    request_travel_time_display(slot, *first, k_origin, harness.cache, harness.worker_pool, harness.ui_queue, k_wait);
    request_travel_time_display(slot, *second, k_origin, harness.cache, harness.worker_pool, harness.ui_queue, k_wait);

    harness.backend.resolve("first", times(60.0, 30.0));
    harness.pump();
    REQUIRE(slot->place_id() == std::optional<std::string>{"second"});
    REQUIRE(slot->display().kind == TravelTimeDisplayKind::Loading);

    harness.backend.resolve("second", times(std::nullopt, 600.0));
    harness.pump();
    REQUIRE(slot->display().kind == TravelTimeDisplayKind::DrivingDistance);
    REQUIRE(slot->display().duration_minutes == 10);
}

TEST_CASE("request_travel_time_display shows no data when the fetch never answers") {
    SlotHarness harness{};
    const PlacePtr place = make_place("stuck", north_of(k_origin, 900.0));
    auto slot = std::make_shared<TravelTimeSlot>();

    request_travel_time_display(slot, *place, k_origin, harness.cache, harness.worker_pool, harness.ui_queue, Duration{0.1});
    harness.pump();
    REQUIRE(slot->display().kind == TravelTimeDisplayKind::NoData);
}
