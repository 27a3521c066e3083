// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings. The
// search radius normally comes from remote configuration; the environment
// variable stands in for it here so the store stays independent of how the
// value was delivered.
//
// Responsibilities
// - Enforce defaults and positive bounds for radius, timeouts and pool size.
// - Surface clear diagnostics via the logging subsystem whenever input cannot
//   be parsed.
// - Shield the rest of the codebase from `std::getenv` lookups.

#include "place_discovery/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "place_discovery/logging.hpp"
#include "place_discovery/version.hpp"

namespace place_discovery {

namespace {
constexpr double k_default_search_radius_km{4.0};
constexpr double k_default_travel_time_timeout_s{5.0};
constexpr double k_default_events_timeout_s{10.0};
constexpr double k_default_cache_reuse_radius_m{100.0};
constexpr int k_default_worker_threads{4};
constexpr std::string_view k_default_log_directory{"logs"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::string parse_string(const char* raw_value, std::string_view fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string(std::getenv("PLACE_DISCOVERY_LOG_DIR"), k_default_log_directory);
    config.log_level = parse_string(std::getenv("PLACE_DISCOVERY_LOG_LEVEL"), "");

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading place_discovery {} configuration from environment", k_version);

    config.store.search_radius_km = load_search_radius_km();
    config.store.events_timeout = Duration{
        parse_double(std::getenv("PLACE_DISCOVERY_EVENTS_TIMEOUT_S"), k_default_events_timeout_s)
    };
    config.travel_time.batch_timeout = Duration{
        parse_double(std::getenv("PLACE_DISCOVERY_TRAVEL_TIME_TIMEOUT_S"), k_default_travel_time_timeout_s)
    };
    config.travel_time.cache_reuse_radius_m =
        parse_double(std::getenv("PLACE_DISCOVERY_CACHE_REUSE_RADIUS_M"), k_default_cache_reuse_radius_m);
    config.worker_threads = static_cast<std::size_t>(
        parse_int(std::getenv("PLACE_DISCOVERY_WORKER_THREADS"), k_default_worker_threads)
    );

    logger->info("Configuration loaded: search_radius_km={} travel_time_timeout_s={} events_timeout_s={} worker_threads={}",
                 config.store.search_radius_km,
                 config.travel_time.batch_timeout.count(),
                 config.store.events_timeout.count(),
                 config.worker_threads);

    return config;
}

double ConfigurationLoader::load_search_radius_km() {
    return parse_double(std::getenv("PLACE_DISCOVERY_SEARCH_RADIUS_KM"), k_default_search_radius_km);
}

}  // namespace place_discovery
