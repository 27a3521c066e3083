#include "place_discovery/logging.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace place_discovery {

namespace {
constexpr const char* k_logger_name{"place_discovery"};
constexpr const char* k_log_file_name{"place_discovery.log"};
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};

std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
std::optional<std::filesystem::path> optional_log_file;

// Worker and UI-queue lines are told apart by the thread id.
spdlog::sink_ptr make_console_sink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%l] [%t] %v");
    return sink;
}

spdlog::sink_ptr make_file_sink(const std::filesystem::path& path_log_file) {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path_log_file.string(), k_max_file_size_bytes, k_max_files);
    sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})");
    return sink;
}

std::filesystem::path prepare_log_directory(const std::string& log_directory) {
    const std::filesystem::path path_log_dir{log_directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message());
    }
    return path_log_dir / k_log_file_name;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(logger_once_flag, [&log_directory]() {
        const std::filesystem::path path_log_file = prepare_log_directory(log_directory);
        spdlog::sinks_init_list sinks{make_console_sink(), make_file_sink(path_log_file)};
        auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        optional_log_file = path_log_file;
        shared_logger = std::move(logger);
    });
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    // from_str maps every unknown name to off.
    const spdlog::level::level_enum level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

std::optional<std::filesystem::path> log_file_path() {
    return optional_log_file;
}

void add_log_sink(const spdlog::sink_ptr& sink) {
    get_logger()->sinks().push_back(sink);
}

void remove_log_sink(const spdlog::sink_ptr& sink) {
    std::vector<spdlog::sink_ptr>& sinks = get_logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

}  // namespace place_discovery
