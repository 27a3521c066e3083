// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component. Structured lines use
// the {"component":...} JSON shape; literal braces in those format strings
// must be doubled so fmt does not read them as replacement fields.

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace place_discovery {

/**
 * @brief Create the shared logger writing to the console and to a rotating
 *        file under @p log_directory. Later calls return the existing logger.
 *
 * @throws std::runtime_error when the directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error when initialize_logger has not run. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Apply an spdlog level name; unknown names select info. */
void set_log_level(const std::string& str_level);

/** @brief Rotating log file of the shared logger, once initialized. */
std::optional<std::filesystem::path> log_file_path();

/**
 * @brief Attach or detach an extra sink on the shared logger.
 *
 * spdlog does not lock a logger's sink list, so call these only while no
 * other thread is logging.
 */
void add_log_sink(const spdlog::sink_ptr& sink);
void remove_log_sink(const spdlog::sink_ptr& sink);

}  // namespace place_discovery
