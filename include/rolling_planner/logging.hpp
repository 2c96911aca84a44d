// === Logging =================================================================
//
// Process-wide planner logger. Console output is human-oriented; the rotating
// file sink writes one JSON object per line so cycle and discussion events can
// be replayed after a run.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace rolling_planner {

/** @brief Create the shared logger once; later calls return the same instance. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger. Throws std::runtime_error before initialize_logger(). */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Apply a level name such as "debug" or "warn".
 *
 * Returns false and keeps the info level when the name is unknown.
 */
bool set_log_level(const std::string& str_level);

/** @brief Flush both sinks; safe to call before initialization. */
void flush_logger() noexcept;

}  // namespace rolling_planner
