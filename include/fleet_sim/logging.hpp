// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component: colored console
// output plus a rotating file of JSON lines under the configured directory.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace fleet_sim {

/** @brief Create the shared logger on first call; later calls return the same instance. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error when initialize_logger has not run yet. */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace fleet_sim
