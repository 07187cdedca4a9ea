// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe the fleet, the
// transport target, replay mode, the collector, and logging. The
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fleet_sim/collector_server.hpp"
#include "fleet_sim/fleet_coordinator.hpp"
#include "fleet_sim/http_transport.hpp"
#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Raised for configuration that cannot be repaired with a default. */
class ConfigurationError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief What the simulator process does once configured. */
enum class RunMode {
    Simulate, /**< Run a generated fleet. */
    Replay    /**< Re-send messages recorded in an NDJSON file. */
};

/** @brief Settings for replay mode. */
struct ReplayConfig final {
    std::filesystem::path file{};              /**< NDJSON file to replay. */
    Duration interval{Duration{1000}};         /**< Pause between consecutive messages. */
};

/**
 * @brief Immutable bundle of runtime knobs for the simulator and the collector.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};      /**< Destination directory for structured logs. */
    std::string log_level{"info"};    /**< spdlog level name. */
    RunMode mode{RunMode::Simulate};  /**< Simulation or replay. */
    FleetConfig fleet{};              /**< Fleet size and per-device template. */
    HttpEndpoint endpoint{};          /**< Collector the devices post to. */
    ReplayConfig replay{};            /**< Replay source, used in RunMode::Replay. */
    CollectorConfig collector{};      /**< Listener settings for the collector process. */
};

/** @brief Returns the value of an environment variable, if set. */
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Load from the process environment. */
    static Configuration load();
    /**
     * @brief Load through @p lookup; initializes the logger as a side effect.
     * @throws ConfigurationError for an unknown mode or replay mode without a file.
     */
    static Configuration load(const EnvironmentLookup& lookup);

    [[nodiscard]] static std::optional<std::string> process_environment(std::string_view name);
};

}  // namespace fleet_sim
