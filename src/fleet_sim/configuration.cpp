// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings for the
// fleet simulator and the collector. `ConfigurationLoader` transforms raw
// environment variables into the strongly-typed `Configuration` structure.
//
// Responsibilities
// - Enforce defaults and bounds for device cadences, buffer capacity, fleet
//   size, and transport/collector endpoints.
// - Surface diagnostics via the logging subsystem whenever user input cannot
//   be parsed; the default is used instead.
// - Shield the rest of the codebase from `std::getenv` lookups.
//
// Variables are read through an `EnvironmentLookup` so tests can supply a map
// instead of mutating the process environment.

#include "fleet_sim/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string_view>

#include "fleet_sim/logging.hpp"

namespace fleet_sim {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr long long k_default_device_count{3};
constexpr long long k_default_interval_ms{500};
constexpr long long k_default_buffer_size{3};
constexpr long long k_default_outbox_batches{static_cast<long long>(k_default_outbox_capacity)};
constexpr long long k_default_startup_stagger_ms{20};
constexpr long long k_default_port{8080};
constexpr long long k_default_send_timeout_ms{2000};
constexpr long long k_default_replay_interval_ms{1000};
constexpr long long k_default_collector_threads{2};
constexpr long long k_default_collector_read_timeout_ms{30'000};
constexpr long long k_max_port{65535};

/**
 * @brief Inclusive bounds a numeric setting must respect.
 */
struct Bounds final {
    long long minimum{};
    long long maximum{std::numeric_limits<long long>::max()};
};

long long parse_integer(const EnvironmentLookup& lookup, std::string_view name, long long fallback, Bounds bounds) {
    const std::optional<std::string> raw_value = lookup(name);
    if (!raw_value.has_value() || raw_value->empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const long long parsed_value = std::stoll(*raw_value, &consumed);
        if (consumed != raw_value->size() || parsed_value < bounds.minimum || parsed_value > bounds.maximum) {
            get_logger()->warn("{}={} is out of range [{}, {}]; using fallback {}",
                               name, *raw_value, bounds.minimum, bounds.maximum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer {}={}; using fallback {}", name, *raw_value, fallback);
        return fallback;
    }
}

Duration parse_interval(const EnvironmentLookup& lookup, std::string_view name, long long fallback_ms) {
    return Duration{parse_integer(lookup, name, fallback_ms, Bounds{1})};
}

bool parse_flag(const EnvironmentLookup& lookup, std::string_view name, bool fallback) {
    const std::optional<std::string> raw_value = lookup(name);
    if (!raw_value.has_value() || raw_value->empty()) {
        return fallback;
    }
    std::string lowered = *raw_value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
        return false;
    }
    get_logger()->warn("Failed to parse flag {}={}; using fallback {}", name, *raw_value, fallback);
    return fallback;
}

std::string parse_string(const EnvironmentLookup& lookup, std::string_view name, std::string_view fallback) {
    const std::optional<std::string> raw_value = lookup(name);
    if (!raw_value.has_value() || raw_value->empty()) {
        return std::string{fallback};
    }
    return *raw_value;
}

PriorityPolicy parse_priority_policy(const EnvironmentLookup& lookup) {
    const bool escalate_error_logs = parse_flag(lookup, "FLEET_SIM_ESCALATE_ERROR_LOGS", false);
    const std::optional<std::string> raw_value = lookup("FLEET_SIM_PRIORITY");
    if (!raw_value.has_value() || raw_value->empty()) {
        return PriorityPolicy{{MessageKind::Log, MessageKind::SensorData}, escalate_error_logs};
    }
    try {
        return PriorityPolicy::parse(*raw_value, escalate_error_logs);
    } catch (const std::invalid_argument& exc) {
        get_logger()->warn("Invalid FLEET_SIM_PRIORITY ({}); using log>sensor_data", exc.what());
        return PriorityPolicy{{MessageKind::Log, MessageKind::SensorData}, escalate_error_logs};
    }
}

RunMode parse_mode(const EnvironmentLookup& lookup) {
    const std::string mode_text = parse_string(lookup, "FLEET_SIM_MODE", "simulate");
    if (mode_text == "simulate") {
        return RunMode::Simulate;
    }
    if (mode_text == "replay") {
        return RunMode::Replay;
    }
    throw ConfigurationError("FLEET_SIM_MODE must be 'simulate' or 'replay', got '" + mode_text + "'");
}

}  // namespace

Configuration ConfigurationLoader::load() {
    return load(&ConfigurationLoader::process_environment);
}

Configuration ConfigurationLoader::load(const EnvironmentLookup& lookup) {
    Configuration config{};
    config.log_directory = parse_string(lookup, "FLEET_SIM_LOG_DIR", k_default_log_directory);
    config.log_level = parse_string(lookup, "FLEET_SIM_LOG_LEVEL", k_default_log_level);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.mode = parse_mode(lookup);

    config.fleet.device_count = static_cast<std::size_t>(
        parse_integer(lookup, "FLEET_SIM_DEVICE_COUNT", k_default_device_count, Bounds{1}));
    config.fleet.startup_stagger = Duration{
        parse_integer(lookup, "FLEET_SIM_STARTUP_STAGGER_MS", k_default_startup_stagger_ms, Bounds{0})};

    DeviceConfig& device = config.fleet.device;
    device.firmware_version = parse_string(lookup, "FLEET_SIM_FIRMWARE", device.firmware_version);
    device.log_interval = parse_interval(lookup, "FLEET_SIM_LOG_INTERVAL_MS", k_default_interval_ms);
    device.sensor_interval = parse_interval(lookup, "FLEET_SIM_SENSOR_INTERVAL_MS", k_default_interval_ms);
    device.write_interval = parse_interval(lookup, "FLEET_SIM_WRITE_INTERVAL_MS", k_default_interval_ms);
    device.buffer_capacity = static_cast<std::size_t>(
        parse_integer(lookup, "FLEET_SIM_BUFFER_SIZE", k_default_buffer_size, Bounds{0}));
    device.outbox_capacity = static_cast<std::size_t>(
        parse_integer(lookup, "FLEET_SIM_OUTBOX_BATCHES", k_default_outbox_batches, Bounds{1}));
    device.priority_policy = parse_priority_policy(lookup);

    config.endpoint.host = parse_string(lookup, "FLEET_SIM_HOST", config.endpoint.host);
    config.endpoint.port = static_cast<unsigned short>(
        parse_integer(lookup, "FLEET_SIM_PORT", k_default_port, Bounds{1, k_max_port}));
    config.endpoint.target = parse_string(lookup, "FLEET_SIM_ENDPOINT", config.endpoint.target);
    config.endpoint.request_timeout = parse_interval(lookup, "FLEET_SIM_SEND_TIMEOUT_MS", k_default_send_timeout_ms);

    config.replay.file = parse_string(lookup, "FLEET_SIM_REPLAY_FILE", "");
    config.replay.interval = Duration{
        parse_integer(lookup, "FLEET_SIM_REPLAY_INTERVAL_MS", k_default_replay_interval_ms, Bounds{0})};
    if (config.mode == RunMode::Replay && config.replay.file.empty()) {
        throw ConfigurationError("FLEET_SIM_MODE=replay requires FLEET_SIM_REPLAY_FILE");
    }

    config.collector.port = static_cast<unsigned short>(
        parse_integer(lookup, "FLEET_COLLECTOR_PORT", k_default_port, Bounds{0, k_max_port}));
    config.collector.io_threads = static_cast<std::size_t>(
        parse_integer(lookup, "FLEET_COLLECTOR_THREADS", k_default_collector_threads, Bounds{1, 64}));
    config.collector.read_timeout =
        parse_interval(lookup, "FLEET_COLLECTOR_READ_TIMEOUT_MS", k_default_collector_read_timeout_ms);

    logger->info("Configuration loaded: mode={} devices={} log_ms={} sensor_ms={} write_ms={} buffer={} outbox={} priority={} target={}:{}{}",
                 config.mode == RunMode::Replay ? "replay" : "simulate",
                 config.fleet.device_count,
                 device.log_interval.count(),
                 device.sensor_interval.count(),
                 device.write_interval.count(),
                 device.buffer_capacity,
                 device.outbox_capacity,
                 device.priority_policy.to_string(),
                 config.endpoint.host,
                 config.endpoint.port,
                 config.endpoint.target);

    return config;
}

std::optional<std::string> ConfigurationLoader::process_environment(std::string_view name) {
    const char* raw_value = std::getenv(std::string{name}.c_str());
    if (raw_value == nullptr) {
        return std::nullopt;
    }
    return std::string{raw_value};
}

}  // namespace fleet_sim
