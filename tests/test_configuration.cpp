#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/spdlog.h>

#include "fleet_sim/configuration.hpp"
#include "fleet_sim/logging.hpp"
#include "logging_test_fixture.hpp"

using namespace fleet_sim;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    fleet_sim::test::ensure_logger_initialized();
    return true;
}();

EnvironmentLookup lookup_from(std::map<std::string, std::string> variables) {
    return [variables = std::move(variables)](std::string_view name) -> std::optional<std::string> {
        const auto iterator_variable = variables.find(std::string{name});
        if (iterator_variable == variables.end()) {
            return std::nullopt;
        }
        return iterator_variable->second;
    };
}
}  // namespace

TEST_CASE("ConfigurationLoader applies defaults for an empty environment") {
    const Configuration config = ConfigurationLoader::load(lookup_from({}));

    REQUIRE(config.log_directory == "logs");
    REQUIRE(config.log_level == "info");
    REQUIRE(config.mode == RunMode::Simulate);
    REQUIRE(config.fleet.device_count == 3);
    REQUIRE(config.fleet.startup_stagger == Duration{20});
    REQUIRE(config.fleet.device.firmware_version == "1.0-sim");
    REQUIRE(config.fleet.device.log_interval == Duration{500});
    REQUIRE(config.fleet.device.sensor_interval == Duration{500});
    REQUIRE(config.fleet.device.write_interval == Duration{500});
    REQUIRE(config.fleet.device.buffer_capacity == 3);
    REQUIRE(config.fleet.device.outbox_capacity == 4);
    REQUIRE(config.fleet.device.priority_policy.to_string() == "log>sensor_data");
    REQUIRE_FALSE(config.fleet.device.priority_policy.escalate_error_logs());
    REQUIRE(config.endpoint.host == "localhost");
    REQUIRE(config.endpoint.port == 8080);
    REQUIRE(config.endpoint.target == "/");
    REQUIRE(config.endpoint.request_timeout == Duration{2000});
    REQUIRE(config.replay.interval == Duration{1000});
    REQUIRE(config.collector.port == 8080);
    REQUIRE(config.collector.io_threads == 2);
    REQUIRE(config.collector.read_timeout == Duration{30'000});
}

TEST_CASE("ConfigurationLoader reads every override") {
    const Configuration config = ConfigurationLoader::load(lookup_from({
        {"FLEET_SIM_LOG_LEVEL", "debug"},
        {"FLEET_SIM_DEVICE_COUNT", "7"},
        {"FLEET_SIM_LOG_INTERVAL_MS", "250"},
        {"FLEET_SIM_SENSOR_INTERVAL_MS", "100"},
        {"FLEET_SIM_WRITE_INTERVAL_MS", "1000"},
        {"FLEET_SIM_BUFFER_SIZE", "0"},
        {"FLEET_SIM_OUTBOX_BATCHES", "16"},
        {"FLEET_SIM_PRIORITY", "sensor_data>log"},
        {"FLEET_SIM_ESCALATE_ERROR_LOGS", "yes"},
        {"FLEET_SIM_FIRMWARE", "2.1"},
        {"FLEET_SIM_HOST", "collector.local"},
        {"FLEET_SIM_PORT", "9000"},
        {"FLEET_SIM_ENDPOINT", "/ingest"},
        {"FLEET_COLLECTOR_PORT", "0"},
        {"FLEET_COLLECTOR_READ_TIMEOUT_MS", "5000"},
    }));

    REQUIRE(config.log_level == "debug");
    REQUIRE(config.fleet.device_count == 7);
    REQUIRE(config.fleet.device.log_interval == Duration{250});
    REQUIRE(config.fleet.device.sensor_interval == Duration{100});
    REQUIRE(config.fleet.device.write_interval == Duration{1000});
    REQUIRE(config.fleet.device.buffer_capacity == 0);
    REQUIRE(config.fleet.device.outbox_capacity == 16);
    REQUIRE(config.fleet.device.priority_policy.to_string() == "sensor_data>log");
    REQUIRE(config.fleet.device.priority_policy.escalate_error_logs());
    REQUIRE(config.fleet.device.firmware_version == "2.1");
    REQUIRE(config.endpoint.host == "collector.local");
    REQUIRE(config.endpoint.port == 9000);
    REQUIRE(config.endpoint.target == "/ingest");
    REQUIRE(config.collector.port == 0);
    REQUIRE(config.collector.read_timeout == Duration{5'000});
}

TEST_CASE("ConfigurationLoader falls back on unparseable values") {
    const Configuration config = ConfigurationLoader::load(lookup_from({
        {"FLEET_SIM_DEVICE_COUNT", "many"},
        {"FLEET_SIM_LOG_INTERVAL_MS", "0"},
        {"FLEET_SIM_SENSOR_INTERVAL_MS", "-10"},
        {"FLEET_SIM_WRITE_INTERVAL_MS", "12ms"},
        {"FLEET_SIM_BUFFER_SIZE", "-1"},
        {"FLEET_SIM_OUTBOX_BATCHES", "0"},
        {"FLEET_SIM_PRIORITY", "log>metrics"},
        {"FLEET_SIM_ESCALATE_ERROR_LOGS", "sometimes"},
        {"FLEET_SIM_PORT", "70000"},
    }));

    REQUIRE(config.fleet.device_count == 3);
    REQUIRE(config.fleet.device.log_interval == Duration{500});
    REQUIRE(config.fleet.device.sensor_interval == Duration{500});
    REQUIRE(config.fleet.device.write_interval == Duration{500});
    REQUIRE(config.fleet.device.buffer_capacity == 3);
    REQUIRE(config.fleet.device.outbox_capacity == 4);
    REQUIRE(config.fleet.device.priority_policy.to_string() == "log>sensor_data");
    REQUIRE_FALSE(config.fleet.device.priority_policy.escalate_error_logs());
    REQUIRE(config.endpoint.port == 8080);
}

TEST_CASE("ConfigurationLoader validates the run mode") {
    REQUIRE_THROWS_AS(ConfigurationLoader::load(lookup_from({{"FLEET_SIM_MODE", "replay"}})), ConfigurationError);
    REQUIRE_THROWS_AS(ConfigurationLoader::load(lookup_from({{"FLEET_SIM_MODE", "benchmark"}})), ConfigurationError);

    const Configuration config = ConfigurationLoader::load(lookup_from({
        {"FLEET_SIM_MODE", "replay"},
        {"FLEET_SIM_REPLAY_FILE", "recorded.ndjson"},
        {"FLEET_SIM_REPLAY_INTERVAL_MS", "50"},
    }));
    REQUIRE(config.mode == RunMode::Replay);
    REQUIRE(config.replay.file.string() == "recorded.ndjson");
    REQUIRE(config.replay.interval == Duration{50});
}

TEST_CASE("Shared logger flushes immediately only at error level") {
    const auto logger = get_logger();
    REQUIRE(logger->flush_level() == spdlog::level::err);
}
