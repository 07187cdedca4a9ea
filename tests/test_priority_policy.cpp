#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "fleet_sim/priority_policy.hpp"

using namespace fleet_sim;

TEST_CASE("Default policy ranks logs above sensor data") {
    const PriorityPolicy policy;
    REQUIRE(policy.priority_of(MessageKind::Log) > policy.priority_of(MessageKind::SensorData));
    REQUIRE(policy.to_string() == "log>sensor_data");
    REQUIRE_FALSE(policy.escalate_error_logs());
}

TEST_CASE("PriorityPolicy parses a reversed ordering with whitespace") {
    const PriorityPolicy policy = PriorityPolicy::parse(" sensor_data > log ");
    REQUIRE(policy.priority_of(MessageKind::SensorData) > policy.priority_of(MessageKind::Log));
    REQUIRE(policy.to_string() == "sensor_data>log");
}

TEST_CASE("PriorityPolicy rejects incomplete or unknown rankings") {
    REQUIRE_THROWS_AS(PriorityPolicy::parse("log"), std::invalid_argument);
    REQUIRE_THROWS_AS(PriorityPolicy::parse("log>log"), std::invalid_argument);
    REQUIRE_THROWS_AS(PriorityPolicy::parse("log>metrics"), std::invalid_argument);
    REQUIRE_THROWS_AS(PriorityPolicy::parse(""), std::invalid_argument);
    REQUIRE_THROWS_AS(PriorityPolicy(std::vector<MessageKind>{MessageKind::SensorData}), std::invalid_argument);
}

TEST_CASE("Escalated error logs outrank every kind") {
    const PriorityPolicy policy = PriorityPolicy::parse("sensor_data>log", true);
    const Priority error_log = policy.priority_of(LogEntry{Severity::Error, "overheat"});
    const Priority info_log = policy.priority_of(LogEntry{Severity::Info, "ok"});
    const Priority sensor = policy.priority_of(SensorReadings{SensorReading{"Temp1", 1.0F}});

    REQUIRE(error_log > sensor);
    REQUIRE(sensor > info_log);
}

TEST_CASE("Error logs are not escalated unless enabled") {
    const PriorityPolicy policy = PriorityPolicy::parse("sensor_data>log");
    REQUIRE(policy.priority_of(MessageKind::Log, Severity::Error) == policy.priority_of(MessageKind::Log, Severity::Info));
}
