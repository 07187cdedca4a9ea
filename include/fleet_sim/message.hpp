// === Message =================================================================
//
// Immutable value describing one telemetry or log event emitted by a simulated
// device. A message is created once by a generator (or decoded from the wire)
// and afterwards only copied or moved until it is transmitted or dropped.

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Rank used by the priority buffer; larger values are kept first. */
using Priority = std::uint32_t;

/** @brief Body of a Log message. */
struct LogEntry final {
    Severity severity{Severity::Info}; /**< Operational severity of the event. */
    std::string text{};                /**< Free-form description. */
};

/** @brief One named numeric reading carried by a SensorData message. */
struct SensorReading final {
    std::string name{}; /**< Sensor channel name, e.g. "Temp1". */
    float value{};      /**< Sampled value. */
};

using SensorReadings = std::vector<SensorReading>;

/** @brief Kind-specific body; the active alternative determines the MessageKind. */
using MessagePayload = std::variant<LogEntry, SensorReadings>;

/** @brief Immutable telemetry/log record. */
class Message final {
  public:
    Message(std::string device_id,
            std::string firmware_version,
            WallTimePoint timestamp,
            MessagePayload payload,
            Priority priority = 0);

    [[nodiscard]] const std::string& device_id() const noexcept;
    [[nodiscard]] const std::string& firmware_version() const noexcept;
    [[nodiscard]] WallTimePoint timestamp() const noexcept;
    [[nodiscard]] MessageKind kind() const noexcept;
    [[nodiscard]] Priority priority() const noexcept;
    [[nodiscard]] const MessagePayload& payload() const noexcept;

    /** @brief Log body, or nullptr when this is not a Log message. */
    [[nodiscard]] const LogEntry* log_entry() const noexcept;
    /** @brief Sensor readings, or nullptr when this is not a SensorData message. */
    [[nodiscard]] const SensorReadings* sensor_readings() const noexcept;

  private:
    std::string str_device_id_;
    std::string str_firmware_version_;
    WallTimePoint timestamp_;
    MessagePayload payload_;
    Priority priority_;
};

using MessageList = std::vector<Message>;

}  // namespace fleet_sim
