#include "fleet_sim/message.hpp"

#include <utility>

namespace fleet_sim {

Message::Message(std::string device_id,
                 std::string firmware_version,
                 WallTimePoint timestamp,
                 MessagePayload payload,
                 Priority priority)
    : str_device_id_(std::move(device_id)),
      str_firmware_version_(std::move(firmware_version)),
      timestamp_(timestamp),
      payload_(std::move(payload)),
      priority_(priority) {}

const std::string& Message::device_id() const noexcept {
    return str_device_id_;
}

const std::string& Message::firmware_version() const noexcept {
    return str_firmware_version_;
}

WallTimePoint Message::timestamp() const noexcept {
    return timestamp_;
}

MessageKind Message::kind() const noexcept {
    return std::holds_alternative<LogEntry>(payload_) ? MessageKind::Log : MessageKind::SensorData;
}

Priority Message::priority() const noexcept {
    return priority_;
}

const MessagePayload& Message::payload() const noexcept {
    return payload_;
}

const LogEntry* Message::log_entry() const noexcept {
    return std::get_if<LogEntry>(&payload_);
}

const SensorReadings* Message::sensor_readings() const noexcept {
    return std::get_if<SensorReadings>(&payload_);
}

}  // namespace fleet_sim
