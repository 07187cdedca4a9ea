#include "fleet_sim/message_generator.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace fleet_sim {

namespace {
constexpr char k_simulated_log_text[] = "This is a simulated message."; /**< Body shared by every simulated log event. */
constexpr char k_temperature_channel[] = "Temp1";                      /**< Channel name of the simulated sensor. */
constexpr float k_temperature_min{1.0F};
constexpr float k_temperature_max{100.0F};

void validate_payload(MessageKind expected_kind, const MessagePayload& payload) {
    if (const auto* log_entry = std::get_if<LogEntry>(&payload); log_entry != nullptr) {
        if (expected_kind != MessageKind::Log) {
            throw GenerationError(fmt::format("Source for '{}' produced a log payload", to_string(expected_kind)));
        }
        if (log_entry->text.empty()) {
            throw GenerationError("Log payload has empty text");
        }
        return;
    }

    const auto& readings = std::get<SensorReadings>(payload);
    if (expected_kind != MessageKind::SensorData) {
        throw GenerationError(fmt::format("Source for '{}' produced a sensor payload", to_string(expected_kind)));
    }
    if (readings.empty()) {
        throw GenerationError("Sensor payload has no readings");
    }
    for (const SensorReading& reading : readings) {
        if (reading.name.empty() || !std::isfinite(reading.value)) {
            throw GenerationError(fmt::format("Malformed sensor reading '{}'", reading.name));
        }
    }
}
}  // namespace

RandomLogSource::RandomLogSource(std::uint64_t seed)
    : rng_(seed) {}

MessageKind RandomLogSource::kind() const noexcept {
    return MessageKind::Log;
}

MessagePayload RandomLogSource::next_payload() {
    std::bernoulli_distribution error_distribution{0.5};
    const Severity severity = error_distribution(rng_) ? Severity::Error : Severity::Info;
    return LogEntry{severity, k_simulated_log_text};
}

RandomSensorSource::RandomSensorSource(std::uint64_t seed)
    : rng_(seed) {}

MessageKind RandomSensorSource::kind() const noexcept {
    return MessageKind::SensorData;
}

MessagePayload RandomSensorSource::next_payload() {
    std::uniform_real_distribution<float> value_distribution{k_temperature_min, k_temperature_max};
    return SensorReadings{SensorReading{k_temperature_channel, value_distribution(rng_)}};
}

MessageSourcePtr make_random_source(MessageKind kind, std::uint64_t seed) {
    switch (kind) {
        case MessageKind::Log:
            return std::make_unique<RandomLogSource>(seed);
        case MessageKind::SensorData:
            return std::make_unique<RandomSensorSource>(seed);
    }
    throw std::invalid_argument("Unsupported message kind");
}

IntervalTimer::IntervalTimer(Duration interval)
    : interval_(interval) {
    if (interval_ <= Duration::zero()) {
        throw std::invalid_argument(fmt::format("Timer interval must be positive (got {} ms)", interval_.count()));
    }
}

void IntervalTimer::arm(TimePoint first_tick) noexcept {
    deadline_ = first_tick;
}

bool IntervalTimer::fire_if_due(TimePoint now) noexcept {
    if (now < deadline_) {
        return false;
    }
    deadline_ += interval_;
    if (deadline_ <= now) {
        deadline_ = now + interval_;
    }
    return true;
}

TimePoint IntervalTimer::deadline() const noexcept {
    return deadline_;
}

Duration IntervalTimer::interval() const noexcept {
    return interval_;
}

MessageGenerator::MessageGenerator(DeviceIdentity identity, Duration interval, MessageSourcePtr source, PriorityPolicy policy)
    : identity_(std::move(identity)),
      timer_(interval),
      source_(std::move(source)),
      policy_(std::move(policy)) {
    if (source_ == nullptr) {
        throw std::invalid_argument("MessageGenerator requires a message source");
    }
}

MessageKind MessageGenerator::kind() const noexcept {
    return source_->kind();
}

const IntervalTimer& MessageGenerator::timer() const noexcept {
    return timer_;
}

void MessageGenerator::start(TimePoint now) noexcept {
    timer_.arm(now);
}

std::optional<Message> MessageGenerator::poll(TimePoint now, WallTimePoint wall_now) {
    if (!timer_.fire_if_due(now)) {
        return std::nullopt;
    }
    return next(wall_now);
}

Message MessageGenerator::next(WallTimePoint wall_now) {
    MessagePayload payload = source_->next_payload();
    validate_payload(source_->kind(), payload);
    const Priority priority = policy_.priority_of(payload);
    return Message{identity_.device_id, identity_.firmware_version, wall_now, std::move(payload), priority};
}

}  // namespace fleet_sim
