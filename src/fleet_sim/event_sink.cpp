#include "fleet_sim/event_sink.hpp"

#include "fleet_sim/logging.hpp"

namespace fleet_sim {

LoggingEventSink::LoggingEventSink()
    : logger_(get_logger()) {}

void LoggingEventSink::message_dropped(const std::string& device_id, MessageKind kind, std::string_view reason) {
    logger_->warn(
        R"({{"event":"message_dropped","device":"{}","kind":"{}","reason":"{}"}})",
        device_id,
        to_string(kind),
        reason
    );
}

void LoggingEventSink::message_send_failed(const std::string& device_id, MessageKind kind, std::string_view cause) {
    logger_->error(
        R"({{"event":"message_send_failed","device":"{}","kind":"{}","cause":"{}"}})",
        device_id,
        to_string(kind),
        cause
    );
}

}  // namespace fleet_sim
