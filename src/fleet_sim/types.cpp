#include "fleet_sim/types.hpp"

namespace fleet_sim {

std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Log:
            return "log";
        case MessageKind::SensorData:
            return "sensor_data";
    }
    return "unknown";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Debug:
            return "Debug";
        case Severity::Info:
            return "Info";
        case Severity::Warning:
            return "Warning";
        case Severity::Error:
            return "Error";
    }
    return "Unknown";
}

std::optional<MessageKind> parse_message_kind(std::string_view text) {
    for (const MessageKind kind : k_all_message_kinds) {
        if (text == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view text) {
    for (const Severity severity : {Severity::Debug, Severity::Info, Severity::Warning, Severity::Error}) {
        if (text == to_string(severity)) {
            return severity;
        }
    }
    return std::nullopt;
}

}  // namespace fleet_sim
