#include "fleet_sim/message_codec.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include <fmt/format.h>

namespace fleet_sim {

namespace {
constexpr char k_field_device_id[] = "device_id";
constexpr char k_field_firmware_version[] = "firmware_version";
constexpr char k_field_kind[] = "kind";
constexpr char k_field_timestamp[] = "timestamp";
constexpr char k_field_log[] = "log";
constexpr char k_field_sensor_data[] = "sensor_data";

using json = nlohmann::json;

const json& require_field(const json& document, const char* field) {
    const auto iterator_field = document.find(field);
    if (iterator_field == document.end()) {
        throw MessageFormatError(fmt::format("Missing field '{}'", field));
    }
    return *iterator_field;
}

std::string require_string(const json& document, const char* field) {
    const json& value = require_field(document, field);
    if (!value.is_string()) {
        throw MessageFormatError(fmt::format("Field '{}' must be a string", field));
    }
    return value.get<std::string>();
}

LogEntry decode_log_entry(const json& document) {
    const json& log_object = require_field(document, k_field_log);
    if (!log_object.is_object()) {
        throw MessageFormatError("Field 'log' must be an object");
    }
    const std::string severity_text = require_string(log_object, "severity");
    const std::optional<Severity> severity = parse_severity(severity_text);
    if (!severity.has_value()) {
        throw MessageFormatError(fmt::format("Unknown severity '{}'", severity_text));
    }
    return LogEntry{*severity, require_string(log_object, "message")};
}

SensorReadings decode_sensor_readings(const json& document) {
    const json& readings_array = require_field(document, k_field_sensor_data);
    if (!readings_array.is_array() || readings_array.empty()) {
        throw MessageFormatError("Field 'sensor_data' must be a non-empty array");
    }
    SensorReadings readings;
    readings.reserve(readings_array.size());
    for (const json& reading_object : readings_array) {
        if (!reading_object.is_object()) {
            throw MessageFormatError("Sensor readings must be objects");
        }
        const json& value = require_field(reading_object, "value");
        if (!value.is_number()) {
            throw MessageFormatError("Sensor reading 'value' must be a number");
        }
        readings.push_back(SensorReading{require_string(reading_object, "name"), value.get<float>()});
    }
    return readings;
}
}  // namespace

std::string format_timestamp(WallTimePoint timestamp) {
    const auto since_epoch = timestamp.time_since_epoch();
    const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - whole_seconds);
    const std::time_t seconds = static_cast<std::time_t>(whole_seconds.count());

    std::tm utc_time{};
    gmtime_r(&seconds, &utc_time);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc_time.tm_year + 1900,
                       utc_time.tm_mon + 1,
                       utc_time.tm_mday,
                       utc_time.tm_hour,
                       utc_time.tm_min,
                       utc_time.tm_sec,
                       milliseconds.count());
}

WallTimePoint parse_timestamp(std::string_view text) {
    std::tm utc_time{};
    std::istringstream stream{std::string{text}};
    stream >> std::get_time(&utc_time, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        throw MessageFormatError(fmt::format("Invalid timestamp '{}'", text));
    }

    long long fraction_ms = 0;
    if (stream.peek() == '.') {
        stream.get();
        int digits = 0;
        while (std::isdigit(stream.peek()) != 0) {
            const int digit = stream.get() - '0';
            if (digits < 3) {
                fraction_ms = fraction_ms * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            throw MessageFormatError(fmt::format("Invalid timestamp fraction '{}'", text));
        }
        for (; digits < 3; ++digits) {
            fraction_ms *= 10;
        }
    }

    if (stream.get() != 'Z' || stream.peek() != std::char_traits<char>::eof()) {
        throw MessageFormatError(fmt::format("Timestamp '{}' must be UTC ('Z' suffix)", text));
    }

    const std::time_t seconds = timegm(&utc_time);
    return WallTimePoint{std::chrono::duration_cast<WallTimePoint::duration>(
        std::chrono::seconds{seconds} + std::chrono::milliseconds{fraction_ms})};
}

nlohmann::json to_json(const Message& message) {
    json document{
        {k_field_device_id, message.device_id()},
        {k_field_firmware_version, message.firmware_version()},
        {k_field_kind, std::string{to_string(message.kind())}},
        {k_field_timestamp, format_timestamp(message.timestamp())},
    };

    if (const LogEntry* log_entry = message.log_entry(); log_entry != nullptr) {
        document[k_field_log] = json{
            {"severity", std::string{to_string(log_entry->severity)}},
            {"message", log_entry->text},
        };
    } else if (const SensorReadings* readings = message.sensor_readings(); readings != nullptr) {
        json readings_array = json::array();
        for (const SensorReading& reading : *readings) {
            readings_array.push_back(json{{"name", reading.name}, {"value", reading.value}});
        }
        document[k_field_sensor_data] = std::move(readings_array);
    }
    return document;
}

std::string encode_message(const Message& message) {
    return to_json(message).dump();
}

Message from_json(const nlohmann::json& document, const PriorityPolicy& policy) {
    if (!document.is_object()) {
        throw MessageFormatError("Message must be a JSON object");
    }

    const std::string kind_text = require_string(document, k_field_kind);
    const std::optional<MessageKind> kind = parse_message_kind(kind_text);
    if (!kind.has_value()) {
        throw MessageFormatError(fmt::format("Unknown message kind '{}'", kind_text));
    }

    MessagePayload payload;
    if (*kind == MessageKind::Log) {
        if (document.contains(k_field_sensor_data)) {
            throw MessageFormatError("Log message must not carry 'sensor_data'");
        }
        payload = decode_log_entry(document);
    } else {
        if (document.contains(k_field_log)) {
            throw MessageFormatError("Sensor message must not carry 'log'");
        }
        payload = decode_sensor_readings(document);
    }

    const Priority priority = policy.priority_of(payload);
    return Message{
        require_string(document, k_field_device_id),
        require_string(document, k_field_firmware_version),
        parse_timestamp(require_string(document, k_field_timestamp)),
        std::move(payload),
        priority
    };
}

Message decode_message(std::string_view text, const PriorityPolicy& policy) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& exc) {
        throw MessageFormatError(fmt::format("Invalid JSON: {}", exc.what()));
    }
    return from_json(document, policy);
}

}  // namespace fleet_sim
