// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the
// simulator (time primitives, message kinds, log severities).

#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fleet_sim {

/**
 * @brief Alias for the steady clock driving generator and flush timers.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for wall-clock timestamps stamped onto messages.
 */
using WallTimePoint = std::chrono::time_point<std::chrono::system_clock>;

/**
 * @brief Alias for scheduling intervals; all cadences are configured in milliseconds.
 */
using Duration = std::chrono::milliseconds;

/**
 * @brief Closed set of message variants a device can emit.
 */
enum class MessageKind {
    Log,        /**< Application-level event with free-form text. */
    SensorData  /**< Structured telemetry reading. */
};

/** @brief Every MessageKind, in declaration order. */
inline constexpr std::array<MessageKind, 2> k_all_message_kinds{MessageKind::Log, MessageKind::SensorData};

/**
 * @brief Severity attached to Log messages.
 */
enum class Severity {
    Debug,
    Info,
    Warning,
    Error
};

/** @brief Wire name of @p kind ("log" / "sensor_data"). */
[[nodiscard]] std::string_view to_string(MessageKind kind) noexcept;
/** @brief Wire name of @p severity ("Debug", "Info", ...). */
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/** @brief Parse a wire kind name; std::nullopt when unknown. */
[[nodiscard]] std::optional<MessageKind> parse_message_kind(std::string_view text);
/** @brief Parse a wire severity name; std::nullopt when unknown. */
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);

}  // namespace fleet_sim
