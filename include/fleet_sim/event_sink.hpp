// === Event Sink ==============================================================
//
// Observability boundary of the device core. Workers report every overflow
// drop and every failed send here; the default sink turns them into
// structured log lines.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Reason tag attached to messages discarded at flush time. */
inline constexpr std::string_view k_reason_buffer_overflow{"buffer_overflow"};
/** @brief Reason tag for flushed batches evicted because the sender fell behind. */
inline constexpr std::string_view k_reason_outbox_overflow{"outbox_overflow"};
/** @brief Reason tag for flushed messages abandoned when the device stopped. */
inline constexpr std::string_view k_reason_shutdown{"shutdown"};

/** @brief Receiver of per-message delivery events. Implementations must be thread-safe. */
class EventSink {
  public:
    virtual ~EventSink() = default;

    virtual void message_dropped(const std::string& device_id, MessageKind kind, std::string_view reason) = 0;
    virtual void message_send_failed(const std::string& device_id, MessageKind kind, std::string_view cause) = 0;
};

/** @brief Sink that forwards events to the shared spdlog logger. */
class LoggingEventSink final : public EventSink {
  public:
    LoggingEventSink();

    void message_dropped(const std::string& device_id, MessageKind kind, std::string_view reason) override;
    void message_send_failed(const std::string& device_id, MessageKind kind, std::string_view cause) override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace fleet_sim
