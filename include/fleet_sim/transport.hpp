// === Transport ===============================================================
//
// Interface between the device core and whatever delivers messages to the
// collector. Delivery is best-effort and independent per message: a failure
// is reported back to the caller, which logs it and moves on.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "fleet_sim/message.hpp"

namespace fleet_sim {

/** @brief Failure classes a transport can report. */
enum class TransportErrorKind {
    Connection, /**< Resolve/connect/write/read failed. */
    Timeout,    /**< Request did not complete within the deadline. */
    HttpStatus, /**< Server answered with a non-2xx status. */
    Encoding    /**< Message could not be serialized. */
};

[[nodiscard]] std::string_view to_string(TransportErrorKind kind) noexcept;

/** @brief Description of a single failed send. */
struct TransportError final {
    TransportErrorKind kind{TransportErrorKind::Connection};
    int status_code{}; /**< HTTP status for HttpStatus errors, otherwise 0. */
    std::string detail{};

    /** @brief One-line cause suitable for logs. */
    [[nodiscard]] std::string describe() const;
};

/** @brief Per-message sender. Instances are owned by a single device and are not shared. */
class MessageTransport {
  public:
    virtual ~MessageTransport() = default;

    /** @brief Deliver @p message; std::nullopt on success. */
    [[nodiscard]] virtual std::optional<TransportError> send(const Message& message) = 0;
};

using MessageTransportPtr = std::unique_ptr<MessageTransport>;

}  // namespace fleet_sim
