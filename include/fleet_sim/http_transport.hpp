// === HTTP Transport ==========================================================
//
// Boost.Beast client that POSTs each message as a JSON body to the collector.
// One instance belongs to one device and is only used from that device's
// sender thread; it owns its own io_context.

#pragma once

#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "fleet_sim/transport.hpp"
#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Destination of the collector endpoint. */
struct HttpEndpoint final {
    std::string host{"localhost"};             /**< Collector host name or address. */
    unsigned short port{8080};                 /**< Collector TCP port. */
    std::string target{"/"};                   /**< Request target (path). */
    Duration request_timeout{Duration{2000}};  /**< Deadline covering connect, write, and read. */
};

/** @brief Sends one HTTP/1.1 POST per message over a fresh connection. */
class HttpTransport final : public MessageTransport {
  public:
    explicit HttpTransport(HttpEndpoint endpoint);

    [[nodiscard]] const HttpEndpoint& endpoint() const noexcept;
    [[nodiscard]] std::optional<TransportError> send(const Message& message) override;

  private:
    HttpEndpoint endpoint_;
    boost::asio::io_context io_context_;
};

}  // namespace fleet_sim
