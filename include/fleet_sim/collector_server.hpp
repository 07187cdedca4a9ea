// === Collector Server ========================================================
//
// HTTP endpoint on the receiving side of the fleet. Every POST body must be a
// well-formed message over the closed kind set; accepted messages are echoed
// as one JSON line (with a `received_at` stamp) to the record writer, which
// prints to stdout by default. Built on Boost.Beast with an io_context served
// by a small thread pool.

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/logger.h>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Listener settings for the collector. */
struct CollectorConfig final {
    std::string address{"0.0.0.0"}; /**< Interface to bind. */
    unsigned short port{8080};      /**< TCP port; 0 picks an ephemeral port. */
    std::size_t io_threads{2};      /**< Threads serving the io_context. */
    Duration read_timeout{Duration{30'000}}; /**< Idle or slow connections are closed after this long without a full request. */
};

/** @brief Outcome of validating one POST body. */
struct IngestResponse final {
    unsigned status{};                      /**< HTTP status code to answer with. */
    std::string body{};                     /**< JSON response body. */
    std::optional<std::string> record_line; /**< Accepted message plus received_at, when valid. */
};

/** @brief Validate @p body as a message and build the response; independent of any socket. */
[[nodiscard]] IngestResponse handle_ingest(std::string_view body, WallTimePoint received_at);

/** @brief Asynchronous HTTP server accepting device messages. */
class CollectorServer final {
  public:
    using RecordWriter = std::function<void(const std::string& line)>;

    /** @param writer Receives each accepted record; must be thread-safe. Defaults to stdout. */
    explicit CollectorServer(CollectorConfig config, RecordWriter writer = {});
    ~CollectorServer();

    CollectorServer(const CollectorServer&) = delete;
    CollectorServer& operator=(const CollectorServer&) = delete;

    /**
     * @brief Bind, start accepting on the I/O threads, and return the bound port.
     * @throws boost::system::system_error when the address cannot be bound.
     */
    unsigned short start();
    /** @brief Stop accepting, cancel outstanding I/O, and join the pool. Idempotent. */
    void stop();

  private:
    class Session;

    void do_accept();

    CollectorConfig config_;
    RecordWriter writer_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> list_io_threads_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace fleet_sim
