#include "fleet_sim/collector_server.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "fleet_sim/logging.hpp"
#include "fleet_sim/message_codec.hpp"
#include "fleet_sim/version.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace fleet_sim {

namespace {
constexpr unsigned k_status_ok{200};
constexpr unsigned k_status_bad_request{400};
constexpr unsigned k_status_method_not_allowed{405};

std::string fail_body(std::string_view message) {
    return json{{"status", "fail"}, {"message", std::string{message}}}.dump();
}

/**
 * @brief Print accepted records to stdout, one line each, never interleaved.
 */
void write_record_to_stdout(const std::string& line) {
    static std::mutex stdout_mutex;
    std::scoped_lock lock(stdout_mutex);
    std::cout << line << '\n' << std::flush;
}
}  // namespace

IngestResponse handle_ingest(std::string_view body, WallTimePoint received_at) {
    json document;
    try {
        document = json::parse(body);
    } catch (const json::parse_error&) {
        return IngestResponse{k_status_bad_request, fail_body("Invalid JSON"), std::nullopt};
    }

    try {
        static_cast<void>(from_json(document));
    } catch (const MessageFormatError& exc) {
        return IngestResponse{k_status_bad_request, fail_body(exc.what()), std::nullopt};
    }

    document["received_at"] = format_timestamp(received_at);
    return IngestResponse{k_status_ok, json{{"status", "success"}}.dump(), document.dump()};
}

/** @brief One keep-alive HTTP connection. */
class CollectorServer::Session final : public std::enable_shared_from_this<CollectorServer::Session> {
  public:
    Session(tcp::socket socket, const RecordWriter& writer, Duration read_timeout, std::shared_ptr<spdlog::logger> logger)
        : stream_(std::move(socket)),
          writer_(writer),
          read_timeout_(read_timeout),
          logger_(std::move(logger)) {}

    void run() {
        net::dispatch(stream_.get_executor(), [self = shared_from_this()]() { self->read_request(); });
    }

  private:
    void read_request() {
        request_ = http::request<http::string_body>{};
        stream_.expires_after(read_timeout_);
        http::async_read(stream_, buffer_, request_, [self = shared_from_this()](beast::error_code error_code, std::size_t) {
            self->on_read(error_code);
        });
    }

    void on_read(beast::error_code error_code) {
        if (error_code == http::error::end_of_stream) {
            close();
            return;
        }
        if (error_code == beast::error::timeout) {
            logger_->debug("Collector closed a connection idle for {} ms", read_timeout_.count());
            return;
        }
        if (error_code) {
            if (error_code != net::error::operation_aborted) {
                logger_->debug("Collector read failed: {}", error_code.message());
            }
            return;
        }

        IngestResponse outcome{};
        if (request_.method() != http::verb::post) {
            outcome = IngestResponse{k_status_method_not_allowed, fail_body("Only POST is accepted"), std::nullopt};
        } else {
            outcome = handle_ingest(request_.body(), std::chrono::system_clock::now());
        }

        if (outcome.record_line.has_value()) {
            writer_(*outcome.record_line);
        } else {
            logger_->warn("Rejected message with status {}: {}", outcome.status, outcome.body);
        }
        write_response(outcome);
    }

    void write_response(const IngestResponse& outcome) {
        auto response = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(outcome.status), request_.version());
        response->set(http::field::server, fmt::format("fleet_collector/{}", k_version));
        response->set(http::field::content_type, "application/json");
        response->keep_alive(request_.keep_alive());
        response->body() = outcome.body;
        response->prepare_payload();

        http::async_write(stream_, *response, [self = shared_from_this(), response](beast::error_code error_code, std::size_t) {
            if (error_code) {
                self->logger_->debug("Collector write failed: {}", error_code.message());
                return;
            }
            if (!response->keep_alive()) {
                self->close();
                return;
            }
            self->read_request();
        });
    }

    void close() {
        beast::error_code shutdown_error;
        stream_.socket().shutdown(tcp::socket::shutdown_send, shutdown_error);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    const RecordWriter& writer_;
    const Duration read_timeout_;
    std::shared_ptr<spdlog::logger> logger_;
};

CollectorServer::CollectorServer(CollectorConfig config, RecordWriter writer)
    : config_(std::move(config)),
      writer_(writer ? std::move(writer) : RecordWriter{write_record_to_stdout}),
      acceptor_(net::make_strand(io_context_)),
      logger_(get_logger()) {}

CollectorServer::~CollectorServer() {
    stop();
}

unsigned short CollectorServer::start() {
    const tcp::endpoint endpoint{net::ip::make_address(config_.address), config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    const unsigned short bound_port = acceptor_.local_endpoint().port();

    do_accept();
    const std::size_t thread_count = config_.io_threads == 0 ? 1 : config_.io_threads;
    list_io_threads_.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        list_io_threads_.emplace_back([this]() { io_context_.run(); });
    }
    logger_->info("Collector listening on {}:{} with {} threads", config_.address, bound_port, thread_count);
    return bound_port;
}

void CollectorServer::stop() {
    if (list_io_threads_.empty()) {
        return;
    }
    io_context_.stop();
    for (std::thread& io_thread : list_io_threads_) {
        if (io_thread.joinable()) {
            io_thread.join();
        }
    }
    list_io_threads_.clear();
    beast::error_code close_error;
    acceptor_.close(close_error);
    logger_->info("Collector stopped");
}

void CollectorServer::do_accept() {
    acceptor_.async_accept(net::make_strand(io_context_), [this](beast::error_code error_code, tcp::socket socket) {
        if (error_code) {
            if (error_code != net::error::operation_aborted) {
                logger_->error("Collector accept failed: {}", error_code.message());
                do_accept();
            }
            return;
        }
        std::make_shared<Session>(std::move(socket), writer_, config_.read_timeout, logger_)->run();
        do_accept();
    });
}

}  // namespace fleet_sim
