#include "fleet_sim/http_transport.hpp"

#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>

#include "fleet_sim/message_codec.hpp"
#include "fleet_sim/version.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace fleet_sim {

namespace {
constexpr int k_http_version{11};

TransportError connection_error(const beast::error_code& error_code) {
    if (error_code == beast::error::timeout) {
        return TransportError{TransportErrorKind::Timeout, 0, error_code.message()};
    }
    return TransportError{TransportErrorKind::Connection, 0, error_code.message()};
}
}  // namespace

HttpTransport::HttpTransport(HttpEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

const HttpEndpoint& HttpTransport::endpoint() const noexcept {
    return endpoint_;
}

std::optional<TransportError> HttpTransport::send(const Message& message) {
    http::request<http::string_body> request{http::verb::post, endpoint_.target, k_http_version};
    try {
        request.body() = encode_message(message);
    } catch (const std::exception& exc) {
        return TransportError{TransportErrorKind::Encoding, 0, exc.what()};
    }
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, fmt::format("fleet_sim/{}", k_version));
    request.set(http::field::content_type, "application/json");
    request.prepare_payload();

    tcp::resolver resolver{io_context_};
    beast::tcp_stream stream{io_context_};
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::error_code error_code;

    // Async operations are used only so the tcp_stream deadline applies; run() blocks until the chain ends.
    resolver.async_resolve(
        endpoint_.host,
        std::to_string(endpoint_.port),
        [&](const beast::error_code& resolve_error, const tcp::resolver::results_type& results) {
            if (resolve_error) {
                error_code = resolve_error;
                return;
            }
            stream.expires_after(endpoint_.request_timeout);
            stream.async_connect(results, [&](const beast::error_code& connect_error, const tcp::endpoint&) {
                if (connect_error) {
                    error_code = connect_error;
                    return;
                }
                http::async_write(stream, request, [&](const beast::error_code& write_error, std::size_t) {
                    if (write_error) {
                        error_code = write_error;
                        return;
                    }
                    http::async_read(stream, buffer, response, [&](const beast::error_code& read_error, std::size_t) {
                        error_code = read_error;
                    });
                });
            });
        }
    );

    io_context_.restart();
    io_context_.run();

    beast::error_code shutdown_error;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_error);

    if (error_code) {
        return connection_error(error_code);
    }
    const unsigned status_code = response.result_int();
    if (status_code < 200 || status_code >= 300) {
        const auto reason = response.reason();
        return TransportError{TransportErrorKind::HttpStatus, static_cast<int>(status_code), std::string(reason.data(), reason.size())};
    }
    return std::nullopt;
}

}  // namespace fleet_sim
