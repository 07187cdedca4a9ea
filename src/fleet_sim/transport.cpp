#include "fleet_sim/transport.hpp"

#include <fmt/format.h>

namespace fleet_sim {

std::string_view to_string(TransportErrorKind kind) noexcept {
    switch (kind) {
        case TransportErrorKind::Connection:
            return "connection";
        case TransportErrorKind::Timeout:
            return "timeout";
        case TransportErrorKind::HttpStatus:
            return "http_status";
        case TransportErrorKind::Encoding:
            return "encoding";
    }
    return "unknown";
}

std::string TransportError::describe() const {
    if (kind == TransportErrorKind::HttpStatus) {
        return fmt::format("{} {}: {}", to_string(kind), status_code, detail);
    }
    return fmt::format("{}: {}", to_string(kind), detail);
}

}  // namespace fleet_sim
