// === Message Codec ===========================================================
//
// JSON wire form of a Message, shared by the HTTP transport (encode), the
// collector server and the file replayer (decode). Decoding validates the
// payload against the closed kind set; anything else is a MessageFormatError.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "fleet_sim/message.hpp"
#include "fleet_sim/priority_policy.hpp"

namespace fleet_sim {

/** @brief Raised when text or JSON does not describe a well-formed message. */
class MessageFormatError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z. */
[[nodiscard]] std::string format_timestamp(WallTimePoint timestamp);
/** @throws MessageFormatError when @p text is not an RFC 3339 UTC timestamp. */
[[nodiscard]] WallTimePoint parse_timestamp(std::string_view text);

[[nodiscard]] nlohmann::json to_json(const Message& message);
/** @brief Compact single-line JSON. */
[[nodiscard]] std::string encode_message(const Message& message);

/**
 * @brief Rebuild a message from its wire form, ranking it with @p policy.
 * @throws MessageFormatError on missing fields, unknown kinds or severities, or mismatched payloads.
 */
[[nodiscard]] Message from_json(const nlohmann::json& document, const PriorityPolicy& policy = PriorityPolicy{});
/** @brief Parse and decode one JSON document. */
[[nodiscard]] Message decode_message(std::string_view text, const PriorityPolicy& policy = PriorityPolicy{});

}  // namespace fleet_sim
