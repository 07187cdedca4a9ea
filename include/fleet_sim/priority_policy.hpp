// === Priority Policy =========================================================
//
// Configurable total order over message kinds. Generators stamp each message
// with the rank this policy assigns; the priority buffer only compares ranks
// and never looks at kinds directly.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fleet_sim/message.hpp"

namespace fleet_sim {

/**
 * @brief Ranking over the closed MessageKind set, highest priority first.
 *
 * The ranking must name every kind exactly once. When error escalation is
 * enabled, Log messages of Error severity outrank every kind-derived rank.
 */
class PriorityPolicy final {
  public:
    /** @brief Default policy: Log > SensorData, no escalation. */
    PriorityPolicy();
    /** @throws std::invalid_argument when @p ranking is not a permutation of all kinds. */
    explicit PriorityPolicy(std::vector<MessageKind> ranking, bool escalate_error_logs = false);

    /**
     * @brief Parse a textual ordering such as "log>sensor_data".
     * @throws std::invalid_argument on unknown, duplicate, or missing kinds.
     */
    [[nodiscard]] static PriorityPolicy parse(std::string_view text, bool escalate_error_logs = false);

    [[nodiscard]] Priority priority_of(MessageKind kind, std::optional<Severity> severity = std::nullopt) const;
    [[nodiscard]] Priority priority_of(const MessagePayload& payload) const;

    [[nodiscard]] const std::vector<MessageKind>& ranking() const noexcept;
    [[nodiscard]] bool escalate_error_logs() const noexcept;
    /** @brief Canonical textual form, e.g. "log>sensor_data". */
    [[nodiscard]] std::string to_string() const;

  private:
    std::vector<MessageKind> list_ranking_;
    bool flag_escalate_error_logs_;
};

}  // namespace fleet_sim
