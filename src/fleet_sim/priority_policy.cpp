#include "fleet_sim/priority_policy.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace fleet_sim {

namespace {
constexpr char k_rank_separator{'>'};

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

void validate_ranking(const std::vector<MessageKind>& ranking) {
    for (const MessageKind kind : k_all_message_kinds) {
        const auto occurrences = std::count(ranking.begin(), ranking.end(), kind);
        if (occurrences != 1) {
            throw std::invalid_argument(fmt::format(
                "Priority ranking must list '{}' exactly once (found {})", to_string(kind), occurrences));
        }
    }
}
}  // namespace

PriorityPolicy::PriorityPolicy()
    : PriorityPolicy({MessageKind::Log, MessageKind::SensorData}) {}

PriorityPolicy::PriorityPolicy(std::vector<MessageKind> ranking, bool escalate_error_logs)
    : list_ranking_(std::move(ranking)),
      flag_escalate_error_logs_(escalate_error_logs) {
    validate_ranking(list_ranking_);
}

PriorityPolicy PriorityPolicy::parse(std::string_view text, bool escalate_error_logs) {
    std::vector<MessageKind> ranking;
    std::string_view remaining = text;
    while (true) {
        const auto separator = remaining.find(k_rank_separator);
        const std::string_view token = trim(remaining.substr(0, separator));
        const std::optional<MessageKind> kind = parse_message_kind(token);
        if (!kind.has_value()) {
            throw std::invalid_argument(fmt::format("Unknown message kind '{}' in priority '{}'", token, text));
        }
        ranking.push_back(*kind);
        if (separator == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(separator + 1);
    }
    return PriorityPolicy{std::move(ranking), escalate_error_logs};
}

Priority PriorityPolicy::priority_of(MessageKind kind, std::optional<Severity> severity) const {
    const auto rank_count = static_cast<Priority>(list_ranking_.size());
    if (flag_escalate_error_logs_ && kind == MessageKind::Log && severity == Severity::Error) {
        return rank_count + 1;
    }
    const auto iterator_kind = std::find(list_ranking_.begin(), list_ranking_.end(), kind);
    return rank_count - static_cast<Priority>(std::distance(list_ranking_.begin(), iterator_kind));
}

Priority PriorityPolicy::priority_of(const MessagePayload& payload) const {
    if (const auto* log_entry = std::get_if<LogEntry>(&payload); log_entry != nullptr) {
        return priority_of(MessageKind::Log, log_entry->severity);
    }
    return priority_of(MessageKind::SensorData);
}

const std::vector<MessageKind>& PriorityPolicy::ranking() const noexcept {
    return list_ranking_;
}

bool PriorityPolicy::escalate_error_logs() const noexcept {
    return flag_escalate_error_logs_;
}

std::string PriorityPolicy::to_string() const {
    std::string text;
    for (const MessageKind kind : list_ranking_) {
        if (!text.empty()) {
            text.push_back(k_rank_separator);
        }
        text.append(fleet_sim::to_string(kind));
    }
    return text;
}

}  // namespace fleet_sim
