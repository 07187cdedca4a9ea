// === Priority Buffer =========================================================
//
// Per-device accumulation slot between flushes. Producers append without ever
// blocking on capacity; the flush takes the whole pending set atomically and
// resolves overflow by priority over everything accumulated since the last
// flush, so a late high-priority message can still displace an earlier
// low-priority one.

#pragma once

#include <cstddef>
#include <mutex>

#include "fleet_sim/message.hpp"

namespace fleet_sim {

/** @brief Partition produced by a single flush. */
struct FlushResult final {
    MessageList retained{}; /**< Highest-priority messages, in transmission order. */
    MessageList dropped{};  /**< Overflow suffix, in the same sorted order. */
};

/** @brief Thread-safe pending set drained on every flush. */
class PriorityBuffer final {
  public:
    /** @brief Append @p message to the pending set. Never fails, never blocks on capacity. */
    void accumulate(Message message);

    /**
     * @brief Drain the pending set and split it at @p capacity.
     *
     * Messages are ordered by descending priority; equal priorities keep their
     * arrival order. The pending set is empty afterwards whatever the outcome.
     */
    [[nodiscard]] FlushResult flush(std::size_t capacity);

    /** @brief Number of messages awaiting the next flush. */
    [[nodiscard]] std::size_t pending_count() const;

  private:
    mutable std::mutex mutex_;
    MessageList list_pending_;
};

}  // namespace fleet_sim
