// === Dispatch Queue ==========================================================
//
// Per-device hand-off between the flush (scheduler thread) and the transport
// (sender thread). Flushes publish retained batches and return immediately,
// so a slow collector never stalls the next generation tick. The queue holds
// at most `capacity` batches; publishing into a full queue evicts the oldest
// batch and hands it back so the caller can report every lost message.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "fleet_sim/message.hpp"

namespace fleet_sim {

/** @brief Outcome of DispatchQueue::publish. */
struct PublishResult final {
    bool accepted{};        /**< False once the queue is closed; the batch is then in `discarded`. */
    MessageList discarded{}; /**< Messages that will never be sent because of this publish. */
};

/** @brief Thread-safe, bounded FIFO of retained batches awaiting transmission. */
class DispatchQueue final {
  public:
    /** @throws std::invalid_argument when @p capacity is zero. */
    explicit DispatchQueue(std::size_t capacity);

    /** @brief Enqueue a batch, evicting the oldest one when the queue is full. */
    [[nodiscard]] PublishResult publish(MessageList batch);
    /** @brief Attempt to consume a pending batch without blocking. */
    [[nodiscard]] std::optional<MessageList> try_consume();
    /** @brief Block until a batch is available, or the queue is closed and empty. */
    [[nodiscard]] std::optional<MessageList> wait_consume();
    /**
     * @brief Refuse further batches, wake any waiting consumer, and return
     *        every queued message in FIFO order. The queue is empty afterwards.
     */
    [[nodiscard]] MessageList close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] std::size_t pending_batches() const;

  private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_not_empty_;
    std::deque<MessageList> deque_batches_;
    bool flag_closed_{false};
};

}  // namespace fleet_sim
