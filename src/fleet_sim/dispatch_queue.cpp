#include "fleet_sim/dispatch_queue.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace fleet_sim {

namespace {
void append_batch(MessageList& destination, MessageList& batch) {
    destination.insert(destination.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
}
}  // namespace

DispatchQueue::DispatchQueue(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("DispatchQueue capacity must be at least one batch");
    }
}

PublishResult DispatchQueue::publish(MessageList batch) {
    PublishResult result{};
    {
        std::scoped_lock lock(mutex_);
        if (flag_closed_) {
            result.discarded = std::move(batch);
            return result;
        }
        while (deque_batches_.size() >= capacity_) {
            append_batch(result.discarded, deque_batches_.front());
            deque_batches_.pop_front();
        }
        deque_batches_.push_back(std::move(batch));
        result.accepted = true;
    }
    cv_not_empty_.notify_one();
    return result;
}

std::optional<MessageList> DispatchQueue::try_consume() {
    std::scoped_lock lock(mutex_);
    if (deque_batches_.empty()) {
        return std::nullopt;
    }
    MessageList batch = std::move(deque_batches_.front());
    deque_batches_.pop_front();
    return batch;
}

std::optional<MessageList> DispatchQueue::wait_consume() {
    std::unique_lock lock(mutex_);
    cv_not_empty_.wait(lock, [this]() { return flag_closed_ || !deque_batches_.empty(); });
    if (deque_batches_.empty()) {
        return std::nullopt;
    }
    MessageList batch = std::move(deque_batches_.front());
    deque_batches_.pop_front();
    return batch;
}

MessageList DispatchQueue::close() {
    MessageList abandoned;
    {
        std::scoped_lock lock(mutex_);
        flag_closed_ = true;
        for (MessageList& batch : deque_batches_) {
            append_batch(abandoned, batch);
        }
        deque_batches_.clear();
    }
    cv_not_empty_.notify_all();
    return abandoned;
}

bool DispatchQueue::closed() const {
    std::scoped_lock lock(mutex_);
    return flag_closed_;
}

std::size_t DispatchQueue::capacity() const noexcept {
    return capacity_;
}

std::size_t DispatchQueue::pending_batches() const {
    std::scoped_lock lock(mutex_);
    return deque_batches_.size();
}

}  // namespace fleet_sim
