#include "fleet_sim/priority_buffer.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace fleet_sim {

void PriorityBuffer::accumulate(Message message) {
    std::scoped_lock lock(mutex_);
    list_pending_.push_back(std::move(message));
}

FlushResult PriorityBuffer::flush(std::size_t capacity) {
    MessageList snapshot;
    {
        std::scoped_lock lock(mutex_);
        snapshot.swap(list_pending_);
    }

    std::stable_sort(snapshot.begin(), snapshot.end(), [](const Message& lhs, const Message& rhs) {
        return lhs.priority() > rhs.priority();
    });

    FlushResult result{};
    const std::size_t retained_count = std::min(capacity, snapshot.size());
    const auto split = snapshot.begin() + static_cast<MessageList::difference_type>(retained_count);
    result.retained.assign(std::make_move_iterator(snapshot.begin()), std::make_move_iterator(split));
    result.dropped.assign(std::make_move_iterator(split), std::make_move_iterator(snapshot.end()));
    return result;
}

std::size_t PriorityBuffer::pending_count() const {
    std::scoped_lock lock(mutex_);
    return list_pending_.size();
}

}  // namespace fleet_sim
