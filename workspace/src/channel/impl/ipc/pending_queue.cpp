#include "ipc/pending_queue.h"
#include "utils/log.h"
#include <iterator>
#include <stdexcept>

namespace vtctl {
namespace ipc {

PendingQueue::PendingQueue(size_t capacity)
    : capacity_(capacity)
    , dropped_(0) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Pending queue capacity must be at least 1");
    }
}

bool PendingQueue::enqueue(std::string payload, SendCompletion completion) {
    bool evicted = false;
    if (queue_.size() >= capacity_) {
        LOGW_FMT("Pending queue full (" << capacity_ << "), dropping oldest message");
        queue_.pop_front();
        dropped_++;
        evicted = true;
    }

    queue_.push_back(PendingMessage{std::move(payload), std::move(completion)});
    LOGD_FMT("Queued message for delivery, pending=" << queue_.size());
    return evicted;
}

std::vector<PendingMessage> PendingQueue::drain() {
    std::vector<PendingMessage> messages(std::make_move_iterator(queue_.begin()),
                                         std::make_move_iterator(queue_.end()));
    queue_.clear();
    return messages;
}

size_t PendingQueue::requeueFront(std::vector<PendingMessage> messages) {
    queue_.insert(queue_.begin(),
                  std::make_move_iterator(messages.begin()),
                  std::make_move_iterator(messages.end()));

    size_t evicted = 0;
    while (queue_.size() > capacity_) {
        queue_.pop_front();
        dropped_++;
        evicted++;
    }
    if (evicted > 0) {
        LOGW_FMT("Pending queue over capacity after requeue, dropped " << evicted << " oldest messages");
    }
    return evicted;
}

void PendingQueue::clear() {
    if (!queue_.empty()) {
        LOGD_FMT("Clearing " << queue_.size() << " pending messages");
    }
    queue_.clear();
}

} // namespace ipc
} // namespace vtctl
