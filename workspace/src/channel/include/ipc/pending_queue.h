#ifndef VTCTL_IPC_PENDING_QUEUE_H
#define VTCTL_IPC_PENDING_QUEUE_H

#include "channel_types.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace vtctl {
namespace ipc {

/**
 * @brief Outbound message accepted while no connection was available
 */
struct PendingMessage {
    std::string payload;

    /** Invoked with the outcome once the message is written; may be empty */
    SendCompletion completion;
};

/**
 * @brief Bounded FIFO of messages waiting for a live connection
 *
 * When full, enqueue() evicts the oldest message without invoking its
 * completion. Not thread-safe; owned by the connection manager's control
 * thread.
 */
class PendingQueue {
public:
    explicit PendingQueue(size_t capacity = 100);

    /**
     * @brief Append a message, evicting the oldest if the queue is full
     * @return true if a message was evicted
     */
    bool enqueue(std::string payload, SendCompletion completion = nullptr);

    /**
     * @brief Remove and return all messages in FIFO order
     */
    std::vector<PendingMessage> drain();

    /**
     * @brief Put unsent messages back ahead of everything queued
     *
     * Used when a flush is interrupted; the oldest entries are evicted if
     * the result exceeds the capacity.
     *
     * @return Number of messages evicted
     */
    size_t requeueFront(std::vector<PendingMessage> messages);

    void clear();

    size_t size() const { return queue_.size(); }
    bool empty() const { return queue_.empty(); }
    size_t capacity() const { return capacity_; }

    /** Messages evicted since construction */
    uint64_t droppedCount() const { return dropped_; }

private:
    size_t capacity_;
    std::deque<PendingMessage> queue_;
    uint64_t dropped_;
};

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_PENDING_QUEUE_H
