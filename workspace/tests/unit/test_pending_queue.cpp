#include "ipc/pending_queue.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vtctl::ipc;

TEST(PendingQueueTest, FifoOrder) {
    PendingQueue queue;

    queue.enqueue("a");
    queue.enqueue("b");
    queue.enqueue("c");
    EXPECT_EQ(queue.size(), 3u);

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 3u);
    EXPECT_EQ(drained[0].payload, "a");
    EXPECT_EQ(drained[1].payload, "b");
    EXPECT_EQ(drained[2].payload, "c");
    EXPECT_TRUE(queue.empty());
}

TEST(PendingQueueTest, OverflowEvictsOldest) {
    PendingQueue queue(100);
    std::vector<int> completed;

    for (int i = 1; i <= 101; ++i) {
        bool evicted = queue.enqueue("msg" + std::to_string(i),
                                     [&completed, i](const ChannelStatus&) { completed.push_back(i); });
        EXPECT_EQ(evicted, i == 101);
    }

    EXPECT_EQ(queue.size(), 100u);
    EXPECT_EQ(queue.droppedCount(), 1u);

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 100u);
    EXPECT_EQ(drained.front().payload, "msg2");
    EXPECT_EQ(drained.back().payload, "msg101");

    // The evicted message never gets a completion
    EXPECT_TRUE(completed.empty());
    for (auto& message : drained) {
        message.completion(ChannelStatus::ok());
    }
    ASSERT_EQ(completed.size(), 100u);
    EXPECT_EQ(completed.front(), 2);
}

TEST(PendingQueueTest, RequeueFrontKeepsOrder) {
    PendingQueue queue(10);
    queue.enqueue("1");
    queue.enqueue("2");
    queue.enqueue("3");

    auto drained = queue.drain();
    queue.enqueue("4");

    // "1" was sent, the rest goes back ahead of newer messages
    std::vector<PendingMessage> unsent(drained.begin() + 1, drained.end());
    EXPECT_EQ(queue.requeueFront(std::move(unsent)), 0u);

    auto order = queue.drain();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0].payload, "2");
    EXPECT_EQ(order[1].payload, "3");
    EXPECT_EQ(order[2].payload, "4");
}

TEST(PendingQueueTest, RequeueFrontTrimsOldest) {
    PendingQueue queue(3);
    queue.enqueue("new1");
    queue.enqueue("new2");

    std::vector<PendingMessage> unsent;
    unsent.push_back(PendingMessage{"old1", nullptr});
    unsent.push_back(PendingMessage{"old2", nullptr});

    EXPECT_EQ(queue.requeueFront(std::move(unsent)), 1u);
    EXPECT_EQ(queue.droppedCount(), 1u);

    auto order = queue.drain();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0].payload, "old2");
    EXPECT_EQ(order[1].payload, "new1");
    EXPECT_EQ(order[2].payload, "new2");
}

TEST(PendingQueueTest, ClearDropsEverything) {
    PendingQueue queue;
    queue.enqueue("x");
    queue.enqueue("y");

    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.drain().empty());
    EXPECT_EQ(queue.droppedCount(), 0u);
}

TEST(PendingQueueTest, ZeroCapacityRejected) {
    EXPECT_THROW(PendingQueue{0}, std::invalid_argument);
}
