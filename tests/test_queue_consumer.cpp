#include <gtest/gtest.h>
#include "../src/runner/queue_consumer.hpp"
#include "../src/sink/s3_sink_task.hpp"
#include "fake_s3_client.hpp"
#include <atomic>
#include <chrono>
#include <memory>

TEST(QueueConsumerTest, BackoffGrowsExponentially) {
    for (int i = 0; i < 20; ++i) {
        auto first = QueueConsumer::calculateBackoff(0, 100, 10000);
        auto third = QueueConsumer::calculateBackoff(2, 100, 10000);

        // base * 2^attempt plus up to 50% jitter
        EXPECT_GE(first.count(), 100);
        EXPECT_LE(first.count(), 150);
        EXPECT_GE(third.count(), 400);
        EXPECT_LE(third.count(), 600);
    }
}

TEST(QueueConsumerTest, BackoffIsCapped) {
    for (int i = 0; i < 20; ++i) {
        auto delay = QueueConsumer::calculateBackoff(30, 500, 2000);
        EXPECT_GE(delay.count(), 2000);
        EXPECT_LE(delay.count(), 3000);
    }
}

// Without brokers the consumer refuses to initialize
TEST(QueueConsumerTest, InitializeRequiresBrokersAndTopics) {
    auto client = std::make_shared<FakeS3Client>("test-bucket");
    S3SinkTask task;
    task.start({{"s3.bucket.name", "test-bucket"}, {"flush.size", "10"}}, client);

    std::atomic<bool> running(true);
    std::atomic<bool> force_flush(false);
    QueueConsumer consumer(task.getConfig(), task, running, force_flush);

    EXPECT_FALSE(consumer.initialize());
    EXPECT_THROW(consumer.start(), SinkException);
    EXPECT_EQ(consumer.getStats().records_consumed.load(), 0u);
}
