#include "parafetch/event_channel.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

namespace parafetch {
namespace {

using namespace std::chrono_literals;

TEST(EventChannelTest, DeliversEventsInOrder) {
    auto channel = std::make_shared<EventChannel>();
    ChannelObserver observer(channel);

    observer.onProgress("a.bin", 10, 100);
    observer.onProgress("a.bin", 20, std::nullopt);
    observer.onStatus("a.bin", TransferStatus::Completed, "/tmp/a.bin");

    auto first = channel->tryPop();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->kind, TransferEvent::Kind::Progress);
    EXPECT_EQ(first->progress.downloaded_bytes, 10u);
    EXPECT_EQ(first->progress.total_bytes.value_or(0), 100u);

    auto second = channel->tryPop();
    ASSERT_TRUE(second);
    EXPECT_FALSE(second->progress.total_bytes.has_value());

    auto third = channel->tryPop();
    ASSERT_TRUE(third);
    EXPECT_EQ(third->kind, TransferEvent::Kind::Status);
    EXPECT_EQ(third->status, TransferStatus::Completed);
    EXPECT_EQ(third->info, "/tmp/a.bin");

    EXPECT_FALSE(channel->tryPop());
}

TEST(EventChannelTest, PopWaitsForAProducer) {
    EventChannel channel;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        TransferEvent event;
        event.progress.filename = "late.bin";
        channel.push(event);
    });

    auto event = channel.pop(2s);
    producer.join();
    ASSERT_TRUE(event);
    EXPECT_EQ(event->progress.filename, "late.bin");
}

TEST(EventChannelTest, CloseDrainsThenStops) {
    EventChannel channel;
    channel.push(TransferEvent{});
    channel.close();
    channel.push(TransferEvent{});

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.drained());
    EXPECT_TRUE(channel.pop(10ms));
    EXPECT_TRUE(channel.drained());
    EXPECT_FALSE(channel.pop(10ms));
}

TEST(EventChannelTest, StatusNames) {
    EXPECT_EQ(statusName(TransferStatus::Completed), "completed");
    EXPECT_EQ(statusName(TransferStatus::Failed), "failed");
}

} // namespace
} // namespace parafetch
