#include <gtest/gtest.h>
#include "backup/job_event_channel.hpp"
#include <thread>

class JobEventChannelTest : public ::testing::Test {
protected:
    static JobEvent makeEvent(JobEventType type, const std::string& jobId, int progress = 0) {
        JobEvent event;
        event.type = type;
        event.job.id = jobId;
        event.job.storageType = "postgres";
        event.job.progress = progress;
        event.timestamp = std::chrono::system_clock::now();
        return event;
    }

    JobEventChannel channel_;
};

TEST_F(JobEventChannelTest, EverySubscriberReceivesEvents) {
    auto first = channel_.subscribe();
    auto second = channel_.subscribe();
    channel_.publish(makeEvent(JobEventType::Started, "job-1"));

    auto a = first->poll();
    auto b = second->poll();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->job.id, "job-1");
    EXPECT_EQ(b->type, JobEventType::Started);
    EXPECT_FALSE(first->poll().has_value());
}

TEST_F(JobEventChannelTest, FullMailboxDropsOldest) {
    auto subscription = channel_.subscribe(2);
    channel_.publish(makeEvent(JobEventType::Progress, "job-1", 10));
    channel_.publish(makeEvent(JobEventType::Progress, "job-1", 20));
    channel_.publish(makeEvent(JobEventType::Progress, "job-1", 30));

    EXPECT_EQ(subscription->droppedCount(), 1u);
    EXPECT_EQ(subscription->pending(), 2u);
    auto events = subscription->drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].job.progress, 20);
    EXPECT_EQ(events[1].job.progress, 30);
}

TEST_F(JobEventChannelTest, SlowSubscriberDoesNotAffectOthers) {
    auto slow = channel_.subscribe(1);
    auto fast = channel_.subscribe();
    for (int i = 0; i < 5; ++i) {
        channel_.publish(makeEvent(JobEventType::Progress, "job-1", i * 10));
    }
    EXPECT_EQ(slow->droppedCount(), 4u);
    EXPECT_EQ(fast->droppedCount(), 0u);
    EXPECT_EQ(fast->pending(), 5u);
}

TEST_F(JobEventChannelTest, DroppedSubscriptionIsPruned) {
    auto kept = channel_.subscribe();
    {
        auto temporary = channel_.subscribe();
        EXPECT_EQ(channel_.subscriberCount(), 2u);
    }
    EXPECT_EQ(channel_.subscriberCount(), 1u);
    channel_.publish(makeEvent(JobEventType::Completed, "job-1"));
    EXPECT_EQ(kept->pending(), 1u);
}

TEST_F(JobEventChannelTest, ClosedSubscriptionIgnoresEvents) {
    auto subscription = channel_.subscribe();
    subscription->close();
    EXPECT_TRUE(subscription->isClosed());
    channel_.publish(makeEvent(JobEventType::Failed, "job-1"));
    EXPECT_EQ(subscription->pending(), 0u);
    EXPECT_EQ(channel_.subscriberCount(), 0u);
}

TEST_F(JobEventChannelTest, WaitNextTimesOut) {
    auto subscription = channel_.subscribe();
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(subscription->waitNext(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(25));
}

TEST_F(JobEventChannelTest, WaitNextWakesOnPublish) {
    auto subscription = channel_.subscribe();
    std::thread publisher([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel_.publish(makeEvent(JobEventType::Cancelled, "job-2"));
    });
    auto event = subscription->waitNext(std::chrono::seconds(5));
    publisher.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, JobEventType::Cancelled);
    EXPECT_EQ(event->job.id, "job-2");
}

TEST_F(JobEventChannelTest, CloseWakesWaiter) {
    auto subscription = channel_.subscribe();
    std::thread closer([subscription] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        subscription->close();
    });
    EXPECT_FALSE(subscription->waitNext(std::chrono::seconds(5)).has_value());
    closer.join();
}

TEST_F(JobEventChannelTest, EventSerializesTypeName) {
    nlohmann::json j = makeEvent(JobEventType::Completed, "job-3");
    EXPECT_EQ(j["type"], "completed");
    EXPECT_EQ(j["job"]["id"], "job-3");
}
