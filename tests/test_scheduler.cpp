/**
 * test_scheduler.cpp
 */

#include <gtest/gtest.h>

#include "core/downloader/Scheduler.hpp"
#include "TestSupport.hpp"

namespace surge::test {

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Script held;
        held.holdAt = 0;
        transport->setDefault(held);
    }

    std::string submit(const std::string& name, DownloadPriority priority = DownloadPriority::Normal) {
        DownloadOptions options;
        options.priority = priority;
        return registry.create(url(name), name, dir.str(), options);
    }

    static std::string url(const std::string& name) {
        return "http://files.example.test/" + name;
    }

    TempDir dir;
    uint32_t cap{1};
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    TaskRegistry registry{std::make_shared<InMemoryTaskStore>()};
    TransferExecutor executor{registry, transport, [] { return DownloadSettings{}; }};
    Scheduler scheduler{registry, executor, [this] { return cap; }};
};

TEST_F(SchedulerTest, HighestPriorityIsAdmittedFirst) {
    std::string low = submit("low", DownloadPriority::Low);
    std::string normal = submit("normal", DownloadPriority::Normal);
    std::string high = submit("high", DownloadPriority::High);

    EXPECT_EQ(scheduler.admit(), 1u);
    EXPECT_TRUE(executor.isActive(high));
    EXPECT_EQ(registry.get(high)->status, DownloadStatus::Downloading);
    EXPECT_EQ(registry.get(normal)->status, DownloadStatus::Pending);
    EXPECT_EQ(registry.get(low)->status, DownloadStatus::Pending);
}

TEST_F(SchedulerTest, EqualPriorityIsFirstInFirstOut) {
    std::string first = submit("first");
    submit("second");
    submit("third");

    EXPECT_EQ(scheduler.admit(), 1u);
    EXPECT_TRUE(executor.isActive(first));
}

TEST_F(SchedulerTest, AdmitsUpToTheCap) {
    cap = 2;
    for (int i = 0; i < 5; ++i) {
        submit("f" + std::to_string(i));
    }

    EXPECT_EQ(scheduler.admit(), 2u);
    EXPECT_EQ(scheduler.admit(), 0u);
    EXPECT_EQ(executor.activeCount(), 2u);
    EXPECT_EQ(scheduler.pendingQueue().size(), 3u);
}

TEST_F(SchedulerTest, ZeroCapBehavesAsOne) {
    cap = 0;
    submit("a");
    submit("b");

    EXPECT_EQ(scheduler.admit(), 1u);
    EXPECT_EQ(executor.activeCount(), 1u);
}

TEST_F(SchedulerTest, FreedSlotAdmitsTheNextTask) {
    std::string first = submit("first");
    std::string second = submit("second");

    ASSERT_EQ(scheduler.admit(), 1u);
    transport->release(url("first"));
    ASSERT_TRUE(waitFor([&] { return !executor.isActive(first); }));
    EXPECT_EQ(registry.get(first)->status, DownloadStatus::Completed);

    EXPECT_EQ(scheduler.admit(), 1u);
    EXPECT_TRUE(executor.isActive(second));
}

TEST_F(SchedulerTest, OfflineSuspendsAdmission) {
    submit("a");

    scheduler.setOnline(false);
    EXPECT_FALSE(scheduler.isOnline());
    EXPECT_EQ(scheduler.admit(), 0u);
    EXPECT_EQ(executor.activeCount(), 0u);

    scheduler.setOnline(true);
    EXPECT_EQ(scheduler.admit(), 1u);
}

TEST_F(SchedulerTest, HaltSuspendsAdmission) {
    submit("a");

    scheduler.setHalted(true);
    EXPECT_TRUE(scheduler.isHalted());
    EXPECT_EQ(scheduler.admit(), 0u);

    scheduler.setHalted(false);
    EXPECT_EQ(scheduler.admit(), 1u);
}

TEST_F(SchedulerTest, PausedTasksAreNotAdmitted) {
    std::string id = submit("a");
    registry.mutate(id, [](DownloadTask& task) {
        task.status = DownloadStatus::Paused;
        task.pauseReason = PauseReason::User;
        return true;
    });

    EXPECT_EQ(scheduler.admit(), 0u);
    EXPECT_TRUE(scheduler.pendingQueue().empty());
}

TEST_F(SchedulerTest, PendingQueue_IsInAdmissionOrder) {
    std::string normal1 = submit("n1");
    std::string low = submit("low", DownloadPriority::Low);
    std::string high = submit("high", DownloadPriority::High);
    std::string normal2 = submit("n2");

    auto queue = scheduler.pendingQueue();
    ASSERT_EQ(queue.size(), 4u);
    EXPECT_EQ(queue[0].id, high);
    EXPECT_EQ(queue[1].id, normal1);
    EXPECT_EQ(queue[2].id, normal2);
    EXPECT_EQ(queue[3].id, low);
}

TEST(SchedulerOrderTest, ComesBefore_PriorityThenCreatedAtThenSequence) {
    DownloadTask a;
    a.priority = DownloadPriority::Normal;
    a.createdAt = 100;
    a.sequence = 5;

    DownloadTask b = a;
    b.priority = DownloadPriority::High;
    b.createdAt = 200;
    EXPECT_TRUE(Scheduler::comesBefore(b, a));
    EXPECT_FALSE(Scheduler::comesBefore(a, b));

    DownloadTask c = a;
    c.createdAt = 50;
    c.sequence = 9;
    EXPECT_TRUE(Scheduler::comesBefore(c, a));

    DownloadTask d = a;
    d.sequence = 6;
    EXPECT_TRUE(Scheduler::comesBefore(a, d));
    EXPECT_FALSE(Scheduler::comesBefore(a, a));
}

} // namespace surge::test
