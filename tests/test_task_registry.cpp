/**
 * test_task_registry.cpp
 */

#include <gtest/gtest.h>

#include "core/downloader/TaskRegistry.hpp"
#include "TestSupport.hpp"

#include <set>

namespace surge::test {

class TaskRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryTaskStore> store = std::make_shared<InMemoryTaskStore>();
    TaskRegistry registry{store};
};

TEST_F(TaskRegistryTest, Create_StartsPendingAndPersists) {
    DownloadOptions options;
    options.priority = DownloadPriority::High;
    options.metadata = {{"source", "unit"}};

    std::string id = registry.create("https://example.com/a.zip", "a.zip", "/downloads", options);

    auto task = registry.get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, DownloadStatus::Pending);
    EXPECT_EQ(task->priority, DownloadPriority::High);
    EXPECT_EQ(task->destinationPath, (fs::path("/downloads") / "a.zip").string());
    EXPECT_EQ(task->metadata.at("source").get<std::string>(), "unit");
    EXPECT_GT(task->createdAt, 0);
    EXPECT_EQ(task->createdAt, task->updatedAt);
    EXPECT_EQ(task->retryCount, 0u);
    EXPECT_FALSE(task->error.has_value());

    ASSERT_TRUE(store->find(id).has_value());
}

TEST_F(TaskRegistryTest, Create_IdsAreUniqueAndSequenced) {
    std::set<std::string> ids;
    uint64_t lastSequence = 0;
    for (int i = 0; i < 50; ++i) {
        std::string id = registry.create("http://example.com/f", "f" + std::to_string(i), "/d");
        EXPECT_TRUE(ids.insert(id).second);
        auto task = registry.get(id);
        EXPECT_GT(task->sequence, lastSequence);
        lastSequence = task->sequence;
    }
}

TEST_F(TaskRegistryTest, Create_RejectsBadUrls) {
    EXPECT_THROW(registry.create("", "a.bin", "/d"), ValidationError);
    EXPECT_THROW(registry.create("   ", "a.bin", "/d"), ValidationError);
    EXPECT_THROW(registry.create("not a url", "a.bin", "/d"), ValidationError);
    EXPECT_THROW(registry.create("file:///etc/passwd", "a.bin", "/d"), ValidationError);
    EXPECT_EQ(registry.count(), 0u);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(TaskRegistryTest, Create_RejectsBadFilenames) {
    const std::string url = "http://example.com/x";
    for (const std::string name : {"", ".", "..", "a/b", "a\\b", "a:b", "a*b", "a?b", "a|b", "a<b", "a>b", "a\"b"}) {
        EXPECT_THROW(registry.create(url, name, "/d"), ValidationError) << "filename: " << name;
    }
    EXPECT_THROW(registry.create(url, std::string("a\x01z"), "/d"), ValidationError);
    EXPECT_NO_THROW(registry.create(url, "report (final) v2.tar.gz", "/d"));
    EXPECT_EQ(registry.count(), 1u);
}

TEST_F(TaskRegistryTest, Create_RejectsInvalidUtf8) {
    EXPECT_THROW(registry.create("http://example.com/caf\xE9", "a.bin", "/d"), ValidationError);
    EXPECT_THROW(registry.create("http://example.com/x", "caf\xE9.bin", "/d"), ValidationError);

    DownloadOptions options;
    options.metadata = {{"note", std::string("\xFF")}};
    EXPECT_THROW(registry.create("http://example.com/x", "a.bin", "/d", options), ValidationError);

    EXPECT_EQ(registry.count(), 0u);
    EXPECT_EQ(store->size(), 0u);

    EXPECT_NO_THROW(registry.create("http://example.com/x", "caf\xC3\xA9.bin", "/d"));
    EXPECT_EQ(registry.count(), 1u);
}

TEST_F(TaskRegistryTest, Mutate_AppliesPatchAndBumpsUpdatedAt) {
    std::string id = registry.create("http://example.com/x", "x", "/d");
    auto before = registry.get(id);

    ASSERT_TRUE(registry.mutate(id, [](DownloadTask& task) {
        task.sizeBytes = 200;
        task.downloadedBytes = 50;
        return true;
    }));

    auto after = registry.get(id);
    EXPECT_EQ(after->downloadedBytes, 50u);
    EXPECT_DOUBLE_EQ(after->progressFraction, 0.25);
    EXPECT_GE(after->updatedAt, before->updatedAt);
    EXPECT_EQ(store->find(id)->downloadedBytes, 50u);
}

TEST_F(TaskRegistryTest, Mutate_RejectedPatchChangesNothing) {
    std::string id = registry.create("http://example.com/x", "x", "/d");
    int events = 0;
    registry.subscribe([&events](const TaskEvent&) { ++events; });

    EXPECT_FALSE(registry.mutate(id, [](DownloadTask& task) {
        task.downloadedBytes = 99;
        return false;
    }));
    EXPECT_FALSE(registry.mutate("missing", [](DownloadTask&) { return true; }));

    EXPECT_EQ(registry.get(id)->downloadedBytes, 0u);
    EXPECT_EQ(events, 0);
}

TEST_F(TaskRegistryTest, Mutate_ProtectsIdentityAndRetryCount) {
    std::string id = registry.create("http://example.com/x", "x", "/d");
    auto original = registry.get(id);

    registry.mutate(id, [](DownloadTask& task) {
        task.retryCount = 2;
        return true;
    });
    registry.mutate(id, [](DownloadTask& task) {
        task.id = "hijacked";
        task.sequence = 999;
        task.createdAt = 1;
        task.retryCount = 0;
        return true;
    });

    auto task = registry.get(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->id, id);
    EXPECT_EQ(task->sequence, original->sequence);
    EXPECT_EQ(task->createdAt, original->createdAt);
    EXPECT_EQ(task->retryCount, 2u);
    EXPECT_FALSE(registry.get("hijacked").has_value());
}

TEST_F(TaskRegistryTest, Progress_IsZeroWhenSizeUnknownAndOneWhenCompleted) {
    std::string id = registry.create("http://example.com/x", "x", "/d");

    registry.mutate(id, [](DownloadTask& task) {
        task.downloadedBytes = 500;
        return true;
    });
    EXPECT_DOUBLE_EQ(registry.get(id)->progressFraction, 0.0);

    registry.mutate(id, [](DownloadTask& task) {
        task.status = DownloadStatus::Completed;
        return true;
    });
    EXPECT_DOUBLE_EQ(registry.get(id)->progressFraction, 1.0);
}

TEST_F(TaskRegistryTest, Events_AreDeliveredInMutationOrder) {
    std::vector<std::pair<TaskEvent::Kind, uint64_t>> seen;
    registry.subscribe([&seen](const TaskEvent& event) {
        seen.emplace_back(event.kind, event.task.downloadedBytes);
    });

    std::string id = registry.create("http://example.com/x", "x", "/d");
    for (uint64_t i = 1; i <= 3; ++i) {
        registry.mutate(id, [i](DownloadTask& task) {
            task.downloadedBytes = i * 10;
            return true;
        });
    }
    registry.remove(id);

    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen[0].first, TaskEvent::Kind::Created);
    EXPECT_EQ(seen[1].second, 10u);
    EXPECT_EQ(seen[2].second, 20u);
    EXPECT_EQ(seen[3].second, 30u);
    EXPECT_EQ(seen[4].first, TaskEvent::Kind::Removed);
}

TEST_F(TaskRegistryTest, Subscriber_CanReadRegistryFromCallback) {
    size_t observedCount = 0;
    registry.subscribe([this, &observedCount](const TaskEvent&) {
        observedCount = registry.list().size();
    });

    registry.create("http://example.com/x", "x", "/d");
    registry.create("http://example.com/y", "y", "/d");
    EXPECT_EQ(observedCount, 2u);
}

TEST_F(TaskRegistryTest, Unsubscribe_StopsDelivery) {
    int events = 0;
    auto handle = registry.subscribe([&events](const TaskEvent&) { ++events; });

    registry.create("http://example.com/x", "x", "/d");
    EXPECT_TRUE(registry.unsubscribe(handle));
    EXPECT_FALSE(registry.unsubscribe(handle));
    registry.create("http://example.com/y", "y", "/d");

    EXPECT_EQ(events, 1);
}

TEST_F(TaskRegistryTest, List_IsOrderedSnapshot) {
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(registry.create("http://example.com/f", "f" + std::to_string(i), "/d"));
    }

    auto snapshot = registry.list();
    ASSERT_EQ(snapshot.size(), 5u);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(snapshot[i].id, ids[i]);
    }

    registry.remove(ids[0]);
    EXPECT_EQ(snapshot.size(), 5u);

    auto filtered = registry.list([](const DownloadTask& task) { return task.filename == "f3"; });
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].id, ids[3]);
}

TEST_F(TaskRegistryTest, RemoveIf_RespectsPredicate) {
    std::string id = registry.create("http://example.com/x", "x", "/d");

    EXPECT_FALSE(registry.removeIf(id, [](const DownloadTask& t) {
        return t.status == DownloadStatus::Completed;
    }).has_value());
    EXPECT_TRUE(registry.get(id).has_value());

    auto removed = registry.removeIf(id, [](const DownloadTask& t) {
        return t.status == DownloadStatus::Pending;
    });
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->id, id);
    EXPECT_FALSE(registry.get(id).has_value());
    EXPECT_FALSE(store->find(id).has_value());
    EXPECT_FALSE(registry.remove(id));
}

TEST_F(TaskRegistryTest, PersistenceFailure_KeepsInMemoryState) {
    store->setFailWrites(true);

    std::string id;
    ASSERT_NO_THROW(id = registry.create("http://example.com/x", "x", "/d"));
    EXPECT_TRUE(registry.mutate(id, [](DownloadTask& task) {
        task.downloadedBytes = 1;
        return true;
    }));

    EXPECT_EQ(registry.get(id)->downloadedBytes, 1u);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(TaskRegistryTest, Restore_LoadsWithoutPersistingAndContinuesSequence) {
    TempDir dir;
    auto a = makeStoredTask("task-a", DownloadStatus::Paused, dir / "a", 7);
    auto b = makeStoredTask("task-b", DownloadStatus::Pending, dir / "b", 3);

    int created = 0;
    registry.subscribe([&created](const TaskEvent& event) {
        if (event.kind == TaskEvent::Kind::Created) ++created;
    });

    registry.restore({a, b});

    EXPECT_EQ(registry.count(), 2u);
    EXPECT_EQ(created, 2);
    EXPECT_EQ(store->saves(), 0u);

    std::string fresh = registry.create("http://example.com/x", "x", "/d");
    EXPECT_GT(registry.get(fresh)->sequence, 7u);
}

} // namespace surge::test
