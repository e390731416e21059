/**
 * test_task_store.cpp
 */

#include <gtest/gtest.h>

#include "core/downloader/TaskRegistry.hpp"
#include "core/downloader/TaskStore.hpp"
#include "TestSupport.hpp"

namespace surge::test {

class JsonFileTaskStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path path = dir / "state" / "tasks.json";
};

TEST_F(JsonFileTaskStoreTest, LoadAll_EmptyWhenFileMissing) {
    JsonFileTaskStore store(path);
    EXPECT_TRUE(store.loadAll().empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(JsonFileTaskStoreTest, SavedTasksSurviveANewInstance) {
    auto task = makeStoredTask("t1", DownloadStatus::Paused, dir / "t1.bin");
    task.priority = DownloadPriority::Low;
    task.pauseReason = PauseReason::User;
    task.sizeBytes = 4096;
    task.downloadedBytes = 1024;
    task.retryCount = 2;
    task.error = "HTTP 503";
    task.metadata = {{"origin", "cli"}};

    {
        JsonFileTaskStore store(path);
        store.save(task);
    }

    JsonFileTaskStore reopened(path);
    auto loaded = reopened.loadAll();
    ASSERT_EQ(loaded.size(), 1u);

    const auto& restored = loaded[0];
    EXPECT_EQ(restored.id, "t1");
    EXPECT_EQ(restored.status, DownloadStatus::Paused);
    EXPECT_EQ(restored.pauseReason, PauseReason::User);
    EXPECT_EQ(restored.priority, DownloadPriority::Low);
    EXPECT_EQ(restored.downloadedBytes, 1024u);
    EXPECT_EQ(restored.retryCount, 2u);
    ASSERT_TRUE(restored.error.has_value());
    EXPECT_EQ(*restored.error, "HTTP 503");
    EXPECT_EQ(restored.metadata.at("origin").get<std::string>(), "cli");
}

TEST_F(JsonFileTaskStoreTest, DocumentHasNamespaceAndKeyedTasks) {
    JsonFileTaskStore store(path);
    store.save(makeStoredTask("t1", DownloadStatus::Pending, dir / "a"));
    store.save(makeStoredTask("t2", DownloadStatus::Pending, dir / "b", 2));
    store.remove("t1");

    json document = json::parse(readFile(path));
    EXPECT_EQ(document.at("namespace").get<std::string>(), "surge.downloads");
    EXPECT_EQ(document.at("version").get<int>(), 1);
    EXPECT_FALSE(document.at("tasks").contains("t1"));
    EXPECT_TRUE(document.at("tasks").contains("t2"));
    EXPECT_FALSE(fs::exists(fs::path(path.string() + ".tmp")));
}

TEST_F(JsonFileTaskStoreTest, SaveAll_ReplacesTheSet) {
    JsonFileTaskStore store(path);
    store.save(makeStoredTask("old", DownloadStatus::Pending, dir / "a"));
    store.saveAll({makeStoredTask("new", DownloadStatus::Completed, dir / "b")});

    auto loaded = JsonFileTaskStore(path).loadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "new");
}

TEST_F(JsonFileTaskStoreTest, CorruptFile_ThrowsPersistenceError) {
    fs::create_directories(path.parent_path());
    writeFile(path, "{\"namespace\": \"surge.downloads\", \"tasks\": ");

    JsonFileTaskStore store(path);
    EXPECT_THROW(store.loadAll(), PersistenceError);
}

TEST_F(JsonFileTaskStoreTest, ForeignDocument_ThrowsPersistenceError) {
    fs::create_directories(path.parent_path());
    writeFile(path, R"({"namespace": "someone.else", "tasks": {}})");

    JsonFileTaskStore store(path);
    EXPECT_THROW(store.loadAll(), PersistenceError);
}

TEST_F(JsonFileTaskStoreTest, UnreadableRecordIsSkipped) {
    fs::create_directories(path.parent_path());
    json good = makeStoredTask("good", DownloadStatus::Pending, dir / "g");
    json document = {
        {"namespace", "surge.downloads"},
        {"version", 1},
        {"tasks", {{"good", good}, {"bad", {{"url", 5}}}}}
    };
    writeFile(path, document.dump());

    auto loaded = JsonFileTaskStore(path).loadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "good");
}

TEST_F(JsonFileTaskStoreTest, UnserializableRecordIsRejectedAndNotCached) {
    JsonFileTaskStore store(path);
    store.save(makeStoredTask("good", DownloadStatus::Pending, dir / "g"));

    auto bad = makeStoredTask("bad", DownloadStatus::Pending, dir / "b", 2);
    bad.metadata = {{"note", std::string("caf\xE9")}};
    EXPECT_THROW(store.save(bad), PersistenceError);

    // Later writes must not trip over the rejected record
    EXPECT_NO_THROW(store.save(makeStoredTask("next", DownloadStatus::Pending, dir / "n", 3)));

    auto loaded = JsonFileTaskStore(path).loadAll();
    ASSERT_EQ(loaded.size(), 2u);
    for (const auto& task : loaded) {
        EXPECT_NE(task.id, "bad");
    }
}

TEST_F(JsonFileTaskStoreTest, RegistryRejectsInvalidUtf8BeforeItReachesTheFile) {
    auto store = std::make_shared<JsonFileTaskStore>(path);
    TaskRegistry registry(store);

    EXPECT_THROW(registry.create("http://example.com/x", "caf\xE9.bin", dir.str()), ValidationError);
    std::string id = registry.create("http://example.com/x", "ok.bin", dir.str());

    auto loaded = JsonFileTaskStore(path).loadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, id);
}

TEST(TaskStoreTest, Rehydrate_DownloadingBecomesPausedForShutdown) {
    TempDir dir;
    auto a = makeStoredTask("A", DownloadStatus::Downloading, dir / "a", 1);
    a.speedBytesPerSecond = 5000.0;
    a.sizeBytes = 100;
    a.downloadedBytes = 40;
    auto b = makeStoredTask("B", DownloadStatus::Pending, dir / "b", 2);
    auto c = makeStoredTask("C", DownloadStatus::Paused, dir / "c", 3);
    c.pauseReason = PauseReason::User;

    auto tasks = TaskStore::rehydrate({a, b, c});
    ASSERT_EQ(tasks.size(), 3u);

    EXPECT_EQ(tasks[0].status, DownloadStatus::Paused);
    EXPECT_EQ(tasks[0].pauseReason, PauseReason::Shutdown);
    EXPECT_DOUBLE_EQ(tasks[0].speedBytesPerSecond, 0.0);
    EXPECT_EQ(tasks[0].downloadedBytes, 40u);
    EXPECT_DOUBLE_EQ(tasks[0].progressFraction, 0.4);

    EXPECT_EQ(tasks[1].status, DownloadStatus::Pending);
    EXPECT_EQ(tasks[2].status, DownloadStatus::Paused);
    EXPECT_EQ(tasks[2].pauseReason, PauseReason::User);
}

TEST(AsyncTaskStoreTest, WritesReachInnerStoreAfterFlush) {
    TempDir dir;
    auto inner = std::make_shared<InMemoryTaskStore>();
    AsyncTaskStore store(inner);

    auto task = makeStoredTask("t", DownloadStatus::Pending, dir / "t");
    for (uint64_t i = 1; i <= 20; ++i) {
        task.downloadedBytes = i;
        store.save(task);
    }
    store.save(makeStoredTask("gone", DownloadStatus::Pending, dir / "g", 2));
    store.remove("gone");
    store.flush();

    ASSERT_TRUE(inner->find("t").has_value());
    EXPECT_EQ(inner->find("t")->downloadedBytes, 20u);
    EXPECT_FALSE(inner->find("gone").has_value());
}

TEST(AsyncTaskStoreTest, SaveAllIsNotOverwrittenByOlderWrites) {
    TempDir dir;
    auto inner = std::make_shared<InMemoryTaskStore>();
    AsyncTaskStore store(inner);

    store.save(makeStoredTask("stale", DownloadStatus::Pending, dir / "s"));
    store.saveAll({makeStoredTask("kept", DownloadStatus::Pending, dir / "k")});
    store.save(makeStoredTask("later", DownloadStatus::Pending, dir / "l", 2));
    store.flush();

    EXPECT_FALSE(inner->find("stale").has_value());
    EXPECT_TRUE(inner->find("kept").has_value());
    EXPECT_TRUE(inner->find("later").has_value());
}

TEST(AsyncTaskStoreTest, InnerFailureIsContained) {
    TempDir dir;
    auto inner = std::make_shared<InMemoryTaskStore>();
    inner->setFailWrites(true);
    AsyncTaskStore store(inner);

    EXPECT_NO_THROW(store.save(makeStoredTask("t", DownloadStatus::Pending, dir / "t")));
    EXPECT_NO_THROW(store.flush());

    inner->setFailWrites(false);
    store.save(makeStoredTask("t", DownloadStatus::Pending, dir / "t"));
    store.flush();
    EXPECT_TRUE(inner->find("t").has_value());
}

} // namespace surge::test
