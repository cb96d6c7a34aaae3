#include <gtest/gtest.h>

#include "pipeline/Watcher.hpp"
#include "fakes.hpp"

#include <condition_variable>
#include <functional>

using namespace lc::pipeline;
using namespace lc::pipeline::model;
using namespace lc::test;
using namespace std::chrono_literals;

class WatcherTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path source() const { return dir / "outbox"; }

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<WatchEvent> events;

    void SetUp() override { fs::create_directories(source()); }

    std::unique_ptr<Watcher> makeWatcher(const bool touchExisting = false) {
        return std::make_unique<Watcher>(source(), touchExisting, [this](WatchEvent ev) {
            {
                std::scoped_lock lock(mutex);
                events.push_back(std::move(ev));
            }
            cv.notify_all();
            return true;
        });
    }

    bool waitFor(const std::function<bool(const std::vector<WatchEvent>&)>& pred,
                 const std::chrono::milliseconds timeout = 5s) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return pred(events); });
    }

    bool waitForEvent(const WatchEvent::Kind kind, const fs::path& path) {
        return waitFor([&](const std::vector<WatchEvent>& evs) {
            return std::ranges::any_of(evs, [&](const WatchEvent& e) { return e.kind == kind && e.path == path; });
        });
    }

    std::vector<WatchEvent> snapshot() {
        std::scoped_lock lock(mutex);
        return events;
    }
};

TEST_F(WatcherTest, AnnouncesNewFileOnceWriterCloses) {
    const auto watcher = makeWatcher();
    watcher->start();

    writeFile(source() / "066-129999-9.pdf", PDF_BYTES);

    ASSERT_TRUE(waitForEvent(WatchEvent::Kind::Created, source() / "066-129999-9.pdf"));
    watcher->stop();

    const auto evs = snapshot();
    EXPECT_EQ(std::ranges::count_if(evs, [](const WatchEvent& e) { return e.kind == WatchEvent::Kind::Created; }), 1);
}

TEST_F(WatcherTest, DoesNotAnnounceFileStillBeingWritten) {
    const auto watcher = makeWatcher();
    watcher->start();

    {
        std::ofstream out(source() / "big.pdf", std::ios::binary);
        out << PDF_BYTES;
        out.flush();

        std::this_thread::sleep_for(300ms);
        EXPECT_TRUE(snapshot().empty());
    }

    EXPECT_TRUE(waitForEvent(WatchEvent::Kind::Created, source() / "big.pdf"));
}

TEST_F(WatcherTest, TouchExistingAnnouncesFilesInNameOrder) {
    writeFile(source() / "b.pdf", PDF_BYTES);
    writeFile(source() / "a.pdf", PDF_BYTES);
    writeFile(source() / "c.txt", "x");
    fs::create_directory(source() / "subdir");

    const auto watcher = makeWatcher(true);
    watcher->start();

    ASSERT_TRUE(waitFor([](const auto& evs) { return evs.size() >= 3; }));
    watcher->stop();

    const auto evs = snapshot();
    ASSERT_EQ(evs.size(), 3u);
    EXPECT_EQ(evs[0].path, source() / "a.pdf");
    EXPECT_EQ(evs[1].path, source() / "b.pdf");
    EXPECT_EQ(evs[2].path, source() / "c.txt");
    for (const auto& e : evs) EXPECT_EQ(e.kind, WatchEvent::Kind::Created);
}

TEST_F(WatcherTest, RenameInsideDirectoryIsMoved) {
    writeFile(source() / "old.tmp", PDF_BYTES);
    const auto watcher = makeWatcher();
    watcher->start();

    fs::rename(source() / "old.tmp", source() / "new.pdf");

    ASSERT_TRUE(waitForEvent(WatchEvent::Kind::Moved, source() / "new.pdf"));
    const auto evs = snapshot();
    const auto it = std::ranges::find_if(evs, [](const WatchEvent& e) { return e.kind == WatchEvent::Kind::Moved; });
    ASSERT_NE(it, evs.end());
    EXPECT_EQ(it->fromPath, source() / "old.tmp");
}

TEST_F(WatcherTest, MoveInIsCreatedAndMoveOutIsDeleted) {
    writeFile(dir / "staging" / "in.pdf", PDF_BYTES);
    writeFile(source() / "out.pdf", PDF_BYTES);
    const auto watcher = makeWatcher();
    watcher->start();

    fs::rename(dir / "staging" / "in.pdf", source() / "in.pdf");
    fs::rename(source() / "out.pdf", dir / "staging" / "out.pdf");

    EXPECT_TRUE(waitForEvent(WatchEvent::Kind::Created, source() / "in.pdf"));
    EXPECT_TRUE(waitForEvent(WatchEvent::Kind::Deleted, source() / "out.pdf"));
}

TEST_F(WatcherTest, ReportsDeletionAndModification) {
    writeFile(source() / "keep.pdf", PDF_BYTES);
    writeFile(source() / "drop.pdf", PDF_BYTES);
    const auto watcher = makeWatcher();
    watcher->start();

    {
        std::ofstream out(source() / "keep.pdf", std::ios::app);
        out << "% appended\n";
    }
    fs::remove(source() / "drop.pdf");

    EXPECT_TRUE(waitForEvent(WatchEvent::Kind::Modified, source() / "keep.pdf"));
    EXPECT_TRUE(waitForEvent(WatchEvent::Kind::Deleted, source() / "drop.pdf"));
}

TEST_F(WatcherTest, IgnoresDirectories) {
    const auto watcher = makeWatcher();
    watcher->start();

    fs::create_directory(source() / "nested");
    writeFile(source() / "marker.pdf", PDF_BYTES);

    ASSERT_TRUE(waitForEvent(WatchEvent::Kind::Created, source() / "marker.pdf"));
    for (const auto& e : snapshot()) EXPECT_NE(e.path, source() / "nested");
}

TEST_F(WatcherTest, StopsPromptly) {
    const auto watcher = makeWatcher();
    watcher->start();
    EXPECT_TRUE(watcher->isRunning());

    const auto started = std::chrono::steady_clock::now();
    watcher->stop();
    EXPECT_FALSE(watcher->isRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST_F(WatcherTest, MissingDirectoryFailsToStart) {
    const auto watcher = std::make_unique<Watcher>(dir / "nope", false, [](WatchEvent) { return true; });
    EXPECT_THROW(watcher->start(), std::runtime_error);
}
