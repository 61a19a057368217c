#include "pfetch/download_supervisor.hpp"
#include "pfetch/errors.hpp"

#include "support/scripted_engine.hpp"
#include "support/temp_dir.hpp"
#include "support/test_http_server.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace pfetch {
namespace {

using testing::Gate;
using testing::Route;
using testing::TempDir;
using testing::TestHttpServer;

SupervisorOptions optionsFor(const TempDir& dir, std::size_t max_concurrent = 0) {
    SupervisorOptions options;
    options.download_directory = dir.path();
    options.max_concurrent = max_concurrent;
    options.engine.connect_timeout = std::chrono::seconds(5);
    return options;
}

// Polls until predicate holds or the limit passes.
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds limit = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

TEST(DownloadSupervisorTest, AddRegistersPendingTasksInOrder) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(1, 10)));

    auto first = supervisor.add("http://example.test/a.bin");
    auto second = supervisor.add("http://example.test/b.bin?version=2");

    EXPECT_EQ(first->getState(), TaskState::Pending);
    EXPECT_EQ(first->getDestination(), dir / "a.bin");
    EXPECT_EQ(second->getDestination(), dir / "b.bin");

    const auto tasks = supervisor.tasks();
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0], first);
    EXPECT_EQ(tasks[1], second);
    EXPECT_EQ(supervisor.find(second->getId()), second);
    EXPECT_EQ(supervisor.find("no-such-id"), nullptr);
    EXPECT_EQ(supervisor.activeCount(), 0u);
}

TEST(DownloadSupervisorTest, SameFilenameGetsDistinctDestinations) {
    TempDir dir;
    testing::writeFile(dir / "report.pdf", "already here");
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory({}));

    auto first = supervisor.add("http://example.test/report.pdf");
    auto second = supervisor.add("http://mirror.test/files/report.pdf");

    EXPECT_EQ(first->getDestination(), dir / "report__1.pdf");
    EXPECT_EQ(second->getDestination(), dir / "report__2.pdf");
}

TEST(DownloadSupervisorTest, UrlWithoutFilenameGetsFallbackName) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory({}));

    supervisor.add("http://example.test/one.txt");
    auto bare = supervisor.add("http://example.test/");
    auto host = supervisor.add("http://example.test");

    EXPECT_EQ(bare->getDestination(), dir / "download_2");
    EXPECT_EQ(host->getDestination(), dir / "download_3");
}

TEST(DownloadSupervisorTest, EmptyUrlIsRejected) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory({}));
    EXPECT_THROW(supervisor.add(""), std::invalid_argument);
    EXPECT_EQ(supervisor.size(), 0u);
}

TEST(DownloadSupervisorTest, CreatesMissingDownloadDirectory) {
    TempDir dir;
    SupervisorOptions options = optionsFor(dir);
    options.download_directory = dir / "nested" / "downloads";

    DownloadSupervisor supervisor(options, testing::scriptedFactory({}));

    EXPECT_TRUE(std::filesystem::is_directory(dir / "nested" / "downloads"));
}

TEST(DownloadSupervisorTest, UnknownIdsThrow) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory({}));

    EXPECT_THROW(supervisor.start("missing"), UnknownTask);
    EXPECT_THROW(supervisor.cancel("missing"), UnknownTask);
    EXPECT_THROW(supervisor.remove("missing"), UnknownTask);
}

TEST(DownloadSupervisorTest, StartAllRunsPendingTasksOnly) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(2, 10)));

    auto early = supervisor.add("http://example.test/early");
    supervisor.start(early->getId());
    early->wait();
    EXPECT_THROW(supervisor.start(early->getId()), AlreadyStarted);

    auto late = supervisor.add("http://example.test/late");
    supervisor.startAll();
    supervisor.waitAll();

    EXPECT_EQ(early->getState(), TaskState::Completed);
    EXPECT_EQ(late->getState(), TaskState::Completed);
    EXPECT_TRUE(supervisor.allFinished());

    // Nothing Pending is left; a second call is harmless.
    EXPECT_NO_THROW(supervisor.startAll());
}

TEST(DownloadSupervisorTest, RemoveAndClearRefuseWhileRunning) {
    TempDir dir;
    auto gate = std::make_shared<Gate>();
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(1, 10), gate));

    auto running = supervisor.add("http://example.test/running");
    auto idle = supervisor.add("http://example.test/idle");
    supervisor.start(running->getId());

    EXPECT_THROW(supervisor.clear(), HasActiveDownloads);
    EXPECT_THROW(supervisor.remove(running->getId()), HasActiveDownloads);
    EXPECT_EQ(supervisor.size(), 2u);

    supervisor.remove(idle->getId());
    EXPECT_EQ(supervisor.size(), 1u);

    gate->open();
    supervisor.waitAll();
    supervisor.clear();
    EXPECT_EQ(supervisor.size(), 0u);
    EXPECT_TRUE(supervisor.tasks().empty());
}

TEST(DownloadSupervisorTest, CancelAllLeavesNothingRunning) {
    TempDir dir;
    auto gate = std::make_shared<Gate>();
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(3, 10), gate));

    for (int i = 0; i < 3; ++i) {
        supervisor.add("http://example.test/file" + std::to_string(i));
    }
    supervisor.startAll();
    EXPECT_EQ(supervisor.activeCount(), 3u);

    supervisor.cancelAll();
    supervisor.waitAll();

    for (const auto& task : supervisor.tasks()) {
        EXPECT_EQ(task->getState(), TaskState::Interrupted);
    }
    EXPECT_EQ(supervisor.activeCount(), 0u);
}

TEST(DownloadSupervisorTest, CancelledPendingTaskIsInterruptedWhenStarted) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(1, 10)));

    auto task = supervisor.add("http://example.test/x");
    supervisor.cancel(task->getId());
    supervisor.startAll();
    supervisor.waitAll();

    EXPECT_EQ(task->getState(), TaskState::Interrupted);
}

TEST(DownloadSupervisorTest, ConcurrencyLimitQueuesTasks) {
    TempDir dir;
    auto gate = std::make_shared<Gate>();
    DownloadSupervisor supervisor(optionsFor(dir, 2), testing::scriptedFactory(testing::completedScript(1, 10), gate));

    for (int i = 0; i < 5; ++i) {
        supervisor.add("http://example.test/q" + std::to_string(i));
    }
    supervisor.startAll();

    EXPECT_EQ(supervisor.activeCount(), 2u);
    const auto tasks = supervisor.tasks();
    EXPECT_EQ(tasks[2]->getState(), TaskState::Pending);
    EXPECT_EQ(tasks[4]->getState(), TaskState::Pending);
    EXPECT_THROW(supervisor.start(tasks[3]->getId()), AlreadyStarted);

    gate->open();
    supervisor.waitAll();

    for (const auto& task : supervisor.tasks()) {
        EXPECT_EQ(task->getState(), TaskState::Completed);
    }
    EXPECT_EQ(gate->entered(), 5);
}

TEST(DownloadSupervisorTest, ChannelKeepsPerTaskOrder) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(20, 7)));

    for (int i = 0; i < 6; ++i) {
        supervisor.add("http://example.test/o" + std::to_string(i));
    }
    supervisor.startAll();
    supervisor.waitAll();

    std::map<std::string, std::vector<DownloadEvent>> per_task;
    for (auto& event : supervisor.events().drain()) {
        per_task[event.task_id].push_back(std::move(event));
    }

    ASSERT_EQ(per_task.size(), 6u);
    for (const auto& entry : per_task) {
        const auto& events = entry.second;
        ASSERT_EQ(events.size(), 21u);
        std::uint64_t previous = 0;
        for (std::size_t i = 0; i + 1 < events.size(); ++i) {
            const auto& progress = std::get<ProgressPayload>(events[i].payload);
            EXPECT_GT(progress.bytes_downloaded, previous);
            previous = progress.bytes_downloaded;
        }
        EXPECT_EQ(events.back().kind(), EventKind::Completed);
    }
}

TEST(DownloadSupervisorTest, SnapshotsFollowCreationOrder) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(1, 10)));
    auto a = supervisor.add("http://example.test/a");
    auto b = supervisor.add("http://example.test/b");
    supervisor.start(b->getId());
    supervisor.waitAll();

    const auto snapshots = supervisor.snapshots();
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0].id, a->getId());
    EXPECT_EQ(snapshots[0].state, TaskState::Pending);
    EXPECT_EQ(snapshots[1].id, b->getId());
    EXPECT_EQ(snapshots[1].state, TaskState::Completed);
}

TEST(DownloadSupervisorTest, DestructorCancelsAndWaits) {
    TempDir dir;
    auto gate = std::make_shared<Gate>();
    std::vector<DownloadTaskPtr> tasks;
    {
        DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory(testing::completedScript(1, 10), gate));
        tasks.push_back(supervisor.add("http://example.test/d1"));
        tasks.push_back(supervisor.add("http://example.test/d2"));
        supervisor.startAll();
    }

    for (const auto& task : tasks) {
        EXPECT_EQ(task->getState(), TaskState::Interrupted);
    }
}

// The supervisor holds the only task references, so tearing it down right
// after the terminal event must not leave the last owner on an engine thread.
TEST(DownloadSupervisorTest, DestroyedRightAfterTerminalEvent) {
    TempDir dir;
    for (int round = 0; round < 50; ++round) {
        DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory({CompletedPayload{0, "x"}}));
        supervisor.add("http://example.test/teardown" + std::to_string(round));
        supervisor.startAll();

        bool terminal = false;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!terminal && std::chrono::steady_clock::now() < deadline) {
            if (auto event = supervisor.events().waitPop(std::chrono::milliseconds(100))) {
                terminal = event->isTerminal();
            }
        }
        ASSERT_TRUE(terminal);
    }
}

TEST(DownloadSupervisorTest, WaitAllReturnsAfterTerminalEventsArePublished) {
    TempDir dir;
    DownloadSupervisor supervisor(optionsFor(dir), testing::scriptedFactory({CompletedPayload{0, "x"}}));

    for (int round = 0; round < 50; ++round) {
        auto task = supervisor.add("http://example.test/drain" + std::to_string(round));
        supervisor.start(task->getId());
        supervisor.waitAll();

        const auto events = supervisor.events().drain();
        const bool has_terminal = std::any_of(events.begin(), events.end(), [&task](const DownloadEvent& event) {
            return event.task_id == task->getId() && event.isTerminal();
        });
        EXPECT_TRUE(has_terminal) << "round " << round;
    }
}

class DownloadSupervisorHttpTest : public ::testing::Test {
protected:
    TestHttpServer server_;
    TempDir dir_;
};

TEST_F(DownloadSupervisorHttpTest, DownloadsFilesConcurrently) {
    std::vector<std::string> bodies;
    for (int i = 0; i < 3; ++i) {
        Route route;
        route.body = testing::makeBody(20000 + static_cast<std::size_t>(i) * 1000);
        route.chunk_size = 4096;
        route.chunk_delay = std::chrono::milliseconds(2);
        server_.addRoute("/file" + std::to_string(i) + ".bin", route);
        bodies.push_back(route.body);
    }

    DownloadSupervisor supervisor(optionsFor(dir_));
    for (int i = 0; i < 3; ++i) {
        supervisor.add(server_.url("/file" + std::to_string(i) + ".bin"));
    }
    supervisor.startAll();
    supervisor.waitAll();

    for (int i = 0; i < 3; ++i) {
        const auto path = dir_ / ("file" + std::to_string(i) + ".bin");
        EXPECT_EQ(testing::readFile(path), bodies[static_cast<std::size_t>(i)]);
    }
    for (const auto& task : supervisor.tasks()) {
        EXPECT_EQ(task->getState(), TaskState::Completed);
    }
}

TEST_F(DownloadSupervisorHttpTest, MissingFileFailsOnlyItsTask) {
    Route ok;
    ok.body = "payload";
    server_.addRoute("/ok.txt", ok);

    DownloadSupervisor supervisor(optionsFor(dir_));
    auto good = supervisor.add(server_.url("/ok.txt"));
    auto missing = supervisor.add(server_.url("/gone.txt"));
    supervisor.startAll();
    supervisor.waitAll();

    EXPECT_EQ(good->getState(), TaskState::Completed);
    EXPECT_EQ(missing->getState(), TaskState::Failed);
    EXPECT_EQ(missing->getProgress().error_message, "Server returned HTTP 404");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "gone.txt"));

    bool saw_error = false;
    for (const auto& event : supervisor.events().drain()) {
        if (event.task_id == missing->getId() && event.kind() == EventKind::Error) {
            saw_error = true;
            EXPECT_EQ(std::get<ErrorPayload>(event.payload).category, ErrorCategory::Network);
        }
    }
    EXPECT_TRUE(saw_error);
}

TEST_F(DownloadSupervisorHttpTest, InterruptAllRemovesPartialFiles) {
    for (int i = 0; i < 3; ++i) {
        Route route;
        route.body = testing::makeBody(512 * 1024);
        route.chunk_size = 1024;
        route.chunk_delay = std::chrono::milliseconds(10);
        server_.addRoute("/big" + std::to_string(i), route);
    }

    DownloadSupervisor supervisor(optionsFor(dir_));
    for (int i = 0; i < 3; ++i) {
        supervisor.add(server_.url("/big" + std::to_string(i)));
    }
    supervisor.startAll();

    ASSERT_TRUE(eventually([&supervisor] {
        const auto tasks = supervisor.tasks();
        return std::all_of(tasks.begin(), tasks.end(),
                           [](const DownloadTaskPtr& task) { return task->getBytesDownloaded() > 0; });
    }));
    supervisor.cancelAll();
    supervisor.waitAll();

    for (const auto& task : supervisor.tasks()) {
        EXPECT_EQ(task->getState(), TaskState::Interrupted);
        EXPECT_FALSE(std::filesystem::exists(task->getDestination())) << task->getDestination();
    }
}

} // namespace
} // namespace pfetch
