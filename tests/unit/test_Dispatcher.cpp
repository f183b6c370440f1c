#include "TestFixtures.hpp"
#include "concurrency/Dispatcher.hpp"
#include "copy/CopyTask.hpp"
#include "queue/WorkQueue.hpp"

#include <stdexcept>

using namespace mpc;
using namespace mpc::concurrency;
using mpc::test::TempDirTest;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class DispatcherTest : public TempDirTest {
protected:
    fs::path src, dst, queueFile;

    void SetUp() override {
        TempDirTest::SetUp();
        src = test_dir / "src" / "root";
        dst = test_dir / "dst" / "root";
        queueFile = test_dir / "work" / "mpcopy.queue";
        fs::create_directories(src);
        fs::create_directories(dst);
    }

    std::vector<fs::path> makeFiles(const int count) {
        std::vector<fs::path> paths;
        for (int i = 0; i < count; ++i) {
            const fs::path rel = fs::path("dir" + std::to_string(i % 3)) / ("file" + std::to_string(i) + ".txt");
            writeTextFile(src / rel, "payload " + std::to_string(i));
            paths.push_back(rel);
        }
        return paths;
    }

    std::shared_ptr<const copy::CopyContext> context(std::shared_ptr<copy::Copier> copier,
                                                     const unsigned int maxAttempts = 1) const {
        return std::make_shared<copy::CopyContext>(copy::CopyContext{
            .sourceRoot = src,
            .destinationRoot = dst,
            .maxAttempts = maxAttempts,
            .copier = std::move(copier),
            .log = logs
        });
    }

    std::unique_ptr<queue::WorkQueue> makeQueue(const std::vector<fs::path>& paths) const {
        auto q = std::make_unique<queue::WorkQueue>(queueFile, logs);
        (void)q->loadOrInitialize([&] { return paths; });
        return q;
    }
};

TEST_F(DispatcherTest, NeverExceedsWorkerBound) {
    const auto paths = makeFiles(12);
    auto queue = makeQueue(paths);
    const auto copier = std::make_shared<test::SlowCopier>(40ms);

    Dispatcher dispatcher({.workers = 3, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs);
    const auto summary = dispatcher.run(*queue);

    EXPECT_LE(copier->maxInFlight.load(), 3);
    EXPECT_EQ(copier->maxInFlight.load(), 3);
    EXPECT_LE(summary.peakInFlight, 3u);
    EXPECT_EQ(summary.succeeded, 12u);
}

TEST_F(DispatcherTest, SingleWorkerIsSerial) {
    auto queue = makeQueue(makeFiles(5));
    const auto copier = std::make_shared<test::SlowCopier>(10ms);

    Dispatcher dispatcher({.workers = 1, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs);
    (void)dispatcher.run(*queue);

    EXPECT_EQ(copier->maxInFlight.load(), 1);
}

TEST_F(DispatcherTest, EveryPathIsDispatchedOnceAndRetired) {
    const auto paths = makeFiles(9);
    auto queue = makeQueue(paths);
    const auto copier = std::make_shared<test::SlowCopier>(2ms);

    Dispatcher dispatcher({.workers = 4, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs);
    const auto summary = dispatcher.run(*queue);

    EXPECT_EQ(summary.dispatched, paths.size());
    EXPECT_EQ(copier->calls, static_cast<int>(paths.size()));
    for (const auto& p : paths) EXPECT_EQ(copier->seen.count(p.string()), 1u) << p;

    EXPECT_TRUE(queue->empty());
    EXPECT_TRUE(readLines(queueFile).empty());
    EXPECT_FALSE(summary.stopped);
}

TEST_F(DispatcherTest, WorkersExceedingQueueLength) {
    auto queue = makeQueue(makeFiles(2));
    const auto copier = std::make_shared<test::FilesystemCopier>();

    Dispatcher dispatcher({.workers = 16, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs);
    const auto summary = dispatcher.run(*queue);

    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_TRUE(queue->empty());
}

TEST_F(DispatcherTest, EmptyQueueFinishesImmediately) {
    auto queue = makeQueue({});
    const auto copier = std::make_shared<test::FilesystemCopier>();

    Dispatcher dispatcher({.workers = 2, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs);
    const auto summary = dispatcher.run(*queue);

    EXPECT_EQ(summary.dispatched, 0u);
    EXPECT_EQ(copier->calls.load(), 0);
}

TEST_F(DispatcherTest, CopiesLandUnderMirroredDirectories) {
    const auto paths = makeFiles(4);
    auto queue = makeQueue(paths);

    Dispatcher dispatcher({.workers = 2, .pollInterval = 5ms, .failedLog = std::nullopt},
                          context(std::make_shared<test::FilesystemCopier>()), logs);
    const auto summary = dispatcher.run(*queue);

    EXPECT_EQ(summary.succeeded, 4u);
    for (const auto& p : paths) {
        ASSERT_TRUE(fs::exists(dst / p)) << p;
        EXPECT_EQ(readTextFile(dst / p), readTextFile(src / p));
    }
    EXPECT_GT(summary.bytes, 0u);
}

TEST_F(DispatcherTest, FailedCopiesAreRetiredAndRecorded) {
    const auto paths = makeFiles(4);
    auto queue = makeQueue(paths);
    const auto failedLog = test_dir / "work" / "mpcopy.queue.failed";
    const auto copier = std::make_shared<test::FailingCopier>(std::set<std::string>{"file1.txt"});

    Dispatcher dispatcher({.workers = 2, .pollInterval = 5ms, .failedLog = failedLog}, context(copier), logs);
    const auto summary = dispatcher.run(*queue);

    EXPECT_EQ(summary.succeeded, 3u);
    EXPECT_EQ(summary.failed, 1u);
    ASSERT_EQ(summary.failedPaths.size(), 1u);
    EXPECT_EQ(summary.failedPaths.front(), paths[1]);

    // failure does not keep the path queued
    EXPECT_TRUE(queue->empty());

    const std::vector<std::string> expected = {paths[1].string()};
    EXPECT_EQ(readLines(failedLog), expected);
}

TEST_F(DispatcherTest, RetriesUpToMaxAttempts) {
    auto queue = makeQueue(makeFiles(1));
    const auto copier = std::make_shared<test::FailingCopier>(std::set<std::string>{"file0.txt"});

    std::vector<copy::CopyResult> results;
    Dispatcher dispatcher({.workers = 1, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier, 3), logs);
    dispatcher.setObserver([&](const copy::CopyResult& r) { results.push_back(r); });
    const auto summary = dispatcher.run(*queue);

    EXPECT_EQ(copier->calls.load(), 3);
    EXPECT_EQ(summary.failed, 1u);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().attempts, 3u);
    EXPECT_EQ(results.front().exitCode, 23);
}

TEST_F(DispatcherTest, ObserverSeesEveryRetirement) {
    auto queue = makeQueue(makeFiles(6));
    int observed = 0;

    Dispatcher dispatcher({.workers = 3, .pollInterval = 5ms, .failedLog = std::nullopt},
                          context(std::make_shared<test::FilesystemCopier>()), logs);
    dispatcher.setObserver([&](const copy::CopyResult&) { ++observed; });
    (void)dispatcher.run(*queue);

    EXPECT_EQ(observed, 6);
}

TEST_F(DispatcherTest, StopLeavesUndispatchedPathsQueued) {
    const auto paths = makeFiles(10);
    auto queue = makeQueue(paths);
    const auto interrupt = std::make_shared<std::atomic<bool>>(false);
    const auto copier = std::make_shared<test::SlowCopier>(30ms);

    Dispatcher dispatcher({.workers = 2, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs, interrupt);
    // the first retirement frees a slot and raises the flag in the same step
    dispatcher.setObserver([&](const copy::CopyResult&) { interrupt->store(true); });
    const auto summary = dispatcher.run(*queue);

    EXPECT_TRUE(summary.stopped);
    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(copier->calls, 2);
    // in-flight work drained: every dispatched path retired
    EXPECT_EQ(summary.succeeded, summary.dispatched);
    EXPECT_EQ(queue->size(), paths.size() - summary.dispatched);

    // remaining file holds exactly the undispatched suffix
    const auto lines = readLines(queueFile);
    ASSERT_EQ(lines.size(), queue->size());
    for (const auto& line : lines) EXPECT_EQ(copier->seen.count(line), 0u) << line;
}

TEST_F(DispatcherTest, StopBeforeRunDispatchesNothing) {
    auto queue = makeQueue(makeFiles(3));
    const auto copier = std::make_shared<test::FilesystemCopier>();

    Dispatcher dispatcher({.workers = 2, .pollInterval = 5ms, .failedLog = std::nullopt}, context(copier), logs);
    dispatcher.requestStop();
    const auto summary = dispatcher.run(*queue);

    EXPECT_TRUE(summary.stopped);
    EXPECT_EQ(summary.dispatched, 0u);
    EXPECT_EQ(queue->size(), 3u);
}

TEST_F(DispatcherTest, RejectsInvalidConfiguration) {
    const auto ctx = context(std::make_shared<test::FilesystemCopier>());
    EXPECT_THROW(Dispatcher({.workers = 0, .pollInterval = 5ms, .failedLog = std::nullopt}, ctx, logs),
                 std::invalid_argument);
    EXPECT_THROW(Dispatcher({.workers = 1, .pollInterval = 5ms, .failedLog = std::nullopt}, context(nullptr), logs),
                 std::invalid_argument);
}
