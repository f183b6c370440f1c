#include "TestFixtures.hpp"
#include "runtime/Orchestrator.hpp"
#include "runtime/RunStatus.hpp"
#include "queue/WorkQueue.hpp"

#include <nlohmann/json.hpp>

using namespace mpc;
using namespace mpc::runtime;
using mpc::test::TempDirTest;
namespace fs = std::filesystem;

class OrchestratorTest : public TempDirTest {
protected:
    fs::path src, dst, work;
    config::Config cnf;
    std::shared_ptr<test::FilesystemCopier> copier = std::make_shared<test::FilesystemCopier>();

    void SetUp() override {
        TempDirTest::SetUp();
        src = test_dir / "src" / "root";
        dst = test_dir / "dst" / "root";
        work = test_dir / "work";

        cnf.run.source = src;
        cnf.run.destination = dst;
        cnf.run.work_dir = work;
        cnf.run.workers = 2;
        cnf.run.poll_interval = std::chrono::milliseconds(5);
    }

    void makeSourceTree() {
        writeTextFile(src / "a.txt", "alpha");
        writeTextFile(src / "sub" / "b.txt", "bravo");
        writeTextFile(src / ".DS_Store", "finder junk");
        fs::create_directories(dst);
    }

    RunReport runWith(const std::shared_ptr<copy::Copier>& c) {
        Orchestrator orchestrator(cnf, logs, c, nullptr, "test-run");
        return orchestrator.run();
    }

    RunReport run() { return runWith(copier); }
};

TEST_F(OrchestratorTest, CopiesLeavesAndRemovesQueue) {
    makeSourceTree();

    const auto report = run();

    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_EQ(exitCode(report.status), 0);
    EXPECT_EQ(report.queued, 2u);
    EXPECT_EQ(report.succeeded, 2u);
    EXPECT_EQ(report.remaining, 0u);
    EXPECT_FALSE(report.resumed);

    EXPECT_EQ(readTextFile(dst / "a.txt"), "alpha");
    EXPECT_EQ(readTextFile(dst / "sub" / "b.txt"), "bravo");
    EXPECT_FALSE(fs::exists(dst / ".DS_Store"));
    EXPECT_FALSE(fs::exists(cnf.run.queuePath()));
}

TEST_F(OrchestratorTest, NameMismatchFailsBeforeAnyWork) {
    cnf.run.source = "/a/b/foo";
    cnf.run.destination = "/x/y/bar";

    const auto report = run();

    EXPECT_EQ(report.status, RunStatus::SourceTargetNameMismatch);
    EXPECT_EQ(exitCode(report.status), 3);
    EXPECT_EQ(copier->calls.load(), 0);
    EXPECT_FALSE(fs::exists(cnf.run.queuePath()));
}

TEST_F(OrchestratorTest, TrailingSlashAndDotSegmentsDoNotAffectNameCheck) {
    makeSourceTree();
    cnf.run.source = src.string() + "/";
    cnf.run.destination = (dst / ".." / "root").string();

    EXPECT_EQ(run().status, RunStatus::Success);
}

TEST_F(OrchestratorTest, NameCheckComesBeforeExistenceChecks) {
    cnf.run.destination = test_dir / "dst" / "other";
    EXPECT_EQ(run().status, RunStatus::SourceTargetNameMismatch);
}

TEST_F(OrchestratorTest, MissingSource) {
    fs::create_directories(dst);

    const auto report = run();
    EXPECT_EQ(report.status, RunStatus::SourcePathMissing);
    EXPECT_EQ(copier->calls.load(), 0);
}

TEST_F(OrchestratorTest, SourceThatIsAFileIsMissing) {
    writeTextFile(src, "not a folder");
    fs::create_directories(dst);

    EXPECT_EQ(run().status, RunStatus::SourcePathMissing);
}

TEST_F(OrchestratorTest, MissingTarget) {
    writeTextFile(src / "a.txt", "alpha");

    const auto report = run();
    EXPECT_EQ(report.status, RunStatus::TargetPathMissing);
    EXPECT_FALSE(fs::exists(dst));
    EXPECT_FALSE(fs::exists(cnf.run.queuePath()));
}

TEST_F(OrchestratorTest, CreateDestinationWhenAsked) {
    writeTextFile(src / "a.txt", "alpha");
    cnf.run.create_destination = true;

    const auto report = run();
    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_EQ(readTextFile(dst / "a.txt"), "alpha");
}

TEST_F(OrchestratorTest, EmptySourceSucceedsWithoutCopies) {
    fs::create_directories(src);
    fs::create_directories(dst);

    const auto report = run();
    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_EQ(report.queued, 0u);
    EXPECT_EQ(copier->calls.load(), 0);
    EXPECT_FALSE(fs::exists(cnf.run.queuePath()));
}

TEST_F(OrchestratorTest, FailedCopiesGiveCopyFailuresStatus) {
    makeSourceTree();
    const auto failing = std::make_shared<test::FailingCopier>(std::set<std::string>{"b.txt"});

    const auto report = runWith(failing);

    EXPECT_EQ(report.status, RunStatus::CopyFailures);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.remaining, 0u);
    EXPECT_FALSE(fs::exists(cnf.run.queuePath()));

    const std::vector<std::string> expected = {"sub/b.txt"};
    EXPECT_EQ(readLines(cnf.run.failedPath()), expected);
}

TEST_F(OrchestratorTest, CopyFailuresCanBeTolerated) {
    makeSourceTree();
    cnf.run.fail_on_copy_errors = false;

    const auto report = runWith(std::make_shared<test::FailingCopier>(std::set<std::string>{"b.txt"}));
    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_EQ(report.failed, 1u);
}

TEST_F(OrchestratorTest, ResumesFromLeftoverQueue) {
    makeSourceTree();
    queue::WorkQueue::persist(cnf.run.queuePath(), {"sub/b.txt"});

    const auto report = run();

    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_TRUE(report.resumed);
    EXPECT_EQ(copier->calls.load(), 1);
    EXPECT_TRUE(fs::exists(dst / "sub" / "b.txt"));
    EXPECT_FALSE(fs::exists(dst / "a.txt"));
    EXPECT_FALSE(fs::exists(cnf.run.queuePath()));
}

TEST_F(OrchestratorTest, InterruptKeepsQueueForNextRun) {
    makeSourceTree();
    const auto interrupt = std::make_shared<std::atomic<bool>>(true);

    Orchestrator orchestrator(cnf, logs, copier, interrupt, "interrupted-run");
    const auto report = orchestrator.run();

    EXPECT_EQ(report.status, RunStatus::Interrupted);
    EXPECT_EQ(exitCode(report.status), 6);
    EXPECT_EQ(report.remaining, 2u);
    EXPECT_EQ(queue::WorkQueue::load(cnf.run.queuePath()).size(), 2u);
    EXPECT_EQ(queue::WorkQueue::readOrigin(cnf.run.queuePath()).value_or(""), cnf.run.origin());

    // the next run picks up where this one stopped
    const auto next = run();
    EXPECT_EQ(next.status, RunStatus::Success);
    EXPECT_TRUE(next.resumed);
    EXPECT_EQ(next.succeeded, 2u);
}

TEST_F(OrchestratorTest, DifferentTreesInOneWorkDirKeepSeparateQueues) {
    makeSourceTree();
    const auto interrupt = std::make_shared<std::atomic<bool>>(true);
    const auto stopped = Orchestrator(cnf, logs, copier, interrupt, "photos-run").run();
    ASSERT_EQ(stopped.status, RunStatus::Interrupted);
    const auto photosQueue = cnf.run.queuePath();

    auto music = cnf;
    music.run.source = test_dir / "src" / "music";
    music.run.destination = test_dir / "dst" / "music";
    writeTextFile(music.run.source / "track.flac", "la");
    fs::create_directories(music.run.destination);
    ASSERT_NE(music.run.queuePath(), photosQueue);

    const auto report = Orchestrator(music, logs, copier, nullptr, "music-run").run();
    EXPECT_EQ(report.status, RunStatus::Success);
    EXPECT_FALSE(report.resumed);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(readTextFile(music.run.destination / "track.flac"), "la");
    EXPECT_FALSE(fs::exists(music.run.destination / "a.txt"));

    // the interrupted tree still has its own queue
    EXPECT_EQ(queue::WorkQueue::load(photosQueue).size(), 2u);
}

TEST_F(OrchestratorTest, SharedQueueFileFromAnotherTreeIsRejected) {
    makeSourceTree();
    cnf.run.queue_file = "shared.queue";
    queue::WorkQueue::persist(cnf.run.queuePath(), {"track.flac"}, "/music/src\t/music/dst");
    const auto before = readTextFile(cnf.run.queuePath());

    const auto report = run();

    EXPECT_EQ(report.status, RunStatus::InvalidArguments);
    EXPECT_EQ(exitCode(report.status), 64);
    EXPECT_EQ(copier->calls.load(), 0);
    EXPECT_EQ(readTextFile(cnf.run.queuePath()), before);
    EXPECT_FALSE(fs::exists(dst / "a.txt"));
}

TEST_F(OrchestratorTest, WritesJsonReport) {
    makeSourceTree();

    Orchestrator orchestrator(cnf, logs, copier, nullptr, "report-run");
    const auto report = orchestrator.run();
    ASSERT_EQ(report.status, RunStatus::Success);

    const auto path = orchestrator.reportPath();
    ASSERT_TRUE(fs::exists(path));

    const auto j = nlohmann::json::parse(readTextFile(path));
    EXPECT_EQ(j.at("run_id"), "report-run");
    EXPECT_EQ(j.at("status"), "success");
    EXPECT_EQ(j.at("exit_code"), 0);
    EXPECT_EQ(j.at("succeeded"), 2);
    EXPECT_EQ(j.at("workers"), 2);
    EXPECT_TRUE(j.at("failed_paths").empty());
}

TEST(OrchestratorStaticTest, FinalSegmentIgnoresTrailingSlash) {
    EXPECT_EQ(Orchestrator::finalSegment("/does/not/exist/photos/"), fs::path("photos"));
    EXPECT_EQ(Orchestrator::finalSegment("/does/not/exist/photos"), fs::path("photos"));
}

TEST(OrchestratorStaticTest, RunIdsAreUnique) {
    EXPECT_NE(Orchestrator::newRunId(), Orchestrator::newRunId());
    EXPECT_EQ(Orchestrator::newRunId().size(), 36u);
}

TEST(RunStatusTest, ExitCodesAreDistinct) {
    const std::vector<RunStatus> all = {
        RunStatus::Success, RunStatus::SourcePathMissing, RunStatus::TargetPathMissing,
        RunStatus::SourceTargetNameMismatch, RunStatus::PermissionDenied, RunStatus::CopyFailures,
        RunStatus::Interrupted, RunStatus::InvalidArguments, RunStatus::InternalError
    };
    std::set<int> codes;
    for (const auto s : all) codes.insert(exitCode(s));
    EXPECT_EQ(codes.size(), all.size());
    EXPECT_EQ(to_string(RunStatus::SourceTargetNameMismatch), "source_target_name_mismatch");
}
