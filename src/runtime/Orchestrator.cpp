#include "runtime/Orchestrator.hpp"
#include "concurrency/Dispatcher.hpp"
#include "copy/CopyTask.hpp"
#include "copy/RsyncCopier.hpp"
#include "scan/LeafDiscoverer.hpp"
#include "queue/WorkQueue.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <system_error>

using namespace mpc::runtime;
using namespace mpc::concurrency;
using namespace mpc::copy;
using namespace mpc::queue;
using namespace std::chrono;
namespace fs = std::filesystem;

Orchestrator::Orchestrator(config::Config cnf,
                           std::shared_ptr<log::Registry> log,
                           std::shared_ptr<Copier> copier,
                           std::shared_ptr<std::atomic<bool>> interruptFlag,
                           std::string runId)
    : cnf_(std::move(cnf)),
      log_(std::move(log)),
      copier_(std::move(copier)),
      interruptFlag_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)),
      runId_(runId.empty() ? newRunId() : std::move(runId)) {
    if (!copier_) copier_ = std::make_shared<RsyncCopier>(cnf_.copy, log_);
}

std::string Orchestrator::newRunId() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

fs::path Orchestrator::finalSegment(const fs::path& path) {
    return util::resolvePath(path).filename();
}

fs::path Orchestrator::reportPath() const {
    return cnf_.run.reportDir() / ("mpcopy-" + runId_ + ".json");
}

RunReport Orchestrator::run() {
    RunReport report;
    report.run_id = runId_;
    report.source = cnf_.run.source;
    report.destination = cnf_.run.destination;
    report.queue_file = cnf_.run.queuePath();
    report.dry_run = cnf_.copy.dry_run;
    report.workers = cnf_.run.workers;
    report.started = system_clock::now();

    const auto& log = log_->mpcopy();
    log->info(" ========================================  start: run {}", runId_);

    try {
        execute(report);
    } catch (const PreconditionError& e) {
        report.status = e.status;
        report.message = e.what();
        log->error("[Orchestrator] {}", e.what());
        log->info("[Orchestrator] Source = {}", cnf_.run.source.string());
        log->info("[Orchestrator] Target = {}", cnf_.run.destination.string());
    } catch (const QueueOriginError& e) {
        report.status = RunStatus::InvalidArguments;
        report.message = e.what();
        log->error("[Orchestrator] {}", e.what());
        log->info("[Orchestrator] Pass another --queue or --work-dir to keep both runs");
    } catch (const QueuePersistError& e) {
        report.status = RunStatus::PermissionDenied;
        report.message = e.what();
        log->error("[Orchestrator] Work queue unavailable: {}", e.what());
    } catch (const std::exception& e) {
        report.status = RunStatus::InternalError;
        report.message = e.what();
        log->error("[Orchestrator] Run aborted: {}", e.what());
    }

    report.finished = system_clock::now();
    writeReport(report);

    log->info(" ========================================    end: {} ({})", to_string(report.status),
              exitCode(report.status));
    log_->flush();
    return report;
}

void Orchestrator::execute(RunReport& report) {
    checkNameIdentity();
    checkSource();
    checkDestination();
    prepareWorkDir();

    log_->mpcopy()->info("[Orchestrator] Source = {}", cnf_.run.source.string());
    log_->mpcopy()->info("[Orchestrator] Target = {}", cnf_.run.destination.string());
    log_->mpcopy()->info("[Orchestrator] Threads = {}", cnf_.run.workers);

    WorkQueue queue(cnf_.run.queuePath(), log_, cnf_.run.origin());
    queue.loadOrInitialize([this] { return discover(); });
    report.resumed = queue.resumed();
    report.queued = queue.size();

    if (!report.resumed) {
        std::error_code ec;
        fs::remove(cnf_.run.failedPath(), ec);
    }

    log_->mpcopy()->info(" ======================================== listed: {} entries{}", report.queued,
                         report.resumed ? " (resumed)" : "");

    const auto ctx = std::make_shared<CopyContext>(CopyContext{
        .sourceRoot = cnf_.run.source,
        .destinationRoot = cnf_.run.destination,
        .maxAttempts = cnf_.copy.max_attempts,
        .copier = copier_,
        .log = log_
    });

    Dispatcher dispatcher({
        .workers = cnf_.run.workers,
        .pollInterval = cnf_.run.poll_interval,
        .failedLog = cnf_.run.failedPath()
    }, ctx, log_, interruptFlag_);

    const auto summary = dispatcher.run(queue);

    report.dispatched = summary.dispatched;
    report.succeeded = summary.succeeded;
    report.failed = summary.failed;
    report.bytes = summary.bytes;
    report.peak_in_flight = summary.peakInFlight;
    report.failed_paths = summary.failedPaths;
    report.remaining = queue.size();

    if (queue.empty()) queue.finalize();
    else queue.persist();

    if (summary.stopped && report.remaining > 0) {
        report.status = RunStatus::Interrupted;
        report.message = std::to_string(report.remaining) + " entries left in " + queue.path().string();
        log_->mpcopy()->warn("[Orchestrator] Run interrupted, {}", report.message);
    } else if (summary.failed > 0 && cnf_.run.fail_on_copy_errors) {
        report.status = RunStatus::CopyFailures;
        report.message = std::to_string(summary.failed) + " copies failed, see " + cnf_.run.failedPath().string();
        log_->mpcopy()->error("[Orchestrator] {}", report.message);
    } else {
        report.status = RunStatus::Success;
    }
}

void Orchestrator::checkNameIdentity() const {
    const auto src = finalSegment(cnf_.run.source);
    const auto dst = finalSegment(cnf_.run.destination);
    if (src.empty() || src != dst)
        throw PreconditionError(RunStatus::SourceTargetNameMismatch,
                                "Source and Target must have the same starting point (" + src.string() +
                                " != " + dst.string() + ")");
}

void Orchestrator::checkSource() const {
    const auto& src = cnf_.run.source;
    std::error_code ec;
    if (!fs::exists(src, ec))
        throw PreconditionError(RunStatus::SourcePathMissing, "Source path does not exist: " + src.string());
    if (!fs::is_directory(src, ec))
        throw PreconditionError(RunStatus::SourcePathMissing, "Source path is not a folder: " + src.string());
}

void Orchestrator::checkDestination() const {
    const auto& dst = cnf_.run.destination;
    std::error_code ec;

    if (fs::exists(dst, ec)) {
        if (!fs::is_directory(dst, ec))
            throw PreconditionError(RunStatus::TargetPathMissing, "Target path is not a folder: " + dst.string());
        return;
    }

    if (!cnf_.run.create_destination)
        throw PreconditionError(RunStatus::TargetPathMissing, "Target path does not exist: " + dst.string());

    fs::create_directories(dst, ec);
    if (ec || !fs::is_directory(dst, ec))
        throw PreconditionError(RunStatus::PermissionDenied,
                                "Failed to create target path " + dst.string() + (ec ? ": " + ec.message() : ""));

    log_->mpcopy()->info("[Orchestrator] Created target path {}", dst.string());
}

void Orchestrator::prepareWorkDir() const {
    const auto& dir = cnf_.run.work_dir;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec))
        throw PreconditionError(RunStatus::PermissionDenied,
                                "Failed to create working directory " + dir.string() + (ec ? ": " + ec.message() : ""));
}

std::vector<fs::path> Orchestrator::discover() const {
    scan::PathFilter filter(cnf_.filter.excluded_names);
    for (const auto& name : cnf_.filter.extra_excluded_names) filter.add(name);

    scan::LeafDiscoverer discoverer(std::move(filter), log_);
    return discoverer.discover(cnf_.run.source);
}

void Orchestrator::writeReport(const RunReport& report) const {
    std::error_code ec;
    if (!fs::is_directory(cnf_.run.work_dir, ec)) return;

    try {
        report.save(reportPath());
        log_->mpcopy()->debug("[Orchestrator] Run report written to {}", reportPath().string());
    } catch (const std::exception& e) {
        log_->mpcopy()->warn("[Orchestrator] Could not write run report: {}", e.what());
    }
}
