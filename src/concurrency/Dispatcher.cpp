#include "concurrency/Dispatcher.hpp"
#include "concurrency/ThreadPool.hpp"
#include "copy/CopyTask.hpp"
#include "queue/WorkQueue.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace mpc::concurrency;
using namespace mpc::copy;
using namespace mpc::queue;
using namespace std::chrono;

Dispatcher::Dispatcher(Options options,
                       std::shared_ptr<const CopyContext> ctx,
                       std::shared_ptr<log::Registry> log,
                       std::shared_ptr<std::atomic<bool>> interruptFlag)
    : options_(std::move(options)),
      ctx_(std::move(ctx)),
      log_(std::move(log)),
      interruptFlag_(std::move(interruptFlag)),
      slots_(std::clamp<std::ptrdiff_t>(options_.workers, 1, MAX_WORKERS)) {
    if (options_.workers < 1 || options_.workers > MAX_WORKERS)
        throw std::invalid_argument("Dispatcher worker count must be between 1 and " + std::to_string(MAX_WORKERS));
    if (!ctx_ || !ctx_->copier) throw std::invalid_argument("Dispatcher requires a copy context with a copier");
}

void Dispatcher::requestStop() { stopFlag_.store(true); }

bool Dispatcher::stopRequested() const {
    return stopFlag_.load() || (interruptFlag_ && interruptFlag_->load());
}

DispatchSummary Dispatcher::run(WorkQueue& queue) {
    const auto start = steady_clock::now();
    DispatchSummary summary;

    const auto pending = queue.remaining();
    log_->dispatch()->info("[Dispatcher] Dispatching {} paths across {} workers", pending.size(), options_.workers);

    {
        ThreadPool pool(options_.workers, log_->dispatch());

        for (const auto& path : pending) {
            retire(completions_.drain(), queue, summary);

            if (!acquireSlot(queue, summary)) {
                summary.stopped = true;
                break;
            }

            dispatched_.insert(path.string());
            ++summary.dispatched;
            summary.peakInFlight = std::max(summary.peakInFlight, static_cast<unsigned int>(dispatched_.size()));
            log_->dispatch()->debug("[Dispatcher] Dispatched {} ({}/{} slots in use)", path.string(),
                                    dispatched_.size(), options_.workers);

            pool.submit(std::make_shared<CopyTask>(ctx_, path, [this](CopyResult&& result) {
                completions_.push(std::move(result));
            }));
        }

        if (summary.stopped)
            log_->dispatch()->warn("[Dispatcher] Stop requested, waiting for {} in-flight copies to finish",
                                   dispatched_.size());

        while (!dispatched_.empty())
            retire(completions_.waitAndDrain(options_.pollInterval), queue, summary);

        pool.stop();
    }

    summary.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
    log_->dispatch()->info("[Dispatcher] Retired {} paths ({} succeeded, {} failed) in {} ms, {} still queued",
                           summary.succeeded + summary.failed, summary.succeeded, summary.failed,
                           summary.elapsed.count(), queue.size());
    return summary;
}

// A stop seen after the slot was taken hands the slot back; nothing is
// dispatched once stopRequested() is true.
bool Dispatcher::acquireSlot(WorkQueue& queue, DispatchSummary& summary) {
    while (!stopRequested()) {
        if (slots_.try_acquire()) {
            if (!stopRequested()) return true;
            slots_.release();
            return false;
        }
        retire(completions_.waitAndDrain(options_.pollInterval), queue, summary);
    }
    return false;
}

void Dispatcher::retire(std::vector<CopyResult>&& batch, WorkQueue& queue, DispatchSummary& summary) {
    for (auto& result : batch) {
        const auto key = result.relativePath.string();
        if (dispatched_.erase(key) == 0) {
            log_->dispatch()->error("[Dispatcher] Completion for {} which was not dispatched", key);
            continue;
        }
        slots_.release();

        try {
            queue.remove(result.relativePath);
        } catch (const QueuePersistError& e) {
            ++summary.persistFailures;
            log_->dispatch()->error("[Dispatcher] Failed to persist retirement of {}: {}", key, e.what());
        }

        if (result.ok()) {
            ++summary.succeeded;
            summary.bytes += result.bytes;
        } else {
            ++summary.failed;
            summary.failedPaths.push_back(result.relativePath);
            recordFailure(result);
        }

        if (observer_) observer_(result);
    }
}

void Dispatcher::recordFailure(const CopyResult& result) const {
    log_->dispatch()->error("[Dispatcher] {} retired with exit code {}", result.relativePath.string(), result.exitCode);
    if (!options_.failedLog) return;

    std::ofstream out(*options_.failedLog, std::ios::out | std::ios::app);
    if (!out) {
        log_->dispatch()->error("[Dispatcher] Unable to append to failed list {}", options_.failedLog->string());
        return;
    }
    out << result.relativePath.string() << '\n';
}
