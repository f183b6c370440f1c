#pragma once

#include "concurrency/Channel.hpp"
#include "config/Config.hpp"
#include "copy/CopyResult.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <semaphore>
#include <string>
#include <unordered_set>
#include <vector>

namespace mpc::log { class Registry; }
namespace mpc::queue { class WorkQueue; }
namespace mpc::copy { struct CopyContext; }

namespace mpc::concurrency {

struct DispatchSummary {
    uint64_t dispatched{};
    uint64_t succeeded{};
    uint64_t failed{};
    uint64_t persistFailures{};
    uintmax_t bytes{};
    unsigned int peakInFlight{};
    bool stopped = false;
    std::vector<std::filesystem::path> failedPaths;
    std::chrono::milliseconds elapsed{};
};

// Drives every queued path through Pending -> Dispatched -> Retired with at
// most `workers` paths dispatched at any instant. The dispatcher thread is the
// only writer of the WorkQueue; workers report back over a channel.
class Dispatcher {
public:
    struct Options {
        unsigned int workers = 1;
        std::chrono::milliseconds pollInterval{250};
        std::optional<std::filesystem::path> failedLog;   // retired-but-failed paths are appended here
    };

    using Observer = std::function<void(const copy::CopyResult&)>;

    Dispatcher(Options options,
               std::shared_ptr<const copy::CopyContext> ctx,
               std::shared_ptr<log::Registry> log,
               std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Runs until every queued path is retired or a stop is requested. After a
    // stop, in-flight copies finish and retire; undispatched paths stay queued.
    DispatchSummary run(queue::WorkQueue& queue);

    void requestStop();
    [[nodiscard]] bool stopRequested() const;

    void setObserver(Observer observer) { observer_ = std::move(observer); }

    [[nodiscard]] unsigned int workers() const { return options_.workers; }

private:
    static constexpr std::ptrdiff_t MAX_WORKERS = config::MAX_WORKERS;

    Options options_;
    std::shared_ptr<const copy::CopyContext> ctx_;
    std::shared_ptr<log::Registry> log_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::atomic<bool> stopFlag_{false};

    std::counting_semaphore<MAX_WORKERS> slots_;
    Channel<copy::CopyResult> completions_;
    std::unordered_set<std::string> dispatched_;
    Observer observer_;

    bool acquireSlot(queue::WorkQueue& queue, DispatchSummary& summary);
    void retire(std::vector<copy::CopyResult>&& batch, queue::WorkQueue& queue, DispatchSummary& summary);
    void recordFailure(const copy::CopyResult& result) const;
};

}
