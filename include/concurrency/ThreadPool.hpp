#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace spdlog { class logger; }

namespace mpc::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads, std::shared_ptr<spdlog::logger> log = nullptr);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Finishes queued and running tasks, then joins every worker.
    void stop();

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;
    [[nodiscard]] unsigned int busyCount() const { return busy_.load(); }

private:
    void spawnWorker();

    std::vector<std::thread> threads_;
    std::atomic<unsigned int> busy_{0};

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::shared_ptr<spdlog::logger> log_;
    std::atomic<bool> stopFlag{false};
};

} // namespace mpc::concurrency
