#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace nx::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(std::string name, unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks (their promises break) and joins the workers. A task
    // already running is allowed to finish.
    void stop();

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

    [[nodiscard]] bool isStopped() const { return stopFlag.load(); }

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace nx::concurrency
