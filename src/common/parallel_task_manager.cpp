#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>

ParallelTaskManager::ParallelTaskManager(size_t numThreads)
    : stop_(false) {
    if (numThreads == 0) {
        numThreads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    shutdown();
}

void ParallelTaskManager::enqueue(std::function<void()> func) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        tasks_.push(std::move(func));
    }
    condition_.notify_one();
}

void ParallelTaskManager::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workers_.clear();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            if (task) {
                task();
            }
        } catch (const std::exception& e) {
            // packaged_task captures task exceptions; this only sees wrapper failures
            Logger::error(std::string("Worker task failed: ") + e.what());
        }
    }
}
