#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Add a task to the FIFO queue. Exceptions thrown by the task are
    // delivered through the returned future.
    template<typename F>
    auto addTask(F&& f) -> std::future<typename std::result_of<F()>::type>;

    // Stop accepting tasks, finish the queue and join the workers
    void shutdown();

private:
    void enqueue(std::function<void()> func);
    void workerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_;
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f) -> std::future<typename std::result_of<F()>::type> {
    using return_type = typename std::result_of<F()>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); });
    return result;
}
