#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * Fixed-size thread pool. The destructor finishes queued tasks and joins
 * every worker.
 */
class WorkerPool {
private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queuemutex;
    std::condition_variable condition;
    bool stop;

public:
    explicit WorkerPool(size_t numthreads);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * Queues a task.
     *
     * @param func Callable run on a worker thread.
     * @return Future of the callable's result; exceptions thrown by the
     *         callable are rethrown by future.get().
     */
    template <typename Func>
    auto enqueue(Func func) -> std::future<decltype(func())> {
        using Result = decltype(func());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(func));
        std::future<Result> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queuemutex);
            tasks.emplace([task]() { (*task)(); });
        }
        condition.notify_one();
        return res;
    }
};
