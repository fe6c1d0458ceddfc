#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Fixed-size pool of worker threads fed from a FIFO queue.
 *
 * At most worker_count tasks run at any instant; everything else waits in
 * the queue until a worker frees up. Each task receives the index of the
 * worker running it so callers can keep per-worker state.
 */
class WorkerPool {
public:
    using Task = std::function<void(size_t worker_index)>;

    WorkerPool(const std::string& name, size_t worker_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown() has been called.
    bool submit(Task task);

    // Blocks until the queue is drained and no task is running.
    void waitIdle();

    // Drains remaining tasks, then joins all workers.
    void shutdown();

    size_t workerCount() const { return workers_.size(); }

private:
    void workerLoop(size_t worker_index);

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;
    size_t running_;
    bool stopping_;
};

#endif // WORKER_POOL_HPP
