#include "../include/WorkerPool.hpp"
#include "../include/Logger.hpp"
#include <system_error>

WorkerPool::WorkerPool(const std::string& name, size_t worker_count)
    : name_(name),
      running_(0),
      stopping_(false) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; i++) {
        try {
            workers_.emplace_back(&WorkerPool::workerLoop, this, i);
        } catch (const std::system_error& e) {
            if (workers_.empty()) {
                throw;
            }
            // Out of threads: run with the workers we already have.
            LOG_WARNING("[" + name_ + "] Could only start " + std::to_string(workers_.size()) + " of " +
                        std::to_string(worker_count) + " workers: " + e.what());
            break;
        }
    }
    LOG_DEBUG("[" + name_ + "] Started " + std::to_string(workers_.size()) + " workers");
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    task_cv_.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    task_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void WorkerPool::workerLoop(size_t worker_index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopping_ and nothing left to run
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            running_++;
        }

        try {
            task(worker_index);
        } catch (const std::exception& e) {
            LOG_ERROR("[" + name_ + "] Worker " + std::to_string(worker_index) +
                      " task failed: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_--;
            if (queue_.empty() && running_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}
