#include <stylec/platform/thread_pool.h>

#include <algorithm>

namespace stylec::platform {

ThreadPool::ThreadPool(size_t num_threads) {
    const size_t count = std::max<size_t>(num_threads, 1);
    workers_.reserve(count);
    while (workers_.size() < count) {
        workers_.emplace_back([this]() { run_worker(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> task) {
    std::unique_lock lock(mutex_);
    if (stopping_) {
        throw std::runtime_error("ThreadPool: submit after shutdown");
    }
    queue_.push_back(std::move(task));
    lock.unlock();
    wake_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::run_worker() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            wake_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            // Stop only once the queue is empty
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

} // namespace stylec::platform
