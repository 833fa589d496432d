#include "cw/WorkerPool.hpp"
#include "cw/Log.hpp"

#include <exception>

namespace cw {

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0)
        threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i)
        workers_.emplace_back(&WorkerPool::run, this);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    taskCv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable())
            t.join();
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    taskCv_.notify_one();
}

void WorkerPool::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            taskCv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty())
                return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }
        try {
            task();
        } catch (const std::exception& e) {
            log(LogLevel::Error, "Worker task failed: %s", e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0)
                idleCv_.notify_all();
        }
    }
}

} // namespace cw
