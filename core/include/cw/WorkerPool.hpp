#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cw {

// Fixed set of threads draining a task queue; joins on destruction
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    // Block until every submitted task has finished
    void wait();

    std::size_t threadCount() const { return workers_.size(); }

private:
    void run();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable taskCv_;
    std::condition_variable idleCv_;
    std::size_t active_ = 0;
    bool stopping_ = false;
};

} // namespace cw
