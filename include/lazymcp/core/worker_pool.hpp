#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lazymcp {

// ---------------------------------------------------------------------------
// WorkerPool: fixed set of threads draining a FIFO task queue.
//
// Each inbound agent request runs as one task, so requests to different
// backends proceed in parallel while requests to the same backend queue up
// on that backend's mutex. Shutdown() runs every task already submitted
// before joining.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false after Shutdown() has begun.
    bool Submit(std::function<void()> task);

    /// Finish queued tasks and join all threads. Idempotent.
    void Shutdown();

    [[nodiscard]] std::size_t ThreadCount() const noexcept { return threads_.size(); }

private:
    void WorkerLoop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace lazymcp
