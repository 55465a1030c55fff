// cpp/include/redline/task_queue.h
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace redline {

// Runs work after the posting call has returned.
class TaskQueue {
public:
    virtual ~TaskQueue() = default;
    virtual void post(std::function<void()> task) = 0;
};

// One background worker draining posted tasks in order.
// Destruction runs whatever is still queued, then joins.
class DeferredQueue final : public TaskQueue {
public:
    DeferredQueue();
    ~DeferredQueue() override;

    DeferredQueue(const DeferredQueue&) = delete;
    DeferredQueue& operator=(const DeferredQueue&) = delete;

    // throws RedlineException(Internal) after stop()
    void post(std::function<void()> task) override;

    // blocks until every task posted so far has run
    void drain();

    void stop();

    size_t pending() const;

private:
    void run();

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> tasks_;
    size_t running_{0};
    bool stop_{false};
    std::thread worker_;
};

} // namespace redline
