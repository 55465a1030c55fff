// cpp/src/task_queue.cpp
#include "redline/task_queue.h"
#include "redline/errors.h"

#include <exception>

#include <spdlog/spdlog.h>

namespace redline {

DeferredQueue::DeferredQueue() {
    worker_ = std::thread([this] { run(); });
}

DeferredQueue::~DeferredQueue() {
    stop();
    if (worker_.joinable()) worker_.join();
}

void DeferredQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_) throw RedlineException(ErrorCode::Internal, "post on stopped DeferredQueue");
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void DeferredQueue::drain() {
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return tasks_.empty() && running_ == 0; });
}

void DeferredQueue::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
}

size_t DeferredQueue::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return tasks_.size() + running_;
}

void DeferredQueue::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) return; // stopped and drained
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::warn("deferred task failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace redline
