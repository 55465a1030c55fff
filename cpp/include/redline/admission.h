// cpp/include/redline/admission.h
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace redline {

constexpr size_t kDefaultMaxSessions = 4;

// Counting semaphore bounding concurrent document sessions.
// Waiters are served strictly in arrival order: a released permit is handed
// to the oldest waiter instead of going back to the pool.
class AdmissionController {
public:
    explicit AdmissionController(size_t capacity = kDefaultMaxSessions);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    void acquire();

    // false if no permit became available within timeout
    bool try_acquire_for(std::chrono::milliseconds timeout);

    // Never throws. Over-release is logged and ignored.
    void release() noexcept;

    size_t capacity() const { return capacity_; }
    size_t outstanding() const;
    size_t waiting() const;

private:
    struct Waiter {
        bool granted{false};
    };

    bool acquire_impl(const std::chrono::milliseconds* timeout);

    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    size_t outstanding_{0};
    std::deque<Waiter*> queue_;
};

// Owns one permit, returns it exactly once.
class AdmissionPermit {
public:
    AdmissionPermit() = default;
    explicit AdmissionPermit(AdmissionController& ctl) : ctl_(&ctl) {}
    ~AdmissionPermit() { release(); }

    AdmissionPermit(const AdmissionPermit&) = delete;
    AdmissionPermit& operator=(const AdmissionPermit&) = delete;

    AdmissionPermit(AdmissionPermit&& o) noexcept : ctl_(o.ctl_) { o.ctl_ = nullptr; }
    AdmissionPermit& operator=(AdmissionPermit&& o) noexcept {
        if (this != &o) {
            release();
            ctl_ = o.ctl_;
            o.ctl_ = nullptr;
        }
        return *this;
    }

    void release() noexcept {
        if (!ctl_) return;
        AdmissionController* c = ctl_;
        ctl_ = nullptr;
        c->release();
    }

    bool held() const { return ctl_ != nullptr; }

private:
    AdmissionController* ctl_{nullptr};
};

} // namespace redline
