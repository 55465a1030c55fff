// cpp/src/admission.cpp
#include "redline/admission.h"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace redline {

AdmissionController::AdmissionController(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void AdmissionController::acquire() {
    acquire_impl(nullptr);
}

bool AdmissionController::try_acquire_for(std::chrono::milliseconds timeout) {
    return acquire_impl(&timeout);
}

bool AdmissionController::acquire_impl(const std::chrono::milliseconds* timeout) {
    std::unique_lock<std::mutex> lk(mu_);

    // fast path only when nobody is queued, otherwise we would overtake
    if (queue_.empty() && outstanding_ < capacity_) {
        ++outstanding_;
        return true;
    }

    Waiter self;
    queue_.push_back(&self);

    if (!timeout) {
        cv_.wait(lk, [&] { return self.granted; });
        return true;
    }

    const bool granted = cv_.wait_for(lk, *timeout, [&] { return self.granted; });
    if (granted) return true;

    auto it = std::find(queue_.begin(), queue_.end(), &self);
    if (it != queue_.end()) queue_.erase(it);
    return false;
}

void AdmissionController::release() noexcept {
    try {
        std::lock_guard<std::mutex> lk(mu_);
        if (outstanding_ == 0) {
            spdlog::warn("admission: release without outstanding permit ignored");
            return;
        }
        if (!queue_.empty()) {
            // hand the permit straight to the oldest waiter; outstanding_ unchanged
            Waiter* next = queue_.front();
            queue_.pop_front();
            next->granted = true;
            cv_.notify_all();
            return;
        }
        --outstanding_;
    } catch (const std::exception& e) {
        // permit counts as returned even if the primitive failed
        spdlog::warn("admission: release failed: {}", e.what());
    }
}

size_t AdmissionController::outstanding() const {
    std::lock_guard<std::mutex> lk(mu_);
    return outstanding_;
}

size_t AdmissionController::waiting() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

} // namespace redline
