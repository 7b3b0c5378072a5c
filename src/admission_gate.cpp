#include "admission_gate.hpp"
#include <algorithm>
#include <stdexcept>

namespace thumbgrid {

AdmissionGate::Slot::Slot(Slot&& other) noexcept
    : gate_(other.gate_) {
    other.gate_ = nullptr;
}

AdmissionGate::Slot& AdmissionGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

AdmissionGate::Slot::~Slot() {
    release();
}

void AdmissionGate::Slot::release() {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

AdmissionGate::AdmissionGate(int capacity)
    : capacity_(capacity) {
    if (capacity < 1) {
        throw std::invalid_argument("AdmissionGate capacity must be at least 1");
    }
}

std::optional<AdmissionGate::Slot> AdmissionGate::acquire(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_ || token.is_cancelled()) {
        return std::nullopt;
    }

    if (in_use_ < capacity_ && waiters_.empty()) {
        grant_locked();
        return Slot(this);
    }

    auto waiter = std::make_shared<Waiter>();
    waiters_.push_back(waiter);
    waiter->cv.wait(lock, [&] {
        return waiter->granted || cancelled_ || token.is_cancelled();
    });

    if (waiter->granted) {
        if (cancelled_ || token.is_cancelled()) {
            // Handed a slot just as cancellation landed; pass it on.
            release_locked();
            return std::nullopt;
        }
        return Slot(this);
    }

    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    return std::nullopt;
}

void AdmissionGate::grant_locked() {
    ++in_use_;
    ++total_acquired_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
}

void AdmissionGate::release_locked() {
    --in_use_;
    ++total_released_;

    while (!cancelled_ && in_use_ < capacity_ && !waiters_.empty()) {
        std::shared_ptr<Waiter> next = waiters_.front();
        waiters_.pop_front();
        grant_locked();
        next->granted = true;
        next->cv.notify_one();
    }
}

void AdmissionGate::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    release_locked();
}

void AdmissionGate::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    for (auto& waiter : waiters_) {
        waiter->cv.notify_one();
    }
}

void AdmissionGate::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

void AdmissionGate::interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& waiter : waiters_) {
        waiter->cv.notify_one();
    }
}

int AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

int AdmissionGate::peak_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_use_;
}

std::size_t AdmissionGate::total_acquired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_acquired_;
}

std::size_t AdmissionGate::total_released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_released_;
}

std::size_t AdmissionGate::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

} // namespace thumbgrid
