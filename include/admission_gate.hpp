#pragma once

#include "cancellation.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace thumbgrid {

// Counting gate bounding how many jobs may be mid-flight at once. Waiters are
// served first come, first served; a released slot is handed directly to the
// oldest waiter.
class AdmissionGate {
public:
    // Held slot; releases on destruction.
    class Slot {
    public:
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;
        ~Slot();

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void release();

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_;
    };

    explicit AdmissionGate(int capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a slot is free. Returns nullopt without holding anything
    // when the gate is cancelled or `token` fires first.
    std::optional<Slot> acquire(const CancellationToken& token = CancellationToken());

    // Wakes every waiter with nullopt and refuses new acquisitions until
    // reset(). Held slots stay valid and are released normally.
    void cancel_all();
    void reset();

    // Makes waiters re-check their tokens after a per-job cancellation.
    void interrupt();

    int capacity() const { return capacity_; }
    int in_use() const;
    int peak_in_use() const;
    std::size_t total_acquired() const;
    std::size_t total_released() const;
    std::size_t waiting() const;

private:
    struct Waiter {
        std::condition_variable cv;
        bool granted = false;
    };

    void grant_locked();
    void release_locked();
    void release();

    const int capacity_;
    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    int in_use_ = 0;
    int peak_in_use_ = 0;
    std::size_t total_acquired_ = 0;
    std::size_t total_released_ = 0;
    bool cancelled_ = false;
};

} // namespace thumbgrid
