#pragma once

#include <atomic>
#include <memory>

namespace thumbgrid {

// Shared cancellation flag. Copies observe the same state; a child token
// reports cancelled when either itself or any ancestor has been cancelled.
class CancellationToken {
public:
    CancellationToken();

    CancellationToken child() const;

    void cancel() const;
    bool is_cancelled() const;

    // Throws CancelledError when cancelled.
    void throw_if_cancelled() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

// Interrupt point for hot loops: observe cancellation, then give other
// runnable work a chance to proceed before resuming.
void cooperative_yield(const CancellationToken& token);

} // namespace thumbgrid
