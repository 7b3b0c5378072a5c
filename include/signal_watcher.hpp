#pragma once

#include <pthread.h>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>

namespace thumbgrid {

// Blocks SIGINT, SIGTERM and SIGUSR1 in the constructing thread, which every
// thread it later starts inherits, and waits for them on a dedicated sigwait
// thread started right away. SIGINT and SIGTERM go to the bound handler; with
// none bound the process exits with 128 + the signal number. SIGUSR1 stops the
// watcher. Construct it before any other thread exists.
class SignalWatcher {
public:
    using Handler = std::function<void(int signal_number)>;

    SignalWatcher();
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Replaces the handler; an empty one restores the exit fallback. Waits
    // for a handler that is already running, so whatever the old handler
    // refers to may be destroyed once this returns.
    void bind(Handler handler);

    // Joins the sigwait thread and restores the constructing thread's
    // previous signal mask. Idempotent.
    void stop();

    std::thread::native_handle_type native_handle() { return thread_.native_handle(); }

private:
    void wait_loop();

    sigset_t signals_;
    sigset_t previous_mask_;
    std::mutex mutex_;
    Handler handler_;
    std::thread thread_;
};

// Binds a handler for the lifetime of a scope.
class ScopedSignalHandler {
public:
    ScopedSignalHandler(SignalWatcher& watcher, SignalWatcher::Handler handler)
        : watcher_(watcher) {
        watcher_.bind(std::move(handler));
    }
    ~ScopedSignalHandler() { watcher_.bind(nullptr); }

    ScopedSignalHandler(const ScopedSignalHandler&) = delete;
    ScopedSignalHandler& operator=(const ScopedSignalHandler&) = delete;

private:
    SignalWatcher& watcher_;
};

} // namespace thumbgrid
