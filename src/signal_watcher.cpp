#include "signal_watcher.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace thumbgrid {

SignalWatcher::SignalWatcher() {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, SIGUSR1);

    const int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_);
    if (rc != 0) {
        throw std::runtime_error(std::string("Cannot block signals: ") + std::strerror(rc));
    }

    try {
        thread_ = std::thread(&SignalWatcher::wait_loop, this);
    } catch (...) {
        pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
        throw;
    }
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::bind(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) {
        return;
    }
    pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::wait_loop() {
    for (;;) {
        int signal_number = 0;
        if (sigwait(&signals_, &signal_number) != 0 || signal_number == SIGUSR1) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!handler_) {
            std::cerr << "\nInterrupted" << std::endl;
            std::_Exit(128 + signal_number);
        }
        handler_(signal_number);
    }
}

} // namespace thumbgrid
