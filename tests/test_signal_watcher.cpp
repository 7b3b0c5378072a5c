#include <gtest/gtest.h>
#include "signal_watcher.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace thumbgrid {

class SignalWatcherTest : public ::testing::Test {
protected:
    static bool blocked(int signal_number) {
        sigset_t current;
        sigemptyset(&current);
        pthread_sigmask(SIG_BLOCK, nullptr, &current);
        return sigismember(&current, signal_number) == 1;
    }
};

using SignalWatcherDeathTest = SignalWatcherTest;

TEST_F(SignalWatcherTest, BoundHandlerReceivesInterrupts) {
    SignalWatcher watcher;
    std::atomic<int> received{0};
    std::atomic<int> count{0};
    watcher.bind([&](int signal_number) {
        received = signal_number;
        ++count;
    });

    pthread_kill(watcher.native_handle(), SIGTERM);
    EXPECT_TRUE(test::wait_until([&] { return count.load() == 1; }));
    EXPECT_EQ(received.load(), SIGTERM);

    pthread_kill(watcher.native_handle(), SIGINT);
    EXPECT_TRUE(test::wait_until([&] { return count.load() == 2; }));
    EXPECT_EQ(received.load(), SIGINT);

    watcher.bind(nullptr);
    watcher.stop();
}

TEST_F(SignalWatcherTest, StopRestoresPreviousMask) {
    const bool int_before = blocked(SIGINT);
    const bool term_before = blocked(SIGTERM);
    const bool usr1_before = blocked(SIGUSR1);

    SignalWatcher watcher;
    EXPECT_TRUE(blocked(SIGINT));
    EXPECT_TRUE(blocked(SIGTERM));
    EXPECT_TRUE(blocked(SIGUSR1));

    watcher.stop();
    watcher.stop();
    EXPECT_EQ(blocked(SIGINT), int_before);
    EXPECT_EQ(blocked(SIGTERM), term_before);
    EXPECT_EQ(blocked(SIGUSR1), usr1_before);
}

TEST_F(SignalWatcherTest, DestructorStopsTheWaiter) {
    const bool int_before = blocked(SIGINT);
    {
        SignalWatcher watcher;
        ScopedSignalHandler handler(watcher, [](int) {});
    }
    EXPECT_EQ(blocked(SIGINT), int_before);
}

TEST_F(SignalWatcherDeathTest, UnboundInterruptExitsWith130) {
    EXPECT_EXIT({
        SignalWatcher watcher;
        pthread_kill(watcher.native_handle(), SIGINT);
        std::this_thread::sleep_for(std::chrono::seconds(5));
    }, ::testing::ExitedWithCode(130), "Interrupted");
}

TEST_F(SignalWatcherDeathTest, HandlerLeavingScopeRestoresExit) {
    EXPECT_EXIT({
        SignalWatcher watcher;
        {
            ScopedSignalHandler handler(watcher, [](int) {});
        }
        pthread_kill(watcher.native_handle(), SIGTERM);
        std::this_thread::sleep_for(std::chrono::seconds(5));
    }, ::testing::ExitedWithCode(128 + SIGTERM), "Interrupted");
}

} // namespace thumbgrid
