#include "download/fetch_watchdog.hpp"

#include "testing.hpp"

#include <gtest/gtest.h>

#include <array>
#include <thread>

namespace zipline {

TEST(FetchWatchdogTest, CancelsStreamAfterTimeout) {
    CancelToken cancel;
    FetchWatchdog watchdog(cancel, std::chrono::milliseconds(5));
    auto live = std::make_shared<std::atomic_int>(0);
    testutil::FakeObjectStream stream(testutil::FakeObject{.data = "abc", .block_after = 0}, live);

    watchdog.Arm(&stream, std::chrono::milliseconds(50));
    std::array<std::uint8_t, 8> buf{};
    EXPECT_EQ(stream.Read(buf), -1);
    EXPECT_EQ(watchdog.Disarm(), FetchWatchdog::Outcome::TimedOut);
}

TEST(FetchWatchdogTest, PropagatesCancelToken) {
    CancelToken cancel;
    FetchWatchdog watchdog(cancel, std::chrono::milliseconds(5));
    auto live = std::make_shared<std::atomic_int>(0);
    testutil::FakeObjectStream stream(testutil::FakeObject{.data = "abc", .block_after = 0}, live);

    watchdog.Arm(&stream, std::chrono::seconds(60));
    std::thread t([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        cancel.Cancel();
    });
    std::array<std::uint8_t, 8> buf{};
    EXPECT_EQ(stream.Read(buf), -1);
    t.join();
    EXPECT_EQ(watchdog.Disarm(), FetchWatchdog::Outcome::Cancelled);
}

TEST(FetchWatchdogTest, QuietWhenStreamFinishesInTime) {
    CancelToken cancel;
    FetchWatchdog watchdog(cancel, std::chrono::milliseconds(5));
    auto live = std::make_shared<std::atomic_int>(0);
    testutil::FakeObjectStream stream(testutil::FakeObject{.data = "abc"}, live);

    watchdog.Arm(&stream, std::chrono::seconds(10));
    EXPECT_EQ(testutil::ReadAll(stream), "abc");
    EXPECT_EQ(watchdog.Disarm(), FetchWatchdog::Outcome::None);

    // Disarmed: a later timeout must not reach the stream.
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::array<std::uint8_t, 8> buf{};
    EXPECT_EQ(stream.Read(buf), 0);
}

TEST(FetchWatchdogTest, TouchExtendsDeadline) {
    CancelToken cancel;
    FetchWatchdog watchdog(cancel, std::chrono::milliseconds(5));
    auto live = std::make_shared<std::atomic_int>(0);
    testutil::FakeObjectStream stream(testutil::FakeObject{.data = "abc"}, live);

    watchdog.Arm(&stream, std::chrono::milliseconds(200));
    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        watchdog.Touch();
    }
    EXPECT_EQ(watchdog.Disarm(), FetchWatchdog::Outcome::None);
}

} // namespace zipline
