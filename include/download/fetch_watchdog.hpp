#pragma once

#include "download/collaborators.hpp"
#include "util/cancel_token.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace zipline {

// Watches the one in-flight object stream of a download. If no progress is
// reported within the timeout, or the download is cancelled, it calls
// IObjectStream::Cancel() from its own thread so a blocked Read() returns.
class FetchWatchdog {
  public:
    enum class Outcome { None, TimedOut, Cancelled };

    explicit FetchWatchdog(CancelToken cancel,
                           std::chrono::milliseconds poll = std::chrono::milliseconds(100));
    ~FetchWatchdog();

    FetchWatchdog(const FetchWatchdog&) = delete;
    FetchWatchdog& operator=(const FetchWatchdog&) = delete;

    void Arm(IObjectStream* stream, std::chrono::milliseconds timeout);
    // Pushes the deadline out again after the stream made progress.
    void Touch();
    // After Disarm() returns the watchdog no longer touches the stream.
    Outcome Disarm();

  private:
    void Run();

    CancelToken cancel_;
    std::chrono::milliseconds poll_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    IObjectStream* stream_ = nullptr;
    std::chrono::milliseconds timeout_{0};
    std::chrono::steady_clock::time_point deadline_{};
    Outcome outcome_ = Outcome::None;
    std::thread thread_;
};

} // namespace zipline
