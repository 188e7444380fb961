#include "download/fetch_watchdog.hpp"

#include <utility>

namespace zipline {

using SteadyClock = std::chrono::steady_clock;

FetchWatchdog::FetchWatchdog(CancelToken cancel, std::chrono::milliseconds poll)
    : cancel_(std::move(cancel)), poll_(poll) {
    thread_ = std::thread([this] { Run(); });
}

FetchWatchdog::~FetchWatchdog() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void FetchWatchdog::Arm(IObjectStream* stream, std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stream_ = stream;
        timeout_ = timeout;
        deadline_ = SteadyClock::now() + timeout;
        outcome_ = Outcome::None;
    }
    cv_.notify_all();
}

void FetchWatchdog::Touch() {
    std::lock_guard<std::mutex> lk(mu_);
    if (stream_ && outcome_ == Outcome::None) deadline_ = SteadyClock::now() + timeout_;
}

FetchWatchdog::Outcome FetchWatchdog::Disarm() {
    std::lock_guard<std::mutex> lk(mu_);
    stream_ = nullptr;
    const Outcome out = outcome_;
    outcome_ = Outcome::None;
    return out;
}

void FetchWatchdog::Run() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        // Cancel() runs under mu_, so Disarm() cannot race the stream away.
        if (stream_ && outcome_ == Outcome::None) {
            if (cancel_.IsCancelled()) {
                stream_->Cancel();
                outcome_ = Outcome::Cancelled;
            } else if (SteadyClock::now() >= deadline_) {
                stream_->Cancel();
                outcome_ = Outcome::TimedOut;
            }
        }

        auto wake = SteadyClock::now() + poll_;
        if (stream_ && outcome_ == Outcome::None && deadline_ < wake) wake = deadline_;
        cv_.wait_until(lk, wake);
    }
}

} // namespace zipline
