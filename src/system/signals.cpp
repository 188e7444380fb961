// signals.cpp - Signal handling bound to a download cancel token.

#include "system/signals.hpp"

#include <csignal>

namespace zipline {

namespace {

CancelToken g_token;
std::atomic<std::atomic_bool*> g_flag{nullptr};

void HandleSignal(int) {
    if (std::atomic_bool* f = g_flag.load(std::memory_order_relaxed)) {
        f->store(true, std::memory_order_relaxed);
    }
}

} // namespace

void InstallSignalHandlers(const CancelToken& token) {
    g_token = token;  // keeps the flag alive for the life of the process
    g_flag.store(g_token.RawFlag(), std::memory_order_relaxed);
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

} // namespace zipline
