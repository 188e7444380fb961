#include "util/console_progress.hpp"

#include <atomic>
#include <cstdio>

namespace zipline {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    // Redraw on every finished object, otherwise at most every min_step_ bytes.
    const bool object_done = e.objects_done != last_objects_done_;
    if (!object_done && e.bytes_done < next_) return;
    next_ = e.bytes_done + min_step_;
    last_objects_done_ = e.objects_done;

    int obj_pct = 0;
    if (e.objects_total > 0) {
        obj_pct = static_cast<int>((e.objects_done * 100ULL) / e.objects_total);
        if (obj_pct > 100)
            obj_pct = 100;
    }

    if (e.bytes_total > 0) {
        int byte_pct = static_cast<int>((e.bytes_done * 100ULL) / e.bytes_total);
        if (byte_pct > 100)
            byte_pct = 100;
        std::fprintf(stderr,
                     "\r[%llu/%llu] %3d%% | bytes %3d%% | %.*s\033[K",
                     (unsigned long long)e.objects_done,
                     (unsigned long long)e.objects_total,
                     obj_pct,
                     byte_pct,
                     (int)e.entry.size(),
                     e.entry.data());
    } else {
        std::fprintf(stderr,
                     "\r[%llu/%llu] %3d%% | %llu bytes | %.*s\033[K",
                     (unsigned long long)e.objects_done,
                     (unsigned long long)e.objects_total,
                     obj_pct,
                     (unsigned long long)e.bytes_done,
                     (int)e.entry.size(),
                     e.entry.data());
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.objects_total > 0 && e.objects_done >= e.objects_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace zipline
