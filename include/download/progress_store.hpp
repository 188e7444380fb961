#pragma once

#include "download/types.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace zipline {

// Fields to merge into a record; unset fields are left alone.
struct ProgressUpdate {
    std::optional<ProgressStatus> status;
    std::optional<std::uint64_t> processed;
    std::optional<std::string> error;
    std::optional<std::string> failed_entry;  // appended to failed_entries
};

// Thread-safe registry of in-flight download progress.
//
// Records are removed by a background sweep once their last update is older
// than the retention window, or once a scheduled removal time has passed.
// Callers only ever get copies of records.
class ProgressStore {
  public:
    // ScheduleRemoval() clamps its delay to [0, kMaxRemovalDelay].
    static constexpr std::chrono::seconds kMaxRemovalDelay{30 * 24 * 60 * 60};

    struct Options {
        std::chrono::seconds retention{30 * 60};
        std::chrono::seconds sweep_interval{5 * 60};
        bool background_sweep = true;
        ClockFn clock = SystemClock();
    };

    ProgressStore();
    explicit ProgressStore(Options opt);
    ~ProgressStore();

    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    Result Create(const std::string& filename, std::uint64_t total, std::string& out_id);

    // Returns false if the id is unknown (already swept or removed).
    bool Update(const std::string& id, const ProgressUpdate& update);

    std::optional<ProgressRecord> Get(const std::string& id) const;
    void Remove(const std::string& id);
    void ScheduleRemoval(const std::string& id, std::chrono::seconds delay);

    // Runs one sweep against the injected clock; returns the number removed.
    std::size_t SweepNow();
    std::size_t Size() const;

  private:
    void SweepLoop();

    Options opt_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::unordered_map<std::string, ProgressRecord> records_;
    std::thread sweeper_;
};

} // namespace zipline
