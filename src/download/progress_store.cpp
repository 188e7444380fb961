#include "download/progress_store.hpp"

#include "crypto/hmac.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace zipline {

namespace {

int PercentOf(std::uint64_t processed, std::uint64_t total) {
    const double pct = std::round(static_cast<double>(processed) / static_cast<double>(total) * 100.0);
    if (pct <= 0.0) return 0;
    if (pct >= 100.0) return 100;
    return static_cast<int>(pct);
}

} // namespace

ProgressStore::ProgressStore() : ProgressStore(Options{}) {}

ProgressStore::ProgressStore(Options opt) : opt_(std::move(opt)) {
    if (!opt_.clock) opt_.clock = SystemClock();
    if (opt_.background_sweep) {
        sweeper_ = std::thread([this] { SweepLoop(); });
    }
}

ProgressStore::~ProgressStore() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (sweeper_.joinable()) sweeper_.join();
}

Result ProgressStore::Create(const std::string& filename, std::uint64_t total, std::string& out_id) {
    std::string id;
    auto r = RandomUuid(id);
    if (!r.is_ok()) return r;

    ProgressRecord rec;
    rec.id = id;
    rec.status = ProgressStatus::Preparing;
    rec.total = total;
    rec.filename = filename;
    rec.created_at = opt_.clock();
    rec.updated_at = rec.created_at;

    {
        std::lock_guard<std::mutex> lk(mu_);
        records_.emplace(id, std::move(rec));
    }
    out_id = std::move(id);
    return Result::Ok();
}

bool ProgressStore::Update(const std::string& id, const ProgressUpdate& update) {
    const TimePoint now = opt_.clock();

    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;

    ProgressRecord& rec = it->second;
    if (update.status) rec.status = *update.status;
    if (update.processed && *update.processed > rec.processed) {
        rec.processed = (rec.total > 0 && *update.processed > rec.total) ? rec.total : *update.processed;
    }
    if (update.error) rec.error = *update.error;
    if (update.failed_entry) rec.failed_entries.push_back(*update.failed_entry);
    if (rec.total > 0) rec.percent = PercentOf(rec.processed, rec.total);
    rec.updated_at = now;
    return true;
}

std::optional<ProgressRecord> ProgressStore::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void ProgressStore::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    records_.erase(id);
}

void ProgressStore::ScheduleRemoval(const std::string& id, std::chrono::seconds delay) {
    const TimePoint at = opt_.clock() + std::clamp(delay, std::chrono::seconds(0), kMaxRemovalDelay);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it != records_.end()) it->second.remove_at = at;
}

std::size_t ProgressStore::SweepNow() {
    const TimePoint now = opt_.clock();
    std::size_t removed = 0;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = records_.begin(); it != records_.end();) {
        const ProgressRecord& rec = it->second;
        const bool stale = now - rec.updated_at > opt_.retention;
        const bool due = rec.remove_at && now >= *rec.remove_at;
        if (stale || due) {
            LogDebug("progress %s removed (%s)", it->first.c_str(), stale ? "stale" : "scheduled");
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t ProgressStore::Size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

void ProgressStore::SweepLoop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        cv_.wait_for(lk, opt_.sweep_interval, [this] { return stop_; });
        if (stop_) break;
        lk.unlock();
        const std::size_t removed = SweepNow();
        if (removed > 0) LogInfo("Swept %zu download progress record(s)", removed);
        lk.lock();
    }
}

} // namespace zipline
