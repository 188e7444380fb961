#pragma once

#include "archive/archive_inspector.hpp"
#include "download/collaborators.hpp"
#include "download/response_sink.hpp"
#include "io/io.hpp"
#include "util/cancel_token.hpp"
#include "util/clock.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/zipline_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

    // Writes <root>/<rel>, creating parent directories.
    std::string WriteFile(const std::string& rel, const std::string& contents) const {
        const std::string full = path_ + "/" + rel;
        for (std::size_t pos = path_.size() + 1; (pos = full.find('/', pos)) != std::string::npos; ++pos) {
            ::mkdir(full.substr(0, pos).c_str(), 0755);
        }
        std::ofstream os(full, std::ios::binary);
        os << contents;
        if (!os.good()) throw std::runtime_error("cannot write " + full);
        return full;
    }

  private:
    std::string path_;
};

class MemoryReader final : public zipline::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

inline std::string ReadAll(zipline::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

inline std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

class MemoryWriter final : public zipline::IWriter {
  public:
    zipline::Result WriteAll(std::span<const std::uint8_t> in) override {
        data.insert(data.end(), in.begin(), in.end());
        return zipline::Result::Ok();
    }

    std::vector<std::uint8_t> data;
};

// Collects a whole response in memory. fail_after_bytes simulates a client
// that goes away mid-body; cancel_on_fail mirrors what a transport does then.
class MemoryResponseSink final : public zipline::IResponseSink {
  public:
    zipline::Result Begin(const zipline::StreamHeaders& h) override {
        if (headers_sent) return zipline::Result::Fail(zipline::ErrorCode::InvalidArgument, "headers twice");
        if (fail_begin) return zipline::Result::Fail(zipline::ErrorCode::StreamAborted, "client gone");
        headers_sent = true;
        status = 200;
        headers = h;
        return zipline::Result::Ok();
    }

    zipline::Result SendJson(int s, const std::string& b) override {
        if (headers_sent) return zipline::Result::Fail(zipline::ErrorCode::InvalidArgument, "headers twice");
        headers_sent = true;
        status = s;
        json_body = b;
        return zipline::Result::Ok();
    }

    zipline::Result WriteAll(std::span<const std::uint8_t> in) override {
        if (!headers) return zipline::Result::Fail(zipline::ErrorCode::InvalidArgument, "body before headers");
        if (fail_after_bytes && body.size() + in.size() > *fail_after_bytes) {
            if (cancel_on_fail) cancel_on_fail->Cancel();
            return zipline::Result::Fail(zipline::ErrorCode::StreamAborted, "client disconnected");
        }
        body.insert(body.end(), in.begin(), in.end());
        return zipline::Result::Ok();
    }

    zipline::Result End() override {
        ended = true;
        return zipline::Result::Ok();
    }

    void Abort(const std::string& reason) override {
        aborted = true;
        abort_reason = reason;
    }

    bool HeadersSent() const override { return headers_sent; }

    std::string BodyString() const { return std::string(body.begin(), body.end()); }

    bool headers_sent = false;
    bool fail_begin = false;
    std::optional<std::size_t> fail_after_bytes;
    std::optional<zipline::CancelToken> cancel_on_fail;

    int status = 0;
    std::string json_body;
    std::optional<zipline::StreamHeaders> headers;
    std::vector<std::uint8_t> body;
    bool ended = false;
    bool aborted = false;
    std::string abort_reason;
};

// How a fake stored object behaves when fetched.
struct FakeObject {
    std::string data;
    bool fail_open = false;
    std::optional<std::size_t> fail_after;   // read error once this many bytes were served
    std::optional<std::size_t> block_after;  // block until Cancel() after this many bytes
    std::size_t chunk = 7;                   // bytes per Read()
};

class FakeObjectStream final : public zipline::IObjectStream {
  public:
    FakeObjectStream(FakeObject obj, std::shared_ptr<std::atomic_int> live)
        : obj_(std::move(obj)), live_(std::move(live)) {
        live_->fetch_add(1);
    }
    ~FakeObjectStream() override { live_->fetch_sub(1); }

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (cancelled_.load()) {
            errno = ECANCELED;
            return -1;
        }
        if (obj_.fail_after && pos_ >= *obj_.fail_after) {
            errno = EIO;
            return -1;
        }
        if (obj_.block_after && pos_ >= *obj_.block_after) {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&] { return cancelled_.load(); });
            errno = ECANCELED;
            return -1;
        }
        if (pos_ >= obj_.data.size()) return 0;

        std::size_t n = std::min({out.size(), obj_.chunk, obj_.data.size() - pos_});
        if (obj_.fail_after) n = std::min(n, *obj_.fail_after - pos_);
        if (obj_.block_after) n = std::min(n, *obj_.block_after - pos_);
        std::copy_n(obj_.data.data() + pos_, n, out.data());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override { return obj_.data.size(); }

    void Cancel() override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

  private:
    FakeObject obj_;
    std::shared_ptr<std::atomic_int> live_;
    std::size_t pos_ = 0;
    std::atomic_bool cancelled_{false};
    std::mutex mu_;
    std::condition_variable cv_;
};

class FakeObjectStorage final : public zipline::IObjectStorage {
  public:
    void Put(const std::string& ref, FakeObject obj) { objects_[ref] = std::move(obj); }
    void Put(const std::string& ref, std::string data) { objects_[ref] = FakeObject{.data = std::move(data)}; }

    zipline::Result OpenReadStream(const std::string& ref,
                                   std::chrono::steady_clock::time_point,
                                   std::unique_ptr<zipline::IObjectStream>& out) override {
        opened.push_back(ref);
        max_live = std::max(max_live, live_->load() + 1);
        auto it = objects_.find(ref);
        if (it == objects_.end()) {
            return zipline::Result::Fail(zipline::ErrorCode::UpstreamObjectError, "no such object: " + ref);
        }
        if (it->second.fail_open) {
            return zipline::Result::Fail(zipline::ErrorCode::UpstreamObjectError, "open failed: " + ref);
        }
        out = std::make_unique<FakeObjectStream>(it->second, live_);
        return zipline::Result::Ok();
    }

    int Live() const { return live_->load(); }

    std::vector<std::string> opened;
    int max_live = 0;

  private:
    std::map<std::string, FakeObject> objects_;
    std::shared_ptr<std::atomic_int> live_ = std::make_shared<std::atomic_int>(0);
};

class FakeResolver final : public zipline::ITargetResolver {
  public:
    zipline::Result Resolve(const zipline::TargetSelector& target,
                            const std::string& requester,
                            zipline::ResolvedTarget& out) const override {
        ++calls;
        last_requester = requester;
        for (const auto& [sel, resolved] : targets) {
            if (sel == target) {
                out = resolved;
                return zipline::Result::Ok();
            }
        }
        return zipline::Result::Fail(zipline::ErrorCode::NotFound, "Gallery not found");
    }

    std::vector<std::pair<zipline::TargetSelector, zipline::ResolvedTarget>> targets;
    mutable int calls = 0;
    mutable std::string last_requester;
};

class FakeAuthorizer final : public zipline::IAuthorizer {
  public:
    bool IsAuthorized(const zipline::TargetSelector&,
                      const std::string& requester,
                      const std::string& credential) const override {
        ++calls;
        return allow || (!password.empty() && credential == password) || requester == owner;
    }

    bool allow = true;
    std::string password;
    std::string owner = "\x01";
    mutable int calls = 0;
};

// Test clock; copies of Fn() follow Advance().
class ManualClock {
  public:
    explicit ManualClock(zipline::TimePoint start = zipline::FromUnixSeconds(1700000000))
        : now_(std::make_shared<zipline::TimePoint>(start)) {}

    zipline::ClockFn Fn() const {
        auto now = now_;
        return [now] { return *now; };
    }
    zipline::TimePoint Now() const { return *now_; }
    void Advance(std::chrono::seconds d) { *now_ += d; }

  private:
    std::shared_ptr<zipline::TimePoint> now_;
};

struct ZipEntry {
    std::string name;
    std::string contents;
};

// Reads back a produced archive with libarchive.
inline std::vector<ZipEntry> ReadZip(const std::vector<std::uint8_t>& bytes) {
    zipline::ArchiveInspector inspector;
    auto r = inspector.OpenMemory(bytes);
    if (!r.is_ok()) throw std::runtime_error(r.message());

    std::vector<zipline::ArchiveEntryInfo> infos;
    std::vector<std::string> contents;
    r = zipline::ListArchiveEntries(inspector, infos, &contents);
    if (!r.is_ok()) throw std::runtime_error(r.message());

    std::vector<ZipEntry> out;
    for (std::size_t i = 0; i < infos.size(); ++i) out.push_back({infos[i].name, contents[i]});
    return out;
}

inline zipline::ObjectRef Obj(std::string id, std::string name, std::uint64_t size,
                              std::string ref = {}) {
    if (ref.empty()) ref = "bucket/" + id;
    return zipline::ObjectRef{.id = std::move(id), .name = std::move(name), .storage_ref = std::move(ref),
                              .size = size};
}

} // namespace testutil
