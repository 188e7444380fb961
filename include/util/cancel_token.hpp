#pragma once

#include <atomic>
#include <memory>

namespace zipline {

// Shared cancellation flag. Copies observe the same flag, so the transport
// (client disconnect) or a signal handler can stop a running download.
class CancelToken {
  public:
    CancelToken() : flag_(std::make_shared<std::atomic_bool>(false)) {}

    void Cancel() const { flag_->store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return flag_->load(std::memory_order_relaxed); }

    // Lock-free flag, safe to store to from a signal handler.
    std::atomic_bool* RawFlag() const { return flag_.get(); }

  private:
    std::shared_ptr<std::atomic_bool> flag_;
};

} // namespace zipline
