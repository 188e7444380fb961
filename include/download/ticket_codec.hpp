#pragma once

#include "download/types.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace zipline {

struct TicketPayload {
    std::string requester;
    TargetSelector target;
    TimePoint issued_at{};   // whole seconds
    TimePoint expires_at{};  // whole seconds

    bool operator==(const TicketPayload&) const = default;
};

// Signed, short-lived download capability:
//   base64url(json payload) "." base64url(HMAC-SHA256(secret, first part))
class TicketCodec {
  public:
    struct Options {
        std::string secret;
        std::chrono::seconds ttl{5 * 60};
        ClockFn clock = SystemClock();
    };

    explicit TicketCodec(Options opt);

    // Stamps issued_at/expires_at into payload and returns the token.
    Result Issue(TicketPayload& payload, std::string& out_token) const;

    // InvalidTicket on any structural or signature problem, ExpiredTicket
    // once the validity window has elapsed.
    Result Verify(std::string_view token, TicketPayload& out) const;

  private:
    Options opt_;
};

} // namespace zipline
