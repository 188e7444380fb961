#pragma once

#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zipline {

using Sha256Digest = std::array<std::uint8_t, 32>;

// HMAC-SHA256 over data. Returns nullopt if OpenSSL reports a failure.
std::optional<Sha256Digest> HmacSha256(std::string_view key, std::span<const std::uint8_t> data);

// Constant-time comparison; sizes are not secret.
bool ConstantTimeEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b);

// RFC 4648 section 5 alphabet, no padding.
std::string Base64UrlEncode(std::span<const std::uint8_t> data);
std::optional<std::vector<std::uint8_t>> Base64UrlDecode(std::string_view text);

// Random RFC 4122 version 4 UUID, lowercase hex.
Result RandomUuid(std::string& out);

inline std::span<const std::uint8_t> AsBytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace zipline
