#include "crypto/hmac.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>


namespace zipline {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

bool IsBase64UrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
           c == '_';
}

} // namespace

std::optional<Sha256Digest> HmacSha256(std::string_view key, std::span<const std::uint8_t> data) {
    Sha256Digest out{};
    unsigned int len = 0;
    const unsigned char* md = HMAC(EVP_sha256(),
                                   key.data(),
                                   static_cast<int>(key.size()),
                                   data.data(),
                                   data.size(),
                                   out.data(),
                                   &len);
    if (md == nullptr || len != out.size()) return std::nullopt;
    return out;
}

bool ConstantTimeEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Base64UrlEncode(std::span<const std::uint8_t> data) {
    if (data.empty()) return {};

    std::string out;
    out.resize(4 * ((data.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> Base64UrlDecode(std::string_view text) {
    if (text.empty()) return std::vector<std::uint8_t>{};
    if (text.size() % 4 == 1) return std::nullopt;

    std::string std_b64;
    std_b64.reserve(text.size() + 3);
    for (char c : text) {
        if (!IsBase64UrlChar(c)) return std::nullopt;
        if (c == '-') std_b64.push_back('+');
        else if (c == '_') std_b64.push_back('/');
        else std_b64.push_back(c);
    }
    size_t padding = 0;
    while (std_b64.size() % 4 != 0) {
        std_b64.push_back('=');
        ++padding;
    }

    std::vector<std::uint8_t> out(std_b64.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(std_b64.data()),
                                  static_cast<int>(std_b64.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) return std::nullopt;
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

Result RandomUuid(std::string& out) {
    std::array<std::uint8_t, 16> b{};
    if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
        return Result::Fail(ErrorCode::IoError, "RAND_bytes failed");
    }
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);

    const std::string hex = HexEncode(b);
    out = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
          hex.substr(16, 4) + "-" + hex.substr(20, 12);
    return Result::Ok();
}

} // namespace zipline
