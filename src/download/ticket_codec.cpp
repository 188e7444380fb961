#include "download/ticket_codec.hpp"

#include "crypto/hmac.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace zipline {

using json = nlohmann::json;

namespace {

TimePoint WholeSeconds(TimePoint tp) {
    return std::chrono::time_point_cast<std::chrono::seconds>(tp);
}

Result Invalid(const std::string& why) {
    return Result::Fail(ErrorCode::InvalidTicket, "Invalid download ticket: " + why);
}

bool GetString(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool GetInt(const json& j, const char* key, std::int64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return false;
    out = it->get<std::int64_t>();
    return true;
}

} // namespace

TicketCodec::TicketCodec(Options opt) : opt_(std::move(opt)) {
    if (!opt_.clock) opt_.clock = SystemClock();
}

Result TicketCodec::Issue(TicketPayload& payload, std::string& out_token) const {
    if (opt_.secret.empty()) {
        return Result::Fail(ErrorCode::SigningError, "ticket secret is not configured");
    }

    payload.issued_at = WholeSeconds(opt_.clock());
    payload.expires_at = payload.issued_at + opt_.ttl;

    json j;
    j["sub"] = payload.requester;
    j["gid"] = payload.target.gallery_id;
    j["kind"] = DownloadKindName(payload.target.kind);
    if (!payload.target.folder_id.empty()) j["fid"] = payload.target.folder_id;
    j["iat"] = ToUnixSeconds(payload.issued_at);
    j["exp"] = ToUnixSeconds(payload.expires_at);

    const std::string body = Base64UrlEncode(AsBytes(j.dump()));
    const auto mac = HmacSha256(opt_.secret, AsBytes(body));
    if (!mac) return Result::Fail(ErrorCode::SigningError, "HMAC-SHA256 failed");

    out_token = body + "." + Base64UrlEncode(*mac);
    return Result::Ok();
}

Result TicketCodec::Verify(std::string_view token, TicketPayload& out) const {
    if (opt_.secret.empty()) {
        return Result::Fail(ErrorCode::SigningError, "ticket secret is not configured");
    }

    const auto dot = token.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= token.size() ||
        token.find('.', dot + 1) != std::string_view::npos) {
        return Invalid("malformed token");
    }
    const std::string_view body = token.substr(0, dot);
    const std::string_view sig_text = token.substr(dot + 1);

    const auto expected = HmacSha256(opt_.secret, AsBytes(body));
    if (!expected) return Result::Fail(ErrorCode::SigningError, "HMAC-SHA256 failed");
    // Compared as canonical text: unused trailing base64 bits must match too.
    const std::string expected_text = Base64UrlEncode(*expected);
    if (!ConstantTimeEquals(AsBytes(sig_text), AsBytes(expected_text))) {
        return Invalid("signature mismatch");
    }

    const auto raw = Base64UrlDecode(body);
    if (!raw) return Invalid("malformed payload");

    json j;
    try {
        j = json::parse(raw->begin(), raw->end());
    } catch (const json::parse_error& e) {
        return Invalid(std::string("payload is not JSON (") + e.what() + ")");
    }
    if (!j.is_object()) return Invalid("payload is not an object");

    TicketPayload p;
    std::string kind;
    std::int64_t iat = 0;
    std::int64_t exp = 0;
    if (!GetString(j, "sub", p.requester) || !GetString(j, "gid", p.target.gallery_id) ||
        !GetString(j, "kind", kind) || !GetInt(j, "iat", iat) || !GetInt(j, "exp", exp)) {
        return Invalid("missing fields");
    }
    const auto parsed_kind = ParseDownloadKind(kind);
    if (!parsed_kind) return Invalid("unknown kind '" + kind + "'");
    p.target.kind = *parsed_kind;
    if (j.contains("fid") && !GetString(j, "fid", p.target.folder_id)) return Invalid("bad folder id");
    if (p.target.kind == DownloadKind::Folder && p.target.folder_id.empty()) {
        return Invalid("folder ticket without folder id");
    }
    p.issued_at = FromUnixSeconds(iat);
    p.expires_at = FromUnixSeconds(exp);

    if (opt_.clock() >= p.expires_at) {
        LogDebug("ticket for %s expired", p.requester.c_str());
        return Result::Fail(ErrorCode::ExpiredTicket, "Download ticket has expired");
    }

    out = std::move(p);
    return Result::Ok();
}

} // namespace zipline
