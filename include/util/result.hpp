#pragma once
#include <string>
#include <utility>

namespace zipline {

enum class ErrorCode : int {
    None = 0,
    NotFound,
    Expired,
    Unauthorized,
    InvalidTicket,
    ExpiredTicket,
    PartNotFound,
    UpstreamObjectError,
    StreamAborted,
    SigningError,
    InvalidArgument,
    IoError,
    ConfigError,
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode err{ErrorCode::None};
    std::string msg;

    bool is_ok() const { return ok; }
    ErrorCode code() const { return err; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace zipline
