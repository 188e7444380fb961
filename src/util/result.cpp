#include "util/result.hpp"

namespace zipline {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "OK";
        case ErrorCode::NotFound:            return "NOT_FOUND";
        case ErrorCode::Expired:             return "EXPIRED";
        case ErrorCode::Unauthorized:        return "UNAUTHORIZED";
        case ErrorCode::InvalidTicket:       return "INVALID_TICKET";
        case ErrorCode::ExpiredTicket:       return "EXPIRED_TICKET";
        case ErrorCode::PartNotFound:        return "PART_NOT_FOUND";
        case ErrorCode::UpstreamObjectError: return "UPSTREAM_OBJECT_ERROR";
        case ErrorCode::StreamAborted:       return "STREAM_ABORTED";
        case ErrorCode::SigningError:        return "SIGNING_ERROR";
        case ErrorCode::InvalidArgument:     return "INVALID_ARGUMENT";
        case ErrorCode::IoError:             return "IO_ERROR";
        case ErrorCode::ConfigError:         return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

} // namespace zipline
