#include "core/result.hpp"

namespace lanbridge {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::BindFailed: return "bind-failed";
        case ErrorCode::HostNotFound: return "host-not-found";
        case ErrorCode::ConnectFailed: return "connect-failed";
        case ErrorCode::TunnelReadFailed: return "tunnel-read-failed";
        case ErrorCode::TunnelWriteFailed: return "tunnel-write-failed";
        case ErrorCode::QueryFailed: return "query-failed";
        case ErrorCode::MalformedEnvelope: return "malformed-envelope";
        case ErrorCode::NotIpv4: return "not-ipv4";
        case ErrorCode::PayloadTooLarge: return "payload-too-large";
        case ErrorCode::ConfigInvalid: return "config-invalid";
    }
    return "?";
}

} // namespace lanbridge
