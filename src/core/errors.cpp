#include "errors.hpp"

#include <netdb.h>

#include <cstring>

namespace sping {
const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::Socket: return "socket";
        case ErrorKind::Send: return "send";
        case ErrorKind::Decode: return "decode";
    }
    return "unknown";
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::HostNotFound: return "host_not_found";
        case ErrorCode::NoMatchingFamily: return "no_matching_family";
        case ErrorCode::LookupFailed: return "lookup_failed";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::CreationFailed: return "creation_failed";
        case ErrorCode::DescriptorInvalid: return "descriptor_invalid";
        case ErrorCode::ReceiveFailed: return "receive_failed";
        case ErrorCode::SendFailed: return "send_failed";
        case ErrorCode::PartialSend: return "partial_send";
        case ErrorCode::Malformed: return "malformed";
    }
    return "unknown";
}

Error make_error(ErrorKind kind, ErrorCode code, int sys_errno, const std::string& detail) {
    Error e;
    e.kind = kind;
    e.code = code;
    e.sys_errno = sys_errno;
    e.detail = detail;
    return e;
}

std::string Error::category() const {
    return std::string(error_kind_name(kind)) + "." + error_code_name(code);
}

std::string Error::message() const {
    std::string out;
    switch (code) {
        case ErrorCode::HostNotFound: out = "host not found"; break;
        case ErrorCode::NoMatchingFamily: out = "no address of the requested family"; break;
        case ErrorCode::LookupFailed: out = "name lookup failed"; break;
        case ErrorCode::PermissionDenied: out = "permission denied (need CAP_NET_RAW or root)"; break;
        case ErrorCode::CreationFailed: out = "socket creation failed"; break;
        case ErrorCode::DescriptorInvalid: out = "socket descriptor invalidated"; break;
        case ErrorCode::ReceiveFailed: out = "receive failed"; break;
        case ErrorCode::SendFailed: out = "send failed"; break;
        case ErrorCode::PartialSend: out = "partial send"; break;
        case ErrorCode::Malformed: out = "malformed packet"; break;
        case ErrorCode::None: out = "no error"; break;
    }
    if (sys_errno != 0) {
        if (kind == ErrorKind::Resolution) {
            out += std::string(": ") + ::gai_strerror(sys_errno);
        } else {
            out += std::string(": ") + std::strerror(sys_errno);
        }
    }
    if (!detail.empty()) out += " (" + detail + ")";
    return out;
}
}  // namespace sping
