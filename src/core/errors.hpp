#pragma once
#include <string>

namespace sping {
enum class ErrorKind { Resolution, Socket, Send, Decode };

enum class ErrorCode {
    None,
    HostNotFound,
    NoMatchingFamily,
    LookupFailed,
    PermissionDenied,
    CreationFailed,
    DescriptorInvalid,
    ReceiveFailed,
    SendFailed,
    PartialSend,
    Malformed,
};

// Error value passed through out-parameters and reported via the event sink.
// sys_errno holds errno (socket/send) or the getaddrinfo code (resolution).
struct Error {
    ErrorKind kind{ErrorKind::Socket};
    ErrorCode code{ErrorCode::None};
    int sys_errno{0};
    std::string detail;

    // Stable tag such as "resolution.no_matching_family".
    std::string category() const;
    // Human-readable one-liner for logs and the CLI.
    std::string message() const;
};

Error make_error(ErrorKind kind, ErrorCode code, int sys_errno = 0, const std::string& detail = "");

const char* error_kind_name(ErrorKind kind);
const char* error_code_name(ErrorCode code);
}  // namespace sping
