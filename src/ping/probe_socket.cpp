#include "probe_socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include "../core/logger.hpp"

namespace sping {
namespace {
constexpr size_t kRecvBufferSize = 65536;

Error open_error(int sys_errno, const std::string& what) {
    return make_error(ErrorKind::Socket, classify_open_errno(sys_errno), sys_errno, what);
}

// The port a ping socket is bound to is the echo identifier it puts on the wire.
bool bound_port(int fd, uint16_t& port) {
    sockaddr_in6 local{};
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) < 0) return false;
    port = ntohs(local.sin6_port);
    return true;
}
}  // namespace

ErrorCode classify_open_errno(int sys_errno) {
    return (sys_errno == EPERM || sys_errno == EACCES) ? ErrorCode::PermissionDenied
                                                       : ErrorCode::CreationFailed;
}

RecvStatus classify_recv_errno(int sys_errno, Error& err) {
    if (sys_errno == EAGAIN || sys_errno == EWOULDBLOCK || sys_errno == EINTR) return RecvStatus::WouldBlock;
    if (sys_errno == EBADF || sys_errno == ENOTSOCK || sys_errno == EFAULT || sys_errno == EINVAL) {
        err = make_error(ErrorKind::Socket, ErrorCode::DescriptorInvalid, sys_errno);
        return RecvStatus::Fatal;
    }
    // Queued ICMP errors (unreachable, refused) surface here; not fatal.
    err = make_error(ErrorKind::Socket, ErrorCode::ReceiveFailed, sys_errno);
    return RecvStatus::Transient;
}

bool check_send_result(ssize_t sent, size_t expected, int sys_errno, Error& err) {
    if (sent < 0) {
        err = make_error(ErrorKind::Send, ErrorCode::SendFailed, sys_errno);
        return false;
    }
    if (static_cast<size_t>(sent) != expected) {
        err = make_error(ErrorKind::Send, ErrorCode::PartialSend, 0,
                         std::to_string(sent) + " of " + std::to_string(expected) + " bytes");
        return false;
    }
    return true;
}

IcmpSocket::IcmpSocket(Fd fd, IcmpFamily family, uint16_t identifier)
    : fd_(std::move(fd)), family_(family), identifier_(identifier) {}

IcmpSocket::~IcmpSocket() { close(); }

std::unique_ptr<ProbeSocket> IcmpSocket::open(const Address& to, uint16_t identifier, Error& err) {
    if (to.is_v4()) {
        Fd fd(::socket(AF_INET, SOCK_RAW | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_ICMP));
        if (!fd) {
            err = open_error(errno, "socket(AF_INET, SOCK_RAW)");
            return nullptr;
        }
        int ttl = 64;
        if (::setsockopt(fd.get(), IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl)) < 0) {
            log(LogLevel::WARN, std::string("setsockopt IP_TTL: ") + std::strerror(errno));
        }
        return std::make_unique<IcmpSocket>(std::move(fd), IcmpFamily::V4, identifier);
    }
    if (to.is_v6()) {
        Fd fd(::socket(AF_INET6, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_ICMPV6));
        if (!fd) {
            err = open_error(errno, "socket(AF_INET6, SOCK_DGRAM, IPPROTO_ICMPV6)");
            return nullptr;
        }
        // A ping socket rewrites the echo identifier to its local port. Port 0
        // lets the kernel pick one, so the identifier is read back after bind.
        sockaddr_in6 local{};
        local.sin6_family = AF_INET6;
        local.sin6_addr = in6addr_any;
        local.sin6_port = htons(identifier);
        if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
            err = open_error(errno, "bind ICMPv6 identifier " + std::to_string(identifier));
            return nullptr;
        }
        uint16_t wire_id = 0;
        if (!bound_port(fd.get(), wire_id)) {
            err = open_error(errno, "getsockname");
            return nullptr;
        }
        return std::make_unique<IcmpSocket>(std::move(fd), IcmpFamily::V6, wire_id);
    }
    err = make_error(ErrorKind::Socket, ErrorCode::CreationFailed, EAFNOSUPPORT, "unsupported address family");
    return nullptr;
}

bool IcmpSocket::send(const Bytes& packet, const Address& to, Error& err) {
    if (!fd_) {
        err = make_error(ErrorKind::Send, ErrorCode::SendFailed, EBADF, "socket closed");
        return false;
    }
    ssize_t n = ::sendto(fd_.get(), packet.data(), packet.size(), MSG_DONTWAIT, to.sockaddr_ptr(),
                         to.length());
    return check_send_result(n, packet.size(), errno, err);
}

RecvStatus IcmpSocket::receive(Bytes& out, Address& from, Error& err) {
    if (!fd_) {
        err = make_error(ErrorKind::Socket, ErrorCode::DescriptorInvalid, EBADF);
        return RecvStatus::Fatal;
    }
    out.resize(kRecvBufferSize);
    sockaddr_storage src{};
    socklen_t slen = sizeof(src);
    ssize_t n = ::recvfrom(fd_.get(), out.data(), out.size(), MSG_DONTWAIT,
                           reinterpret_cast<sockaddr*>(&src), &slen);
    if (n < 0) {
        int e = errno;
        out.clear();
        return classify_recv_errno(e, err);
    }
    out.resize(static_cast<size_t>(n));
    from = Address(reinterpret_cast<sockaddr*>(&src), slen);
    return RecvStatus::Datagram;
}

void IcmpSocket::close() { fd_.close(); }
}  // namespace sping
