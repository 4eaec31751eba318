#pragma once
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "../core/errors.hpp"
#include "../core/fd.hpp"
#include "address.hpp"
#include "packet_codec.hpp"

namespace sping {
enum class RecvStatus { Datagram, WouldBlock, Transient, Fatal };

// One socket bound to the family of the resolved address. Sends are
// non-blocking; readiness comes from the reactor, and receive() performs a
// single non-blocking read per call.
class ProbeSocket {
   public:
    virtual ~ProbeSocket() = default;
    virtual int fd() const = 0;
    virtual IcmpFamily family() const = 0;
    // Echo identifier as it appears on the wire. May differ from the one
    // requested at open when the kernel owns it.
    virtual uint16_t identifier() const = 0;
    // False with err set on failure; a short write is a PartialSend error.
    virtual bool send(const Bytes& packet, const Address& to, Error& err) = 0;
    virtual RecvStatus receive(Bytes& out, Address& from, Error& err) = 0;
    // Idempotent.
    virtual void close() = 0;
};

using SocketOpener =
    std::function<std::unique_ptr<ProbeSocket>(const Address& to, uint16_t identifier, Error& err)>;

// EPERM/EACCES from socket() or bind() mean missing privileges.
ErrorCode classify_open_errno(int sys_errno);

// recv errno -> WouldBlock (retry on next readiness), Fatal (descriptor
// unusable, err is DescriptorInvalid) or Transient (err is ReceiveFailed).
RecvStatus classify_recv_errno(int sys_errno, Error& err);

// Interprets a sendto() return value for a packet of `expected` bytes.
bool check_send_result(ssize_t sent, size_t expected, int sys_errno, Error& err);

// Linux implementation: SOCK_RAW/IPPROTO_ICMP for IPv4 (datagrams arrive with
// the IP header) and SOCK_DGRAM/IPPROTO_ICMPV6 for IPv6 (bare ICMPv6).
class IcmpSocket : public ProbeSocket {
   public:
    IcmpSocket(Fd fd, IcmpFamily family, uint16_t identifier);
    ~IcmpSocket() override;

    static std::unique_ptr<ProbeSocket> open(const Address& to, uint16_t identifier, Error& err);

    int fd() const override { return fd_.get(); }
    IcmpFamily family() const override { return family_; }
    uint16_t identifier() const override { return identifier_; }
    bool send(const Bytes& packet, const Address& to, Error& err) override;
    RecvStatus receive(Bytes& out, Address& from, Error& err) override;
    void close() override;

   private:
    Fd fd_;
    IcmpFamily family_;
    uint16_t identifier_;
};
}  // namespace sping
