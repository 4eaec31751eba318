#pragma once
#include <netinet/in.h>
#include <sys/socket.h>

#include <string>

namespace sping {
// Family-tagged socket endpoint (AF_INET or AF_INET6).
class Address {
   public:
    Address() = default;
    Address(const sockaddr* sa, socklen_t len);

    static bool from_numeric(const std::string& text, Address& out);

    int family() const { return storage_.ss_family; }
    bool is_v4() const { return family() == AF_INET; }
    bool is_v6() const { return family() == AF_INET6; }
    bool empty() const { return len_ == 0; }

    const sockaddr* sockaddr_ptr() const { return reinterpret_cast<const sockaddr*>(&storage_); }
    socklen_t length() const { return len_; }

    // Numeric host form, e.g. "192.0.2.1" or "2001:db8::1"; "?" when empty.
    std::string to_string() const;
    const char* family_name() const;

   private:
    sockaddr_storage storage_{};
    socklen_t len_{0};
};
}  // namespace sping
