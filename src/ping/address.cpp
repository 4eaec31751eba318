#include "address.hpp"

#include <arpa/inet.h>
#include <netdb.h>

#include <cstring>

namespace sping {
Address::Address(const sockaddr* sa, socklen_t len) {
    if (sa == nullptr || len == 0 || len > sizeof(storage_)) return;
    if (sa->sa_family != AF_INET && sa->sa_family != AF_INET6) return;
    std::memcpy(&storage_, sa, len);
    len_ = len;
}

bool Address::from_numeric(const std::string& text, Address& out) {
    sockaddr_in v4{};
    if (::inet_pton(AF_INET, text.c_str(), &v4.sin_addr) == 1) {
        v4.sin_family = AF_INET;
        out = Address(reinterpret_cast<sockaddr*>(&v4), sizeof(v4));
        return true;
    }
    sockaddr_in6 v6{};
    if (::inet_pton(AF_INET6, text.c_str(), &v6.sin6_addr) == 1) {
        v6.sin6_family = AF_INET6;
        out = Address(reinterpret_cast<sockaddr*>(&v6), sizeof(v6));
        return true;
    }
    return false;
}

std::string Address::to_string() const {
    if (empty()) return "?";
    char host[NI_MAXHOST];
    if (::getnameinfo(sockaddr_ptr(), len_, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0) {
        return "?";
    }
    return host;
}

const char* Address::family_name() const {
    if (is_v4()) return "inet";
    if (is_v6()) return "inet6";
    return "unknown";
}
}  // namespace sping
