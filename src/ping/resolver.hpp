#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../core/fd.hpp"
#include "../core/reactor.hpp"
#include "address.hpp"

namespace sping {
enum class AddressStyle { Any, ForceIPv4, ForceIPv6 };

const char* address_style_name(AddressStyle style);

// A single explicit family wins; conflicting or absent flags mean Any.
AddressStyle address_style_from_flags(bool force_v4, bool force_v6);

// Blocking lookup returning 0 or a getaddrinfo error code.
using LookupFn = std::function<int(const std::string& host, std::vector<Address>& out)>;

int system_lookup(const std::string& host, std::vector<Address>& out);

// Any takes the first candidate; a forced style takes the first candidate of
// that family or fails with NoMatchingFamily.
bool select_address(const std::vector<Address>& candidates, AddressStyle style, Address& out,
                    Error& err);

// Resolves one host at a time without blocking the reactor. The lookup runs on
// a helper thread and completion is signalled through an eventfd; the callback
// always runs on the reactor thread. cancel() discards an in-flight lookup.
class Resolver {
   public:
    using Callback = std::function<void(bool ok, const Address& addr, const Error& err)>;

    explicit Resolver(Reactor& r, LookupFn lookup = system_lookup);
    ~Resolver();
    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    bool resolve(const std::string& host, AddressStyle style, const Callback& cb, Error& err);
    void cancel();
    bool busy() const { return static_cast<bool>(pending_); }

   private:
    struct Pending {
        Fd efd;
        std::mutex mu;
        bool done{false};
        int rc{0};
        std::vector<Address> results;
    };

    Reactor& reactor_;
    LookupFn lookup_;
    std::shared_ptr<Pending> pending_;
    std::string host_;
    AddressStyle style_{AddressStyle::Any};
    Callback cb_;

    void on_complete();
};
}  // namespace sping
