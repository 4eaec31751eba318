#include <netdb.h>

#include <chrono>
#include <iostream>
#include <thread>

#include "../src/ping/resolver.hpp"
#include "test_support.hpp"

using namespace sping;
using namespace sping_test;

static std::vector<Address> candidates(std::initializer_list<const char*> texts) {
    std::vector<Address> out;
    for (const char* t : texts) {
        Address a;
        if (Address::from_numeric(t, a)) out.push_back(a);
    }
    return out;
}

static int test_style_from_flags() {
    if (address_style_from_flags(false, false) != AddressStyle::Any) return 1;
    if (address_style_from_flags(true, false) != AddressStyle::ForceIPv4) return 2;
    if (address_style_from_flags(false, true) != AddressStyle::ForceIPv6) return 3;
    if (address_style_from_flags(true, true) != AddressStyle::Any) return 4;
    return 0;
}

static int test_select_address() {
    Address out;
    Error err;
    auto mixed = candidates({"2001:db8::5", "198.51.100.7", "2001:db8::6"});
    if (!select_address(mixed, AddressStyle::Any, out, err) || out.to_string() != "2001:db8::5") return 1;
    if (!select_address(mixed, AddressStyle::ForceIPv4, out, err) || out.to_string() != "198.51.100.7")
        return 2;
    if (!select_address(mixed, AddressStyle::ForceIPv6, out, err) || out.to_string() != "2001:db8::5")
        return 3;

    auto v6 = candidates({"::1"});
    if (select_address(v6, AddressStyle::ForceIPv4, out, err)) return 4;
    if (err.kind != ErrorKind::Resolution || err.code != ErrorCode::NoMatchingFamily) return 5;
    if (err.category() != "resolution.no_matching_family") return 6;

    if (select_address({}, AddressStyle::Any, out, err) || err.code != ErrorCode::HostNotFound) return 7;
    return 0;
}

static int test_numeric_system_lookup() {
    // Numeric hosts never touch the network.
    std::vector<Address> out;
    if (system_lookup("127.0.0.1", out) != 0 || out.empty()) return 1;
    if (!out.front().is_v4() || out.front().to_string() != "127.0.0.1") return 2;
    out.clear();
    if (system_lookup("::1", out) != 0 || out.empty() || !out.front().is_v6()) return 3;
    return 0;
}

static int test_async_resolution() {
    Reactor r;
    Resolver res(r, fake_lookup);
    bool called = false;
    bool ok = false;
    Address got;
    Error err;
    auto cb = [&](bool success, const Address& a, const Error&) {
        called = true;
        ok = success;
        got = a;
    };
    if (!res.resolve("dual.test", AddressStyle::ForceIPv6, cb, err)) return 1;
    if (!res.busy()) return 2;
    if (!pump_until(r, [&] { return called; })) return 3;
    if (!ok || got.to_string() != "2001:db8::1") return 4;
    if (res.busy()) return 5;
    return 0;
}

static int test_async_failures() {
    Reactor r;
    Resolver res(r, fake_lookup);
    Error start_err;
    Error got;
    bool called = false;
    auto cb = [&](bool success, const Address&, const Error& e) {
        called = true;
        if (!success) got = e;
    };
    if (!res.resolve("nowhere.test", AddressStyle::Any, cb, start_err)) return 1;
    if (!pump_until(r, [&] { return called; })) return 2;
    if (got.code != ErrorCode::HostNotFound || got.sys_errno != EAI_NONAME) return 3;

    called = false;
    if (!res.resolve("v6only.test", AddressStyle::ForceIPv4, cb, start_err)) return 4;
    if (!pump_until(r, [&] { return called; })) return 5;
    if (got.code != ErrorCode::NoMatchingFamily) return 6;
    return 0;
}

static int test_cancel_discards_completion() {
    Reactor r;
    auto slow = [](const std::string& host, std::vector<Address>& out) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return fake_lookup(host, out);
    };
    Resolver res(r, slow);
    bool called = false;
    Error err;
    if (!res.resolve("dual.test", AddressStyle::Any, [&](bool, const Address&, const Error&) { called = true; },
                     err))
        return 1;
    res.cancel();
    if (res.busy()) return 2;
    pump_for(r, 200);
    return called ? 3 : 0;
}

int main() {
    struct {
        const char* name;
        int (*fn)();
    } tests[] = {
        {"style_from_flags", test_style_from_flags},
        {"select_address", test_select_address},
        {"numeric_system_lookup", test_numeric_system_lookup},
        {"async_resolution", test_async_resolution},
        {"async_failures", test_async_failures},
        {"cancel_discards_completion", test_cancel_discards_completion},
    };
    int failures = 0;
    for (const auto& t : tests) {
        int rc = t.fn();
        if (rc != 0) {
            std::cerr << "FAIL " << t.name << " (" << rc << ")\n";
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}
