#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::network {

// Broadcast address that selects "All" mode: announce on every interface.
constexpr const char* ALL_INTERFACES_BROADCAST = "255.255.255.255";

struct Endpoint {
    std::string ip;
    std::uint16_t port = 0;

    // "a.b.c.d:port"; nullopt when either part is malformed.
    static std::optional<Endpoint> parse(const std::string& text);
    std::string to_string() const;

    bool operator==(const Endpoint&) const = default;
};

struct NetworkInterfaceInfo {
    std::string name;
    std::string ip;
    std::string broadcast;
};

bool is_valid_ipv4(const std::string& address);

// Up, non-loopback IPv4 interfaces followed by an "All" entry whose
// broadcast address is ALL_INTERFACES_BROADCAST.
std::vector<NetworkInterfaceInfo> list_interfaces();

// Directed broadcast addresses of every up, non-loopback IPv4 interface.
// Falls back to ALL_INTERFACES_BROADCAST when none is found.
std::vector<std::string> interface_broadcast_addresses();

// Address of the interface the default route leaves through; "127.0.0.1"
// when the host has no route.
std::string get_own_ip();

}
