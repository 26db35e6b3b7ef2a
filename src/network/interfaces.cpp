#include "lanbeam/network/interfaces.hpp"
#include "lanbeam/core/logger.hpp"
#include <boost/asio.hpp>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <algorithm>
#include <charconv>

namespace lanbeam::network {

namespace {

std::string to_dotted(const sockaddr* addr) {
    if (!addr || addr->sa_family != AF_INET) {
        return "";
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    auto* in = reinterpret_cast<const sockaddr_in*>(addr);
    if (!inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer))) {
        return "";
    }
    return buffer;
}

std::vector<NetworkInterfaceInfo> enumerate_ipv4() {
    std::vector<NetworkInterfaceInfo> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        LOG_WARN("getifaddrs failed; interface list unavailable");
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }

        NetworkInterfaceInfo info;
        info.name = ifa->ifa_name;
        info.ip = to_dotted(ifa->ifa_addr);

        if ((ifa->ifa_flags & IFF_BROADCAST) && ifa->ifa_broadaddr) {
            info.broadcast = to_dotted(ifa->ifa_broadaddr);
        } else if (ifa->ifa_netmask) {
            auto ip = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr;
            auto mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr;
            in_addr bcast{};
            bcast.s_addr = ip | ~mask;
            char buffer[INET_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET, &bcast, buffer, sizeof(buffer))) {
                info.broadcast = buffer;
            }
        }

        if (!info.ip.empty() && !info.broadcast.empty()) {
            result.push_back(std::move(info));
        }
    }

    freeifaddrs(ifaddr);
    return result;
}

}

std::optional<Endpoint> Endpoint::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    Endpoint endpoint;
    endpoint.ip = text.substr(0, colon);
    if (!is_valid_ipv4(endpoint.ip)) {
        return std::nullopt;
    }

    const char* first = text.data() + colon + 1;
    const char* last = text.data() + text.size();
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0 || port > 65535) {
        return std::nullopt;
    }
    endpoint.port = static_cast<std::uint16_t>(port);
    return endpoint;
}

std::string Endpoint::to_string() const {
    return ip + ":" + std::to_string(port);
}

bool is_valid_ipv4(const std::string& address) {
    in_addr parsed{};
    return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

std::vector<NetworkInterfaceInfo> list_interfaces() {
    auto interfaces = enumerate_ipv4();
    interfaces.push_back(NetworkInterfaceInfo{"All", "", ALL_INTERFACES_BROADCAST});
    return interfaces;
}

std::vector<std::string> interface_broadcast_addresses() {
    std::vector<std::string> addresses;
    for (const auto& info : enumerate_ipv4()) {
        if (std::find(addresses.begin(), addresses.end(), info.broadcast) == addresses.end()) {
            addresses.push_back(info.broadcast);
        }
    }
    if (addresses.empty()) {
        addresses.emplace_back(ALL_INTERFACES_BROADCAST);
    }
    return addresses;
}

std::string get_own_ip() {
    // Connecting a UDP socket sends nothing; it only selects the route.
    boost::asio::io_context io_context;
    boost::asio::ip::udp::socket socket(io_context);
    boost::system::error_code ec;

    socket.open(boost::asio::ip::udp::v4(), ec);
    if (!ec) {
        socket.connect(boost::asio::ip::udp::endpoint(
            boost::asio::ip::make_address_v4("8.8.8.8"), 53), ec);
    }
    if (!ec) {
        auto local = socket.local_endpoint(ec);
        if (!ec) {
            return local.address().to_string();
        }
    }

    auto interfaces = enumerate_ipv4();
    if (!interfaces.empty()) {
        return interfaces.front().ip;
    }

    LOG_DEBUG("No routable interface found: {}", ec.message());
    return "127.0.0.1";
}

}
