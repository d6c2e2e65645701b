#include "HostInterface.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <memory>

namespace BACN::Net {

namespace {

std::string FormatIPv4(in_addr addr) {
    char buf[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
        return {};
    }
    return buf;
}

bool ParseIPv4(std::string_view text, in_addr& out) {
    const std::string copy(text);
    return inet_pton(AF_INET, copy.c_str(), &out) == 1;
}

struct IfAddrsDeleter {
    void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

} // namespace

bool IsValidIPv4(std::string_view text) {
    in_addr addr{};
    return ParseIPv4(text, addr);
}

Result<std::string> DeriveBroadcast(std::string_view address, std::string_view netmask) {
    in_addr addr{};
    in_addr mask{};
    if (!ParseIPv4(address, addr) || !ParseIPv4(netmask, mask)) {
        return BACN_ERROR_CONFIG("Malformed IPv4 address or netmask");
    }
    in_addr bcast{};
    bcast.s_addr = addr.s_addr | ~mask.s_addr;
    return FormatIPv4(bcast);
}

Result<InterfaceAddresses> PrimaryInterface() {
    ifaddrs* raw = nullptr;
    if (getifaddrs(&raw) != 0) {
        return BACN_ERROR_CONFIG("getifaddrs failed");
    }
    std::unique_ptr<ifaddrs, IfAddrsDeleter> list(raw);

    for (ifaddrs* it = list.get(); it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        InterfaceAddresses out;
        out.name = it->ifa_name != nullptr ? it->ifa_name : "";
        out.address = FormatIPv4(sin->sin_addr);

        if ((it->ifa_flags & IFF_BROADCAST) != 0 && it->ifa_broadaddr != nullptr) {
            const auto* bsin = reinterpret_cast<const sockaddr_in*>(it->ifa_broadaddr);
            out.broadcast = FormatIPv4(bsin->sin_addr);
        } else if (it->ifa_netmask != nullptr) {
            const auto* msin = reinterpret_cast<const sockaddr_in*>(it->ifa_netmask);
            in_addr bcast{};
            bcast.s_addr = sin->sin_addr.s_addr | ~msin->sin_addr.s_addr;
            out.broadcast = FormatIPv4(bcast);
        }

        if (out.address.empty() || out.broadcast.empty()) {
            continue;
        }
        BACN_LOG_DEBUG(Device, "Primary interface %s: %s bcast %s",
                       out.name, out.address, out.broadcast);
        return out;
    }
    return BACN_ERROR_CONFIG("No usable IPv4 interface found");
}

} // namespace BACN::Net
