#include "device_utils.h"
#include "logger.h"
#include <algorithm>
#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <random>
#include <cstring>
#include <cerrno>

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netdb.h>
#include <ifaddrs.h>
#include <net/if.h>

#if defined(__linux__)
#include <netpacket/packet.h>
#endif

namespace {

std::string generate_random_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    const char* hex = "0123456789abcdef";
    std::string id = "nearlink-random-";

    for (int i = 0; i < 12; i++) {
        id += hex[dis(gen)];
    }
    return id;
}

bool is_loopback_ipv4(const std::string& address) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return false;
    }
    const uint32_t host = ntohl(addr.s_addr);
    return (host & 0xFF000000u) == 0x7F000000u || host == 0;
}

// Resolves a host name to its IPv4 address; numeric addresses come back unchanged.
} // namespace

std::string get_persistent_device_id() {
    std::string mac_addr;

#if defined(__linux__)
    struct ifaddrs *ifaddr = nullptr, *ifa = nullptr;

    if (getifaddrs(&ifaddr) == -1) {
        return generate_random_id();
    }

    for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if ((ifa->ifa_flags & IFF_LOOPBACK) != 0) continue;
        if ((ifa->ifa_flags & (IFF_UP | IFF_RUNNING)) != (IFF_UP | IFF_RUNNING)) continue;

        if (ifa->ifa_addr->sa_family == AF_PACKET) {
            auto* sll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
            if (sll->sll_halen == 6) {
                std::stringstream ss;
                ss << std::hex << std::uppercase << std::setfill('0');
                for (int i = 0; i < 6; i++) {
                    if (i > 0) ss << ':';
                    ss << std::setw(2) << static_cast<int>(sll->sll_addr[i]);
                }
                mac_addr = ss.str();
                // Prefer wlan0 or eth0
                std::string name(ifa->ifa_name);
                if (name == "wlan0" || name == "eth0") {
                    break;
                }
            }
        }
    }

    freeifaddrs(ifaddr);
#endif

    if (!mac_addr.empty()) {
        return mac_addr;
    }

    return generate_random_id();
}

bool is_ipv4_address(const std::string& value) {
    if (value.empty() || value.size() > 15) {
        return false;
    }
    in_addr addr{};
    return inet_pton(AF_INET, value.c_str(), &addr) == 1;
}

std::string resolve_ipv4(const std::string& host) {
    if (is_ipv4_address(host)) {
        return host;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return {};
    }
    char buf[INET_ADDRSTRLEN] = {0};
    auto* sin = reinterpret_cast<sockaddr_in*>(result->ai_addr);
    inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    freeaddrinfo(result);
    return buf;
}

LocalAddressSet LocalAddressSet::fromInterfaces() {
    std::vector<std::string> addresses;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == 0 && ifaddr) {
        for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if ((ifa->ifa_flags & IFF_UP) == 0) {
                continue;
            }
            char buf[INET_ADDRSTRLEN] = {0};
            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr) {
                if (std::find(addresses.begin(), addresses.end(), buf) == addresses.end()) {
                    addresses.emplace_back(buf);
                }
            }
        }
        freeifaddrs(ifaddr);
    } else {
        LOG_WARN("LocalAddressSet: getifaddrs failed: " + std::string(strerror(errno)));
    }

    std::string summary;
    for (const auto& a : addresses) {
        summary += (summary.empty() ? "" : ", ") + a;
    }
    LOG_INFO("LocalAddressSet: Local addresses: [" + summary + "]");
    return LocalAddressSet(std::move(addresses), true);
}

LocalAddressSet::LocalAddressSet(std::vector<std::string> addresses, bool treat_loopback_as_local)
    : m_addresses(std::move(addresses)),
      m_treat_loopback_as_local(treat_loopback_as_local) {}

bool LocalAddressSet::contains(const std::string& address) const {
    if (address.empty()) {
        return false;
    }
    if (std::find(m_addresses.begin(), m_addresses.end(), address) != m_addresses.end()) {
        return true;
    }
    if (!m_treat_loopback_as_local) {
        return false;
    }
    if (address == "localhost") {
        return true;
    }
    const std::string resolved = resolve_ipv4(address);
    if (resolved.empty()) {
        return false;
    }
    if (is_loopback_ipv4(resolved)) {
        return true;
    }
    return std::find(m_addresses.begin(), m_addresses.end(), resolved) != m_addresses.end();
}

std::string LocalAddressSet::primaryAddress() const {
    for (const auto& address : m_addresses) {
        if (!is_loopback_ipv4(address)) {
            return address;
        }
    }
    return {};
}
