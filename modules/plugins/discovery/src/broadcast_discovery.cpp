#include "broadcast_discovery.h"
#include "constants.h"
#include "logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char* kRequestTag = "REQ";
constexpr const char* kResponseTag = "RSP";

std::vector<sockaddr_in> get_ipv4_broadcast_targets(uint16_t port) {
    std::vector<sockaddr_in> targets;

    auto add_target = [&](in_addr addr) {
        const uint32_t host = ntohl(addr.s_addr);
        if (host == 0) return;
        if ((host & 0xFF000000u) == 0x7F000000u) return; // 127.0.0.0/8

        for (const auto& existing : targets) {
            if (existing.sin_addr.s_addr == addr.s_addr) {
                return;
            }
        }

        sockaddr_in dst{};
        dst.sin_family = AF_INET;
        dst.sin_port = htons(port);
        dst.sin_addr = addr;
        targets.push_back(dst);
    };

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == 0 && ifaddr) {
        for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
            if ((ifa->ifa_flags & IFF_UP) == 0) continue;
            if ((ifa->ifa_flags & IFF_LOOPBACK) != 0) continue;
            if ((ifa->ifa_flags & IFF_BROADCAST) == 0) continue;

            if (ifa->ifa_broadaddr && ifa->ifa_broadaddr->sa_family == AF_INET) {
                add_target(reinterpret_cast<sockaddr_in*>(ifa->ifa_broadaddr)->sin_addr);
                continue;
            }

            // broadcast = (ip & mask) | ~mask
            if (ifa->ifa_netmask && ifa->ifa_netmask->sa_family == AF_INET) {
                const uint32_t ip_h = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
                const uint32_t mask_h = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
                in_addr bcast{};
                bcast.s_addr = htonl((ip_h & mask_h) | (~mask_h));
                add_target(bcast);
            }
        }
        freeifaddrs(ifaddr);
    }

    // Limited broadcast as a fallback.
    in_addr limited{};
    limited.s_addr = htonl(INADDR_BROADCAST);
    add_target(limited);

    return targets;
}

} // namespace

BroadcastDiscovery::BroadcastDiscovery(Settings settings, TcpPortProvider tcp_port)
    : m_settings(std::move(settings)), m_tcp_port(std::move(tcp_port)) {}

BroadcastDiscovery::~BroadcastDiscovery() {
    stop();
}

bool BroadcastDiscovery::start() {
    if (m_running.load()) {
        return true;
    }

    m_sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_sock < 0) {
        nativeLog("Discovery Error: Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    int broadcast = 1;
    int reuse = 1;
    setsockopt(m_sock, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast));
    setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(m_sock, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = INADDR_ANY;
    bind_addr.sin_port = htons(m_settings.port);
    if (bind(m_sock, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        nativeLog("Discovery Error: Failed to bind UDP port " + std::to_string(m_settings.port) + ": " +
                  std::string(strerror(errno)));
        close(m_sock);
        m_sock = -1;
        return false;
    }

    {
        // A cancel aimed at an earlier run must not cut the first scan short.
        std::lock_guard<std::mutex> lock(m_mutex);
        m_consumed_cancel = m_cancel_generation;
    }
    m_running = true;
    m_receive_thread = std::thread(&BroadcastDiscovery::receive_loop, this);
    nativeLog("Discovery: Listening for probes on UDP port " + std::to_string(m_settings.port));
    return true;
}

void BroadcastDiscovery::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    cancel_scan();

    if (m_sock >= 0) {
        shutdown(m_sock, SHUT_RDWR);
    }
    if (m_receive_thread.joinable()) {
        m_receive_thread.join();
    }
    if (m_sock >= 0) {
        close(m_sock);
        m_sock = -1;
    }
    nativeLog("Discovery services stopped.");
}

ScanOutcome BroadcastDiscovery::scan(std::chrono::milliseconds window) {
    ScanOutcome outcome;
    if (!m_running.load()) {
        outcome.ok = false;
        outcome.error = "discovery socket not open";
        return outcome;
    }

    std::lock_guard<std::mutex> scan_guard(m_scan_mutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancel_generation != m_consumed_cancel) {
            // cancel_scan() arrived before this scan started
            m_consumed_cancel = m_cancel_generation;
            LOG_DEBUG("Discovery: Scan cancelled before it started");
            return outcome;
        }
        m_results.clear();
        m_collecting = true;
    }

    const std::string probe = encode_request(m_settings.local_peer_id, m_settings.display_name);
    bool any_sent = false;
    for (const auto& dst : get_ipv4_broadcast_targets(m_settings.port)) {
        const ssize_t sent = sendto(m_sock, probe.data(), probe.size(), 0,
                                    reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
        if (sent >= 0) {
            any_sent = true;
        }
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (!any_sent) {
        m_collecting = false;
        outcome.ok = false;
        outcome.error = "failed to send probe on all interfaces: " + std::string(strerror(errno));
        return outcome;
    }

    m_cv.wait_for(lock, window, [this]() {
        return m_cancel_generation != m_consumed_cancel || !m_running.load();
    });
    m_consumed_cancel = m_cancel_generation;
    m_collecting = false;
    for (auto& entry : m_results) {
        outcome.events.push_back(std::move(entry.second));
    }
    m_results.clear();
    LOG_DEBUG("Discovery: Scan collected " + std::to_string(outcome.events.size()) + " repl(ies)");
    return outcome;
}

void BroadcastDiscovery::cancel_scan() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_cancel_generation;
    }
    m_cv.notify_all();
}

void BroadcastDiscovery::receive_loop() {
    char buf[DISCOVERY_MSG_MAX];
    while (m_running.load()) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(m_sock, &read_fds);
        timeval timeout = {1, 0};
        int ready = select(m_sock + 1, &read_fds, nullptr, nullptr, &timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            if (m_running.load()) {
                nativeLog("Discovery Error: select() failed: " + std::string(strerror(errno)));
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        sockaddr_in from_addr{};
        socklen_t from_len = sizeof(from_addr);
        ssize_t n = recvfrom(m_sock, buf, sizeof(buf) - 1, 0,
                             reinterpret_cast<sockaddr*>(&from_addr), &from_len);
        if (n <= 0) {
            if (!m_running.load()) break;
            continue;
        }

        char sender_ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from_addr.sin_addr, sender_ip, sizeof(sender_ip));
        handle_datagram(std::string(buf, static_cast<size_t>(n)), sender_ip, ntohs(from_addr.sin_port));
    }
}

void BroadcastDiscovery::handle_datagram(const std::string& datagram, const std::string& sender_ip,
                                         uint16_t sender_port) {
    std::optional<Message> message = parse_message(datagram);
    if (!message) {
        return;
    }
    // We hear our own broadcasts on most networks.
    if (message->peer_id == m_settings.local_peer_id) {
        return;
    }

    if (message->kind == MessageKind::REQUEST) {
        const uint16_t tcp_port = m_tcp_port ? m_tcp_port() : 0;
        const std::string reply = encode_response(m_settings.local_peer_id, m_settings.display_name, tcp_port);
        sockaddr_in dst{};
        dst.sin_family = AF_INET;
        dst.sin_port = htons(sender_port);
        if (inet_pton(AF_INET, sender_ip.c_str(), &dst.sin_addr) == 1) {
            if (sendto(m_sock, reply.data(), reply.size(), 0,
                       reinterpret_cast<const sockaddr*>(&dst), sizeof(dst)) < 0) {
                LOG_WARN("Discovery: Reply to " + sender_ip + " failed: " + std::string(strerror(errno)));
            }
        }
        LOG_DEBUG("Discovery: Answered probe from " + message->peer_id + " at " + sender_ip);
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_collecting) {
        return;
    }
    DiscoveryEvent event;
    event.peer_id = message->peer_id;
    event.display_name = message->name;
    event.network_address = sender_ip;
    event.tcp_port = message->tcp_port;
    m_results[event.peer_id] = event;
    nativeLog("Discovery: Found peer " + message->peer_id + " at " + sender_ip + ":" +
              std::to_string(message->tcp_port));
}

std::string BroadcastDiscovery::encode_request(const std::string& peer_id, const std::string& name) {
    return std::string(DISCOVERY_MESSAGE_PREFIX) + "|" + kRequestTag + "|" + peer_id + "|" + name;
}

std::string BroadcastDiscovery::encode_response(const std::string& peer_id, const std::string& name,
                                                uint16_t tcp_port) {
    return std::string(DISCOVERY_MESSAGE_PREFIX) + "|" + kResponseTag + "|" + peer_id + "|" + name + "|" +
           std::to_string(tcp_port);
}

std::optional<BroadcastDiscovery::Message> BroadcastDiscovery::parse_message(const std::string& datagram) {
    const std::string prefix = std::string(DISCOVERY_MESSAGE_PREFIX) + "|";
    if (datagram.rfind(prefix, 0) != 0) {
        return std::nullopt;
    }
    const std::string body = datagram.substr(prefix.size());

    const size_t tag_end = body.find('|');
    if (tag_end == std::string::npos) {
        return std::nullopt;
    }
    const std::string tag = body.substr(0, tag_end);
    const std::string rest = body.substr(tag_end + 1);

    const size_t id_end = rest.find('|');
    if (id_end == std::string::npos || id_end == 0) {
        return std::nullopt;
    }

    Message message;
    message.peer_id = rest.substr(0, id_end);

    if (tag == kRequestTag) {
        message.kind = MessageKind::REQUEST;
        message.name = rest.substr(id_end + 1);
        return message;
    }
    if (tag != kResponseTag) {
        return std::nullopt;
    }

    const size_t port_sep = rest.rfind('|');
    if (port_sep == id_end) {
        return std::nullopt;
    }
    const std::string port_text = rest.substr(port_sep + 1);
    unsigned port = 0;
    const auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (result.ec != std::errc() || result.ptr != port_text.data() + port_text.size() || port > 65535) {
        return std::nullopt;
    }
    message.kind = MessageKind::RESPONSE;
    message.name = rest.substr(id_end + 1, port_sep - id_end - 1);
    message.tcp_port = static_cast<uint16_t>(port);
    return message;
}
