#ifndef BROADCAST_DISCOVERY_H
#define BROADCAST_DISCOVERY_H

#include "discovery.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

/**
 * LAN discovery over UDP broadcast.
 *
 * Probe:  NEARLINK_DISCOVERY|REQ|<peer_id>|<name>
 * Reply:  NEARLINK_DISCOVERY|RSP|<peer_id>|<name>|<tcp_port>
 *
 * Every running instance answers probes on the discovery port. scan() sends a
 * probe to each interface broadcast address and collects replies for the
 * scan window. The sender IP of a reply becomes the peer's network address.
 */
class BroadcastDiscovery : public DiscoverySource {
public:
    struct Settings {
        uint16_t port = 30000;
        std::string local_peer_id;
        std::string display_name;
    };

    enum class MessageKind {
        REQUEST,
        RESPONSE
    };

    struct Message {
        MessageKind kind = MessageKind::REQUEST;
        std::string peer_id;
        std::string name;
        uint16_t tcp_port = 0;
    };

    // Supplies the port our TCP listener is bound to (0 when not listening).
    using TcpPortProvider = std::function<uint16_t()>;

    BroadcastDiscovery(Settings settings, TcpPortProvider tcp_port);
    ~BroadcastDiscovery() override;

    // Binds the discovery socket and starts answering probes.
    bool start();
    void stop();
    bool is_running() const { return m_running.load(); }

    ScanOutcome scan(std::chrono::milliseconds window) override;
    void cancel_scan() override;
    std::string name() const override { return "lan-broadcast"; }

    static std::string encode_request(const std::string& peer_id, const std::string& name);
    static std::string encode_response(const std::string& peer_id, const std::string& name, uint16_t tcp_port);
    static std::optional<Message> parse_message(const std::string& datagram);

private:
    void receive_loop();
    void handle_datagram(const std::string& datagram, const std::string& sender_ip,
                         uint16_t sender_port);

    const Settings m_settings;
    TcpPortProvider m_tcp_port;

    int m_sock = -1;
    std::atomic<bool> m_running{false};
    std::thread m_receive_thread;

    std::mutex m_scan_mutex;            // one scan at a time
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_collecting = false;
    // cancel_scan() bumps the generation; a scan consumes every bump up to
    // its end, so a cancel issued between scans stops the next one.
    uint64_t m_cancel_generation = 0;
    uint64_t m_consumed_cancel = 0;
    std::map<std::string, DiscoveryEvent> m_results;
};

#endif // BROADCAST_DISCOVERY_H
