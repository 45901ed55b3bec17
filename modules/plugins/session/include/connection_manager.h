#ifndef CONNECTION_MANAGER_H
#define CONNECTION_MANAGER_H

#include "connection_observer.h"
#include "connection_types.h"
#include "constants.h"
#include "device_utils.h"
#include "event_thread_pool.h"
#include "peer.h"
#include "peer_communicator.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * Owns the peer registry and every live connection.
 *
 * The registry maps peer id to {descriptor, connection}; it is the only shared
 * mutable state and is guarded by one mutex. Connections report closure through
 * a callback and never remove themselves; the manager removes them with
 * pointer-checked "remove if present" so each teardown notifies exactly once.
 *
 * Create with std::make_shared. Pool tasks hold weak references to the manager.
 */
class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
public:
    struct Settings {
        std::string display_name = "DNC-Desktop";
        uint16_t primary_port = DEFAULT_SERVER_PORT;
        std::vector<uint16_t> fallback_ports;
        int connect_timeout_ms = TCP_CONNECT_TIMEOUT_MS;
        bool tcp_no_delay = true;
        bool tcp_keepalive = true;
        int listen_backlog = DEFAULT_LISTEN_BACKLOG;
        int heartbeat_interval_sec = LISTENER_HEARTBEAT_INTERVAL_SEC;
        int send_poll_interval_ms = SEND_POLL_INTERVAL_MS;
        size_t max_line_bytes = MAX_FRAME_LINE_BYTES;
        size_t connect_workers = 2;

        // Reads every value from ConfigManager.
        static Settings fromConfig();
    };

    ConnectionManager(Settings settings, std::shared_ptr<EventThreadPool> pool,
                      LocalAddressSet local_addresses);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Both must be set before any connection exists.
    void setObserver(ConnectionObserver* observer);
    void setFileFrameHandler(FileFrameHandler* handler);

    /**
     * Connects to a peer. An empty address_hint falls back to the registry's
     * known address. port_hint, when non-zero, is tried before the configured
     * primary and fallback ports. Concurrent calls for the same peer serialize.
     */
    ConnectResult connect(const std::string& peer_id, const std::string& address_hint,
                          uint16_t port_hint = 0);

    /**
     * Runs connect() on the manager's own connect workers, never on the event
     * pool, so a slow dial cannot hold up frame or observer dispatch. done, when
     * set, runs on the connect worker. Returns false once the manager is stopped.
     */
    bool connectAsync(const std::string& peer_id, const std::string& address_hint, uint16_t port_hint = 0,
                      std::function<void(const ConnectResult&)> done = nullptr);

    // Idempotent.
    void disconnect(const std::string& peer_id);

    /**
     * Binds the first free port of [preferred, fallbacks...] and starts the
     * accept loop. The heartbeat task keeps retrying on failure.
     */
    std::optional<uint16_t> listen(uint16_t preferred_port, const std::vector<uint16_t>& fallback_ports);
    std::optional<uint16_t> listen();

    // 0 when not listening.
    uint16_t getServerPort() const;

    // Best-effort; returns the number of connections the frame was queued on.
    size_t broadcastToAll(MessageType type, const std::string& payload);

    bool sendTo(const std::string& peer_id, MessageType type, const std::string& payload);
    std::shared_ptr<MessageSender> getSender(const std::string& peer_id) const;

    // Registry
    void registerDiscovered(const DiscoveryEvent& event);
    std::vector<PeerDescriptor> listPeers() const;
    std::optional<PeerDescriptor> getPeer(const std::string& peer_id) const;
    bool isSelf(const PeerDescriptor& peer) const;
    bool isConnected(const std::string& peer_id) const;
    size_t connectedCount() const;

    const LocalAddressSet& localAddresses() const { return m_local; }
    const Settings& settings() const { return m_settings; }

    // Closes the listener and all connections and joins every thread.
    void stop();

private:
    struct PeerEntry {
        PeerDescriptor descriptor;
        std::shared_ptr<PeerCommunicator> connection;
    };

    std::shared_ptr<PeerCommunicator> createCommunicator(const std::string& peer_id, int fd);
    void handleFrame(const std::string& peer_id, const wire::Frame& frame);
    void handleClosed(const std::shared_ptr<PeerCommunicator>& connection, const std::string& reason);
    void notifyConnected(const PeerDescriptor& peer);
    void notifyDisconnected(const std::string& peer_id, const std::string& reason);
    PeerDescriptor withSelfFlag(PeerDescriptor peer) const;

    bool bindListener();
    void acceptLoop(int server_fd);
    void acceptConnection(int client_fd);
    void heartbeatLoop();
    void ensureHeartbeatThread();

    const Settings m_settings;
    std::shared_ptr<EventThreadPool> m_pool;
    EventThreadPool m_connect_pool;
    const LocalAddressSet m_local;
    ConnectionObserver* m_observer = nullptr;
    FileFrameHandler* m_file_handler = nullptr;

    mutable std::mutex m_mutex;
    std::condition_variable m_connect_cv;
    std::map<std::string, PeerEntry> m_peers;
    std::set<std::string> m_connecting;
    std::vector<std::shared_ptr<PeerCommunicator>> m_retired;

    // Listener state, guarded by m_listener_mutex
    mutable std::mutex m_listener_mutex;
    std::vector<uint16_t> m_listen_candidates;
    int m_server_fd = -1;
    std::atomic<uint16_t> m_server_port{0};
    std::atomic<bool> m_listener_alive{false};
    std::thread m_accept_thread;

    std::mutex m_heartbeat_mutex;
    std::condition_variable m_heartbeat_cv;
    std::thread m_heartbeat_thread;

    std::atomic<bool> m_stopped{false};
};

#endif // CONNECTION_MANAGER_H
