#include "connection_manager.h"
#include "config_manager.h"
#include "logger.h"
#include "tcp_socket.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::vector<uint16_t> ordered_unique_ports(std::initializer_list<uint16_t> first,
                                           const std::vector<uint16_t>& rest) {
    std::vector<uint16_t> ports;
    auto add = [&ports](uint16_t port) {
        if (port != 0 && std::find(ports.begin(), ports.end(), port) == ports.end()) {
            ports.push_back(port);
        }
    };
    for (uint16_t port : first) add(port);
    for (uint16_t port : rest) add(port);
    return ports;
}

bool is_retryable(ConnectError error) {
    return error == ConnectError::CONNECTION_REFUSED || error == ConnectError::CONNECT_TIMEOUT;
}

bool is_loopback(const std::string& address) {
    return address.rfind("127.", 0) == 0;
}

// "CONNECT:<name>" or "ACCEPTED:<name>" -> <name>
std::string handshake_name(const std::string& payload) {
    for (const char* marker : {HANDSHAKE_CONNECT, HANDSHAKE_ACCEPTED}) {
        const std::string prefix = std::string(marker) + ":";
        if (payload.rfind(prefix, 0) == 0) {
            return payload.substr(prefix.size());
        }
    }
    return "";
}

} // namespace

ConnectionManager::Settings ConnectionManager::Settings::fromConfig() {
    const ConfigManager& config = ConfigManager::getInstance();
    Settings settings;
    settings.display_name = config.getDisplayName();
    settings.primary_port = static_cast<uint16_t>(config.getTCPPort());
    settings.fallback_ports = config.getTCPFallbackPorts();
    settings.connect_timeout_ms = config.getTCPConnectTimeoutMs();
    settings.tcp_no_delay = config.isTCPNoDelayEnabled();
    settings.tcp_keepalive = config.isTCPKeepAliveEnabled();
    settings.listen_backlog = config.getListenBacklog();
    settings.heartbeat_interval_sec = config.getHeartbeatIntervalSec();
    settings.send_poll_interval_ms = config.getSendPollIntervalMs();
    return settings;
}

ConnectionManager::ConnectionManager(Settings settings, std::shared_ptr<EventThreadPool> pool,
                                     LocalAddressSet local_addresses)
    : m_settings(std::move(settings)),
      m_pool(std::move(pool)),
      m_connect_pool(std::max<size_t>(1, m_settings.connect_workers)),
      m_local(std::move(local_addresses)) {}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::setObserver(ConnectionObserver* observer) {
    m_observer = observer;
}

void ConnectionManager::setFileFrameHandler(FileFrameHandler* handler) {
    m_file_handler = handler;
}

// ============================================================================
// Outbound connections
// ============================================================================

ConnectResult ConnectionManager::connect(const std::string& peer_id, const std::string& address_hint,
                                         uint16_t port_hint) {
    if (m_stopped.load()) {
        return ConnectResult::failed(ConnectError::NOT_RUNNING, "connection manager stopped");
    }

    std::string address = address_hint;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_connect_cv.wait(lock, [this, &peer_id]() {
            return m_connecting.count(peer_id) == 0 || m_stopped.load();
        });
        if (m_stopped.load()) {
            return ConnectResult::failed(ConnectError::NOT_RUNNING, "connection manager stopped");
        }

        auto it = m_peers.find(peer_id);
        if (it != m_peers.end()) {
            if (it->second.connection) {
                LOG_INFO("CM: Already connected to " + peer_id);
                ConnectResult result = ConnectResult::connected(0, 0);
                result.already_connected = true;
                return result;
            }
            if (address.empty() && it->second.descriptor.network_address) {
                address = *it->second.descriptor.network_address;
            }
        }
        m_connecting.insert(peer_id);
    }

    // Releases the in-flight slot on every exit path.
    struct InFlight {
        ConnectionManager* manager;
        const std::string& peer_id;
        ~InFlight() {
            {
                std::lock_guard<std::mutex> lock(manager->m_mutex);
                manager->m_connecting.erase(peer_id);
            }
            manager->m_connect_cv.notify_all();
        }
    } in_flight{this, peer_id};

    auto fail = [this, &peer_id](ConnectError error, const std::string& reason, int attempts) {
        LOG_WARN("CM: Connect to " + peer_id + " failed [" + to_string(error) + "]: " + reason);
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peer_id);
        if (it != m_peers.end() && !it->second.connection) {
            it->second.descriptor.connection_state = ConnectionState::FAILED;
            it->second.descriptor.failure_reason = reason;
        }
        return ConnectResult::failed(error, reason, attempts);
    };

    if (address.empty()) {
        return fail(ConnectError::NO_ADDRESS, "no network address known for " + peer_id, 0);
    }
    // The self check and every dial below use the same resolved address.
    const std::string resolved = resolve_ipv4(address);
    if (resolved.empty()) {
        return fail(ConnectError::NO_ADDRESS, "cannot resolve " + address, 0);
    }
    if (m_local.contains(address) || m_local.contains(resolved)) {
        return fail(ConnectError::SELF_CONNECTION, address + " belongs to this device", 0);
    }
    address = resolved;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        PeerEntry& entry = m_peers[peer_id];
        if (entry.descriptor.peer_id.empty()) {
            entry.descriptor.peer_id = peer_id;
            entry.descriptor.display_name = peer_id;
        }
        if (!entry.descriptor.network_address) {
            entry.descriptor.network_address = address;
        }
        entry.descriptor.connection_state = ConnectionState::CONNECTING;
        entry.descriptor.failure_reason.clear();
    }

    const std::vector<uint16_t> ports =
        ordered_unique_ports({port_hint, m_settings.primary_port}, m_settings.fallback_ports);

    int attempts = 0;
    int fd = -1;
    uint16_t connected_port = 0;
    ConnectError last_error = ConnectError::NO_ADDRESS;
    std::string last_reason = "no candidate ports configured";

    for (uint16_t port : ports) {
        if (m_stopped.load()) {
            return fail(ConnectError::NOT_RUNNING, "connection manager stopped", attempts);
        }
        ++attempts;
        LOG_INFO("CM: Connecting to " + peer_id + " at " + address + ":" + std::to_string(port) +
                 " (attempt " + std::to_string(attempts) + "/" + std::to_string(ports.size()) + ")");
        TcpConnectOutcome outcome = tcp::connect_with_timeout(address, port, m_settings.connect_timeout_ms);
        if (outcome.fd >= 0) {
            fd = outcome.fd;
            connected_port = port;
            break;
        }
        last_error = outcome.error;
        last_reason = outcome.reason;
        LOG_DEBUG("CM: " + outcome.reason);
        if (!is_retryable(outcome.error)) {
            break;
        }
    }

    if (fd < 0) {
        return fail(last_error, last_reason, attempts);
    }

    tcp::configure_peer_socket(fd, m_settings.tcp_no_delay, m_settings.tcp_keepalive);
    auto connection = createCommunicator(peer_id, fd);
    connection->enqueue(MessageType::HANDSHAKE, std::string(HANDSHAKE_CONNECT) + ":" + m_settings.display_name);

    PeerDescriptor snapshot;
    bool stopped = false;
    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stopped = m_stopped.load();
        PeerEntry* entry = stopped ? nullptr : &m_peers[peer_id];
        superseded = entry && entry->connection;
        if (stopped || superseded) {
            m_retired.push_back(connection);
        } else {
            entry->connection = connection;
            entry->descriptor.connection_state = ConnectionState::CONNECTED;
            entry->descriptor.failure_reason.clear();
            snapshot = entry->descriptor;
        }
    }
    if (stopped) {
        connection->close("connection manager stopped");
        return ConnectResult::failed(ConnectError::NOT_RUNNING, "connection manager stopped", attempts);
    }
    if (superseded) {
        // At most one live connection per peer id.
        connection->close("duplicate connection");
        LOG_INFO("CM: " + peer_id + " was connected while dialing, dropping the new socket");
        ConnectResult result = ConnectResult::connected(connected_port, attempts);
        result.already_connected = true;
        return result;
    }

    connection->start();
    LOG_INFO("CM: Connected to " + peer_id + " on port " + std::to_string(connected_port) +
             " after " + std::to_string(attempts) + " attempt(s)");
    notifyConnected(withSelfFlag(snapshot));
    return ConnectResult::connected(connected_port, attempts);
}

bool ConnectionManager::connectAsync(const std::string& peer_id, const std::string& address_hint,
                                     uint16_t port_hint, std::function<void(const ConnectResult&)> done) {
    if (m_stopped.load()) {
        return false;
    }
    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    return m_connect_pool.submit(peer_id, [weak, peer_id, address_hint, port_hint, done]() {
        auto self = weak.lock();
        if (!self) return;
        ConnectResult result = self->connect(peer_id, address_hint, port_hint);
        if (done) {
            done(result);
        }
    });
}

void ConnectionManager::disconnect(const std::string& peer_id) {
    std::shared_ptr<PeerCommunicator> connection;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peer_id);
        if (it == m_peers.end() || !it->second.connection) {
            LOG_DEBUG("CM: disconnect(" + peer_id + ") - not connected");
            return;
        }
        connection = std::move(it->second.connection);
        if (it->second.descriptor.discovered) {
            it->second.descriptor.connection_state = ConnectionState::DISCONNECTED;
        } else {
            m_peers.erase(it);
        }
        m_retired.push_back(connection);
    }

    const std::string reason = "disconnected locally";
    connection->close(reason);
    notifyDisconnected(peer_id, reason);
}

std::shared_ptr<PeerCommunicator> ConnectionManager::createCommunicator(const std::string& peer_id, int fd) {
    PeerCommunicator::Settings settings;
    settings.local_display_name = m_settings.display_name;
    settings.send_poll_interval_ms = m_settings.send_poll_interval_ms;
    settings.max_line_bytes = m_settings.max_line_bytes;

    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    return std::make_shared<PeerCommunicator>(
        peer_id, fd, settings, m_pool,
        [weak](const std::string& id, const wire::Frame& frame) {
            if (auto self = weak.lock()) {
                self->handleFrame(id, frame);
            }
        },
        [weak](const std::shared_ptr<PeerCommunicator>& connection, const std::string& reason) {
            if (auto self = weak.lock()) {
                self->handleClosed(connection, reason);
            }
        });
}

// ============================================================================
// Connection events
// ============================================================================

void ConnectionManager::handleFrame(const std::string& peer_id, const wire::Frame& frame) {
    switch (frame.type) {
        case MessageType::HANDSHAKE: {
            const std::string name = handshake_name(frame.payload);
            if (!name.empty()) {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_peers.find(peer_id);
                if (it != m_peers.end()) {
                    it->second.descriptor.display_name = name;
                }
            }
            LOG_INFO("CM: Handshake from " + peer_id + ": " + frame.payload);
            if (frame.payload.rfind(HANDSHAKE_CONNECT, 0) == 0) {
                const std::string primary = m_local.primaryAddress();
                if (!primary.empty() && !is_loopback(primary)) {
                    sendTo(peer_id, MessageType::IP_BROADCAST, primary);
                }
            }
            break;
        }
        case MessageType::IP_BROADCAST:
            if (is_ipv4_address(frame.payload)) {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_peers.find(peer_id);
                if (it != m_peers.end()) {
                    it->second.descriptor.network_address = frame.payload;
                }
                LOG_INFO("CM: " + peer_id + " announced address " + frame.payload);
            } else {
                LOG_WARN("CM: Ignoring malformed address announcement from " + peer_id + ": " + frame.payload);
            }
            break;
        default:
            break;
    }

    if (is_file_message(frame.type) && m_file_handler) {
        m_file_handler->on_file_frame(peer_id, frame);
        return;
    }
    if (m_observer) {
        m_observer->on_message(peer_id, frame.type, frame.payload);
    }
}

void ConnectionManager::handleClosed(const std::shared_ptr<PeerCommunicator>& connection,
                                     const std::string& reason) {
    const std::string& peer_id = connection->peerId();
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peer_id);
        if (it != m_peers.end() && it->second.connection == connection) {
            it->second.connection.reset();
            if (it->second.descriptor.discovered) {
                it->second.descriptor.connection_state = ConnectionState::DISCONNECTED;
            } else {
                m_peers.erase(it);
            }
            m_retired.push_back(connection);
            removed = true;
        }
    }
    if (removed) {
        notifyDisconnected(peer_id, reason);
    }
}

void ConnectionManager::notifyConnected(const PeerDescriptor& peer) {
    if (!m_observer) return;
    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    if (!m_pool->submit(peer.peer_id, [weak, peer]() {
            if (auto self = weak.lock()) {
                self->m_observer->on_connected(peer);
            }
        })) {
        LOG_WARN("CM: Event pool stopped, connected event for " + peer.peer_id + " dropped");
    }
}

void ConnectionManager::notifyDisconnected(const std::string& peer_id, const std::string& reason) {
    LOG_INFO("CM: Disconnected from " + peer_id + " (" + reason + ")");
    if (!m_observer) return;
    ConnectionObserver* observer = m_observer;
    if (!m_pool->submit(peer_id, [observer, peer_id, reason]() {
            observer->on_disconnected(peer_id, reason);
        })) {
        LOG_WARN("CM: Event pool stopped, disconnected event for " + peer_id + " dropped");
    }
}

// ============================================================================
// Sending
// ============================================================================

size_t ConnectionManager::broadcastToAll(MessageType type, const std::string& payload) {
    std::vector<std::shared_ptr<PeerCommunicator>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_peers) {
            if (entry.second.connection) {
                targets.push_back(entry.second.connection);
            }
        }
    }

    size_t queued = 0;
    for (const auto& connection : targets) {
        if (connection->enqueue(type, payload)) {
            ++queued;
        } else {
            LOG_WARN("CM: Broadcast of " + std::string(to_string(type)) + " to " +
                     connection->peerId() + " failed: connection closed");
        }
    }
    return queued;
}

bool ConnectionManager::sendTo(const std::string& peer_id, MessageType type, const std::string& payload) {
    auto sender = getSender(peer_id);
    if (!sender) {
        LOG_WARN("CM: Cannot send " + std::string(to_string(type)) + ", " + peer_id + " is not connected");
        return false;
    }
    return sender->enqueue(type, payload);
}

std::shared_ptr<MessageSender> ConnectionManager::getSender(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peer_id);
    if (it == m_peers.end() || !it->second.connection) {
        return nullptr;
    }
    return it->second.connection;
}

// ============================================================================
// Registry
// ============================================================================

void ConnectionManager::registerDiscovered(const DiscoveryEvent& event) {
    if (event.peer_id.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(event.peer_id);
    if (it == m_peers.end()) {
        PeerEntry entry;
        entry.descriptor.peer_id = event.peer_id;
        entry.descriptor.display_name = event.display_name.empty() ? event.peer_id : event.display_name;
        entry.descriptor.network_address = event.network_address;
        entry.descriptor.signal_strength = event.signal_strength.value_or(UNKNOWN_SIGNAL_STRENGTH);
        entry.descriptor.discovered = true;
        m_peers.emplace(event.peer_id, std::move(entry));
        LOG_INFO("CM: Discovered " + event.peer_id + " (" + event.display_name + ")");
        return;
    }

    PeerDescriptor& peer = it->second.descriptor;
    peer.discovered = true;
    if (!event.display_name.empty()) {
        peer.display_name = event.display_name;
    }
    if (event.signal_strength) {
        peer.signal_strength = *event.signal_strength;
    }
    if (event.network_address && !event.network_address->empty()) {
        peer.network_address = event.network_address;
    }
}

std::vector<PeerDescriptor> ConnectionManager::listPeers() const {
    std::vector<PeerDescriptor> peers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        peers.reserve(m_peers.size());
        for (const auto& entry : m_peers) {
            peers.push_back(entry.second.descriptor);
        }
    }
    for (auto& peer : peers) {
        peer.is_self = isSelf(peer);
    }
    return peers;
}

std::optional<PeerDescriptor> ConnectionManager::getPeer(const std::string& peer_id) const {
    PeerDescriptor peer;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peer_id);
        if (it == m_peers.end()) {
            return std::nullopt;
        }
        peer = it->second.descriptor;
    }
    return withSelfFlag(std::move(peer));
}

bool ConnectionManager::isSelf(const PeerDescriptor& peer) const {
    return peer.network_address && m_local.contains(*peer.network_address);
}

PeerDescriptor ConnectionManager::withSelfFlag(PeerDescriptor peer) const {
    peer.is_self = isSelf(peer);
    return peer;
}

bool ConnectionManager::isConnected(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peer_id);
    return it != m_peers.end() && it->second.connection && !it->second.connection->isClosed();
}

size_t ConnectionManager::connectedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_peers.begin(), m_peers.end(), [](const auto& entry) {
        return entry.second.connection != nullptr;
    }));
}

// ============================================================================
// Listener
// ============================================================================

std::optional<uint16_t> ConnectionManager::listen() {
    return listen(m_settings.primary_port, m_settings.fallback_ports);
}

std::optional<uint16_t> ConnectionManager::listen(uint16_t preferred_port,
                                                  const std::vector<uint16_t>& fallback_ports) {
    if (m_stopped.load()) {
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        if (m_listener_alive.load()) {
            return m_server_port.load();
        }
        m_listen_candidates = ordered_unique_ports({preferred_port}, fallback_ports);
    }

    const bool bound = bindListener();
    ensureHeartbeatThread();
    if (!bound) {
        LOG_ERROR("CM: No listen port available; heartbeat will retry every " +
                  std::to_string(m_settings.heartbeat_interval_sec) + "s");
        return std::nullopt;
    }
    return m_server_port.load();
}

uint16_t ConnectionManager::getServerPort() const {
    return m_listener_alive.load() ? m_server_port.load() : 0;
}

bool ConnectionManager::bindListener() {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    if (m_stopped.load()) {
        return false;
    }
    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }
    if (m_server_fd >= 0) {
        tcp::close_socket(m_server_fd);
        m_server_fd = -1;
    }

    for (uint16_t port : m_listen_candidates) {
        std::string error;
        int fd = tcp::bind_listener(port, m_settings.listen_backlog, error);
        if (fd < 0) {
            LOG_WARN("CM: Listen on port " + std::to_string(port) + " failed: " + error);
            continue;
        }
        m_server_fd = fd;
        m_server_port = port;
        m_listener_alive = true;
        m_accept_thread = std::thread(&ConnectionManager::acceptLoop, this, fd);
        LOG_INFO("CM: Listening on port " + std::to_string(port));
        return true;
    }
    m_server_port = 0;
    return false;
}

void ConnectionManager::acceptLoop(int server_fd) {
    while (!m_stopped.load()) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(server_fd, &read_fds);
        timeval timeout = {TCP_SELECT_TIMEOUT_MS / 1000, (TCP_SELECT_TIMEOUT_MS % 1000) * 1000};

        int select_res = select(server_fd + 1, &read_fds, nullptr, nullptr, &timeout);
        if (select_res < 0) {
            if (errno == EINTR) continue;
            if (!m_stopped.load()) {
                LOG_ERROR("CM: select() failed in accept loop: " + std::string(strerror(errno)));
            }
            break;
        }
        if (select_res == 0) {
            continue;
        }

        int client_fd = accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (m_stopped.load()) break;
            const int err = errno;
            if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == ECONNABORTED ||
                err == EPROTO || err == EMFILE || err == ENFILE) {
                LOG_WARN("CM: accept() failed: " + std::string(strerror(err)));
                continue;
            }
            LOG_ERROR("CM: accept() failed permanently: " + std::string(strerror(err)));
            break;
        }
        acceptConnection(client_fd);
    }
    m_listener_alive = false;
    LOG_INFO("CM: Accept loop exited");
}

void ConnectionManager::acceptConnection(int client_fd) {
    const std::string remote_ip = tcp::remote_address(client_fd);
    const uint16_t remote_port = tcp::remote_port(client_fd);

    if (remote_ip.empty()) {
        LOG_WARN("CM: Dropping inbound connection with unknown remote address");
        tcp::close_socket(client_fd);
        return;
    }
    if (m_local.contains(remote_ip)) {
        LOG_WARN("CM: Rejecting inbound connection from local address " + remote_ip);
        tcp::close_socket(client_fd);
        return;
    }

    tcp::configure_peer_socket(client_fd, m_settings.tcp_no_delay, m_settings.tcp_keepalive);

    std::shared_ptr<PeerCommunicator> connection;
    PeerDescriptor snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped.load()) {
            tcp::close_socket(client_fd);
            return;
        }
        std::string peer_id = remote_ip;
        auto existing = m_peers.find(peer_id);
        // An id with a dial in flight is taken too; the dial will install its own connection.
        const bool taken = m_connecting.count(peer_id) != 0 ||
                           (existing != m_peers.end() &&
                            (existing->second.connection || existing->second.descriptor.discovered));
        if (taken) {
            peer_id = remote_ip + ":" + std::to_string(remote_port);
        }

        connection = createCommunicator(peer_id, client_fd);
        PeerEntry& entry = m_peers[peer_id];
        entry.descriptor.peer_id = peer_id;
        entry.descriptor.display_name = "Unknown";
        entry.descriptor.network_address = remote_ip;
        entry.descriptor.connection_state = ConnectionState::CONNECTED;
        entry.descriptor.discovered = false;
        entry.connection = connection;
        snapshot = entry.descriptor;
    }

    connection->start();
    LOG_INFO("CM: Accepted connection from " + remote_ip + ":" + std::to_string(remote_port) +
             " as " + snapshot.peer_id);
    notifyConnected(snapshot);
}

// ============================================================================
// Heartbeat / supervision
// ============================================================================

void ConnectionManager::ensureHeartbeatThread() {
    std::lock_guard<std::mutex> lock(m_heartbeat_mutex);
    if (!m_heartbeat_thread.joinable() && !m_stopped.load()) {
        m_heartbeat_thread = std::thread(&ConnectionManager::heartbeatLoop, this);
    }
}

void ConnectionManager::heartbeatLoop() {
    const auto interval = std::chrono::seconds(std::max(1, m_settings.heartbeat_interval_sec));

    while (!m_stopped.load()) {
        {
            std::unique_lock<std::mutex> lock(m_heartbeat_mutex);
            m_heartbeat_cv.wait_for(lock, interval, [this]() { return m_stopped.load(); });
        }
        if (m_stopped.load()) {
            break;
        }

        bool has_candidates = false;
        {
            std::lock_guard<std::mutex> lock(m_listener_mutex);
            has_candidates = !m_listen_candidates.empty();
        }
        if (has_candidates && !m_listener_alive.load()) {
            LOG_WARN("CM: Listener is down, restarting");
            if (!bindListener()) {
                LOG_ERROR("CM: Listener restart failed, retrying in " +
                          std::to_string(m_settings.heartbeat_interval_sec) + "s");
            }
        }

        broadcastToAll(MessageType::HEARTBEAT, "");

        std::vector<std::shared_ptr<PeerCommunicator>> retired;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            retired.swap(m_retired);
        }
        for (auto& connection : retired) {
            connection->waitStopped();
        }
    }
}

void ConnectionManager::stop() {
    if (m_stopped.exchange(true)) {
        return;
    }
    LOG_INFO("CM: Stopping connection manager");

    {
        std::lock_guard<std::mutex> lock(m_heartbeat_mutex);
    }
    m_heartbeat_cv.notify_all();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
    }
    m_connect_cv.notify_all();
    // Queued dials see m_stopped and return; one in flight ends after its current attempt.
    m_connect_pool.shutdown(true);

    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        if (m_server_fd >= 0) {
            tcp::shutdown_socket(m_server_fd);
        }
        if (m_accept_thread.joinable()) {
            m_accept_thread.join();
        }
        if (m_server_fd >= 0) {
            tcp::close_socket(m_server_fd);
            m_server_fd = -1;
        }
        m_listener_alive = false;
    }

    std::thread heartbeat;
    {
        std::lock_guard<std::mutex> lock(m_heartbeat_mutex);
        heartbeat = std::move(m_heartbeat_thread);
    }
    if (heartbeat.joinable()) {
        if (heartbeat.get_id() == std::this_thread::get_id()) {
            heartbeat.detach();
        } else {
            heartbeat.join();
        }
    }

    std::vector<std::pair<std::string, std::shared_ptr<PeerCommunicator>>> active;
    std::vector<std::shared_ptr<PeerCommunicator>> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_peers.begin(); it != m_peers.end();) {
            if (it->second.connection) {
                active.emplace_back(it->first, std::move(it->second.connection));
                if (!it->second.descriptor.discovered) {
                    it = m_peers.erase(it);
                    continue;
                }
                it->second.descriptor.connection_state = ConnectionState::DISCONNECTED;
            }
            ++it;
        }
        retired.swap(m_retired);
    }

    for (auto& entry : active) {
        entry.second->close("connection manager stopped");
        notifyDisconnected(entry.first, "connection manager stopped");
    }
    for (auto& entry : active) {
        entry.second->waitStopped();
    }
    for (auto& connection : retired) {
        connection->waitStopped();
    }
    LOG_INFO("CM: Connection manager stopped");
}
