#pragma once

#include "connection_observer.h"
#include "peer.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class AdaptiveScanScheduler;
class BatteryOptimizer;
class BroadcastDiscovery;
class ConnectionManager;
class EventThreadPool;
class FileTransferManager;
class LogNotificationSink;
class PrefixValidator;

/**
 * @brief Desktop node - wires every module together.
 *
 * Owns the worker pool, the connection manager, the file transfer engine,
 * the battery optimizer, LAN discovery and its adaptive scheduler.
 * Discovery results pass the name-prefix filter, land in the peer registry
 * and, with auto-connect, are connected on the pool.
 *
 * Callbacks may be invoked from pool threads.
 */
class P2PNode : public ConnectionObserver {
public:
    struct Options {
        std::string display_name;       // empty: config value
        int port = 0;                   // 0: config value
        bool discovery_enabled = true;
    };

    P2PNode();
    ~P2PNode() override;

    P2PNode(const P2PNode&) = delete;
    P2PNode& operator=(const P2PNode&) = delete;

    // Reads ConfigManager, binds the listener and starts discovery.
    bool start(const Options& options);
    void stop();

    bool isRunning() const { return running_; }
    const std::string& getPeerId() const { return peer_id_; }
    std::string getDisplayName() const { return display_name_; }
    uint16_t getServerPort() const;

    // Connection
    bool connectToPeer(const std::string& peer_id, const std::string& ip = "", std::string* error = nullptr);
    void disconnectPeer(const std::string& peer_id);

    // Messaging
    bool sendMessageToPeer(const std::string& peer_id, const std::string& message);
    bool sendCommandToPeer(const std::string& peer_id, const std::string& command, const std::string& args);
    size_t broadcastMessage(const std::string& message);

    // Runs in the background; completion is reported through the notification callback.
    bool sendFileToPeer(const std::string& peer_id, const std::string& path, std::string* error = nullptr);

    // Runs one scan cycle outside the scheduler's timing. Returns the device count.
    size_t scanNow();

    std::vector<PeerDescriptor> getPeers() const;

    // Multi-line summary for the status command.
    std::vector<std::string> getStatusLines() const;

    // Desktop UI integration (optional)
    void setPeerEventCallbacks(
        std::function<void(const std::string& peer_id)> on_discovered,
        std::function<void(const std::string& peer_id)> on_connected,
        std::function<void(const std::string& peer_id, const std::string& reason)> on_disconnected);

    void setMessageEventCallback(
        std::function<void(const std::string& peer_id, MessageType type, const std::string& payload)> on_message);

    void setNotificationCallback(std::function<void(const std::string& message)> on_notification);

    void clearEventCallbacks();

    // ConnectionObserver
    void on_connected(const PeerDescriptor& peer) override;
    void on_disconnected(const std::string& peer_id, const std::string& reason) override;
    void on_message(const std::string& peer_id, MessageType type, const std::string& payload) override;

private:
    void handleDiscoveryEvents(const std::vector<DiscoveryEvent>& events);
    void handleCommand(const std::string& peer_id, const std::string& payload);
    void refreshPowerStatus();
    std::string buildInfoPayload() const;
    void joinFinishedTransfers(bool all);

    std::atomic<bool> running_{false};
    std::string peer_id_;
    std::string display_name_;
    bool auto_connect_ = true;
    bool continuous_when_optimal_ = false;

    std::shared_ptr<EventThreadPool> pool_;
    std::shared_ptr<ConnectionManager> connection_manager_;
    std::shared_ptr<LogNotificationSink> notifier_;
    std::shared_ptr<FileTransferManager> file_transfer_;
    std::shared_ptr<BatteryOptimizer> battery_;
    std::shared_ptr<BroadcastDiscovery> discovery_;
    std::unique_ptr<AdaptiveScanScheduler> scheduler_;
    std::unique_ptr<PrefixValidator> prefix_validator_;

    struct OutgoingTransfer {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex transfers_mutex_;
    std::vector<OutgoingTransfer> outgoing_transfers_;

    // Callbacks for desktop UI (protected by callbacks_mutex_)
    mutable std::mutex callbacks_mutex_;
    std::function<void(const std::string&)> on_peer_discovered_cb_;
    std::function<void(const std::string&)> on_peer_connected_cb_;
    std::function<void(const std::string&, const std::string&)> on_peer_disconnected_cb_;
    std::function<void(const std::string&, MessageType, const std::string&)> on_message_cb_;
};
