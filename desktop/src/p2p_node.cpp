#include "p2p_node.h"
#include "adaptive_scan_scheduler.h"
#include "battery_optimizer.h"
#include "broadcast_discovery.h"
#include "config_manager.h"
#include "connection_manager.h"
#include "device_utils.h"
#include "event_thread_pool.h"
#include "file_storage_sink.h"
#include "file_transfer_manager.h"
#include "logger.h"
#include "notification_sink.h"
#include "prefix_validator.h"

#include <nlohmann/json.hpp>

P2PNode::P2PNode() = default;

P2PNode::~P2PNode() {
    if (running_) {
        stop();
    }
}

bool P2PNode::start(const Options& options) {
    if (running_) {
        nativeLog("ERROR: Node already running");
        return false;
    }

    nativeLog("Starting nearlink node...");
    const ConfigManager& config = ConfigManager::getInstance();

    peer_id_ = get_persistent_device_id();
    display_name_ = options.display_name.empty() ? config.getDisplayName() : options.display_name;
    auto_connect_ = config.isAutoConnectEnabled();
    continuous_when_optimal_ = config.isContinuousWhenOptimal();
    setSessionId(peer_id_);

    try {
        pool_ = std::make_shared<EventThreadPool>(static_cast<size_t>(config.getEventThreadPoolWorkers()));

        ConnectionManager::Settings cm_settings = ConnectionManager::Settings::fromConfig();
        cm_settings.display_name = display_name_;
        if (options.port > 0) {
            cm_settings.primary_port = static_cast<uint16_t>(options.port);
        }
        connection_manager_ = std::make_shared<ConnectionManager>(cm_settings, pool_,
                                                                  LocalAddressSet::fromInterfaces());

        notifier_ = std::make_shared<LogNotificationSink>();
        file_transfer_ = std::make_shared<FileTransferManager>(
            FileTransferManager::Settings::fromConfig(),
            std::make_shared<DirectoryFileSink>(config.getDownloadDir()),
            notifier_);

        connection_manager_->setObserver(this);
        connection_manager_->setFileFrameHandler(file_transfer_.get());

        if (!connection_manager_->listen()) {
            // The heartbeat keeps retrying; outbound connections still work.
            nativeLog("WARNING: No TCP port could be bound, continuing without a listener");
        }

        battery_ = std::make_shared<BatteryOptimizer>(BatteryOptimizer::thresholds_from_config());
        prefix_validator_ = std::make_unique<PrefixValidator>(PrefixValidator::fromConfig());

        if (options.discovery_enabled && config.isDiscoveryEnabled()) {
            BroadcastDiscovery::Settings ds;
            ds.port = static_cast<uint16_t>(config.getDiscoveryPort());
            ds.local_peer_id = peer_id_;
            ds.display_name = display_name_;
            std::weak_ptr<ConnectionManager> weak_manager = connection_manager_;
            discovery_ = std::make_shared<BroadcastDiscovery>(ds, [weak_manager]() -> uint16_t {
                auto manager = weak_manager.lock();
                return manager ? manager->getServerPort() : 0;
            });

            if (discovery_->start()) {
                scheduler_ = std::make_unique<AdaptiveScanScheduler>(
                    AdaptiveScanScheduler::Settings::fromConfig(), discovery_, battery_, notifier_);
                scheduler_->set_scan_callback([this](const std::vector<DiscoveryEvent>& events) {
                    handleDiscoveryEvents(events);
                });
                refreshPowerStatus();
                scheduler_->start();
            } else {
                nativeLog("WARNING: Discovery unavailable, peers must be connected by address");
                discovery_.reset();
            }
        } else {
            nativeLog("Discovery disabled");
        }
    } catch (const std::exception& e) {
        nativeLog("ERROR: Failed to start node: " + std::string(e.what()));
        running_ = true;
        stop();
        return false;
    }

    running_ = true;
    nativeLog("nearlink node started as " + display_name_ + " (" + peer_id_ + ")");
    return true;
}

void P2PNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    nativeLog("Stopping nearlink node...");

    if (scheduler_) {
        scheduler_->stop();
    }
    if (discovery_) {
        discovery_->stop();
    }
    if (connection_manager_) {
        connection_manager_->stop();
    }
    // Senders see closed connections and return promptly.
    joinFinishedTransfers(true);
    if (pool_) {
        pool_->shutdown(true);
    }

    nativeLog("Node stopped.");
}

uint16_t P2PNode::getServerPort() const {
    return connection_manager_ ? connection_manager_->getServerPort() : 0;
}

// ============================================================================
// Callbacks
// ============================================================================

void P2PNode::setPeerEventCallbacks(
    std::function<void(const std::string& peer_id)> on_discovered,
    std::function<void(const std::string& peer_id)> on_connected,
    std::function<void(const std::string& peer_id, const std::string& reason)> on_disconnected) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_peer_discovered_cb_ = std::move(on_discovered);
    on_peer_connected_cb_ = std::move(on_connected);
    on_peer_disconnected_cb_ = std::move(on_disconnected);
}

void P2PNode::setMessageEventCallback(
    std::function<void(const std::string& peer_id, MessageType type, const std::string& payload)> on_message) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_message_cb_ = std::move(on_message);
}

void P2PNode::setNotificationCallback(std::function<void(const std::string& message)> on_notification) {
    if (notifier_) {
        notifier_->setCallback(std::move(on_notification));
    }
}

void P2PNode::clearEventCallbacks() {
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        on_peer_discovered_cb_ = nullptr;
        on_peer_connected_cb_ = nullptr;
        on_peer_disconnected_cb_ = nullptr;
        on_message_cb_ = nullptr;
    }
    if (notifier_) {
        notifier_->setCallback(nullptr);
    }
}

void P2PNode::on_connected(const PeerDescriptor& peer) {
    notifier_->notify("Connected to " + peer.display_name + " (" + peer.peer_id + ")");

    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        cb = on_peer_connected_cb_;
    }
    if (cb) {
        cb(peer.peer_id);
    }
}

void P2PNode::on_disconnected(const std::string& peer_id, const std::string& reason) {
    const size_t dropped = file_transfer_->discardTransfers(peer_id);
    if (dropped > 0) {
        LOG_WARN("Dropped " + std::to_string(dropped) + " unfinished transfer(s) from " + peer_id);
    }
    notifier_->notify("Disconnected from " + peer_id + ": " + reason);

    std::function<void(const std::string&, const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        cb = on_peer_disconnected_cb_;
    }
    if (cb) {
        cb(peer_id, reason);
    }
}

void P2PNode::on_message(const std::string& peer_id, MessageType type, const std::string& payload) {
    switch (type) {
        case MessageType::TEXT:
            nativeLog("Message received from " + peer_id + ": " + payload);
            break;
        case MessageType::COMMAND:
            handleCommand(peer_id, payload);
            break;
        case MessageType::ERROR:
            LOG_WARN("Peer " + peer_id + " reported an error: " + payload);
            break;
        default:
            LOG_DEBUG("Frame " + std::string(to_string(type)) + " from " + peer_id + ": " + payload);
            break;
    }

    std::function<void(const std::string&, MessageType, const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        cb = on_message_cb_;
    }
    if (cb) {
        cb(peer_id, type, payload);
    }
}

// ============================================================================
// Commands from peers
// ============================================================================

void P2PNode::handleCommand(const std::string& peer_id, const std::string& payload) {
    const size_t colon = payload.find(':');
    const std::string command = payload.substr(0, colon);

    nativeLog("Command from " + peer_id + ": " + payload);
    if (command == commands::PING) {
        connection_manager_->sendTo(peer_id, MessageType::STATUS, commands::PONG);
    } else if (command == commands::GET_INFO) {
        connection_manager_->sendTo(peer_id, MessageType::STATUS, buildInfoPayload());
    } else if (command == commands::SHUTDOWN || command == commands::RESTART) {
        // Remote peers may not control the lifetime of this process.
        LOG_WARN("Ignoring " + command + " request from " + peer_id);
    }
}

std::string P2PNode::buildInfoPayload() const {
    nlohmann::json info;
    info["id"] = peer_id_;
    info["name"] = display_name_;
    info["port"] = getServerPort();
    info["connected_peers"] = connection_manager_->connectedCount();
    info["discovery"] = scheduler_ != nullptr;
    // dump() without indentation keeps the payload on one line.
    return info.dump();
}

// ============================================================================
// Discovery
// ============================================================================

void P2PNode::refreshPowerStatus() {
    if (auto status = BatteryOptimizer::read_system_power_status()) {
        battery_->set_power_status(*status);
    }
    if (scheduler_ && continuous_when_optimal_) {
        scheduler_->set_continuous_mode(scheduler_->is_in_optimal_state());
    }
}

void P2PNode::handleDiscoveryEvents(const std::vector<DiscoveryEvent>& events) {
    refreshPowerStatus();

    for (const auto& event : events) {
        if (!prefix_validator_->has_valid_prefix(event.display_name)) {
            LOG_DEBUG("Discovery: Ignoring " + event.display_name + " (no valid name prefix)");
            continue;
        }

        const bool known = connection_manager_->getPeer(event.peer_id).has_value();
        connection_manager_->registerDiscovered(event);

        if (!known) {
            std::function<void(const std::string&)> cb;
            {
                std::lock_guard<std::mutex> lock(callbacks_mutex_);
                cb = on_peer_discovered_cb_;
            }
            if (cb) {
                cb(event.peer_id);
            }
        }

        if (!auto_connect_ || !event.network_address || connection_manager_->isConnected(event.peer_id)) {
            continue;
        }

        const std::string peer_id = event.peer_id;
        connection_manager_->connectAsync(peer_id, *event.network_address, event.tcp_port,
                                          [peer_id](const ConnectResult& result) {
            if (!result.ok()) {
                LOG_INFO("Auto-connect to " + peer_id + " failed: " + result.reason);
            }
        });
    }
}

size_t P2PNode::scanNow() {
    if (!scheduler_) {
        nativeLog("ERROR: Discovery is not running");
        return 0;
    }
    return scheduler_->run_scan_cycle();
}

// ============================================================================
// Connections and messaging
// ============================================================================

bool P2PNode::connectToPeer(const std::string& peer_id, const std::string& ip, std::string* error) {
    if (!running_) {
        if (error) *error = "node not running";
        return false;
    }

    nativeLog("UI requested connection to " + peer_id);
    ConnectResult result = connection_manager_->connect(peer_id, ip);
    if (!result.ok()) {
        if (error) *error = std::string(to_string(result.error)) + ": " + result.reason;
        return false;
    }
    return true;
}

void P2PNode::disconnectPeer(const std::string& peer_id) {
    if (!running_) {
        return;
    }
    connection_manager_->disconnect(peer_id);
}

bool P2PNode::sendMessageToPeer(const std::string& peer_id, const std::string& message) {
    if (!running_) {
        nativeLog("ERROR: Cannot send message - node not running");
        return false;
    }
    return connection_manager_->sendTo(peer_id, MessageType::TEXT, message);
}

bool P2PNode::sendCommandToPeer(const std::string& peer_id, const std::string& command, const std::string& args) {
    if (!running_) {
        return false;
    }
    const std::string payload = args.empty() ? command : command + ":" + args;
    return connection_manager_->sendTo(peer_id, MessageType::COMMAND, payload);
}

size_t P2PNode::broadcastMessage(const std::string& message) {
    if (!running_) {
        return 0;
    }
    return connection_manager_->broadcastToAll(MessageType::TEXT, message);
}

bool P2PNode::sendFileToPeer(const std::string& peer_id, const std::string& path, std::string* error) {
    if (!running_) {
        if (error) *error = "node not running";
        return false;
    }
    std::shared_ptr<MessageSender> sender = connection_manager_->getSender(peer_id);
    if (!sender) {
        if (error) *error = "not connected to " + peer_id;
        return false;
    }

    joinFinishedTransfers(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<FileTransferManager> engine = file_transfer_;
    std::shared_ptr<LogNotificationSink> notifier = notifier_;
    std::thread worker([engine, notifier, sender, path, done]() {
        std::string send_error;
        if (!engine->sendFileFromPath(*sender, path, &send_error)) {
            notifier->notify("Failed to send " + path + " to " + sender->peerId() + ": " + send_error);
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(transfers_mutex_);
    outgoing_transfers_.push_back(OutgoingTransfer{std::move(worker), done});
    return true;
}

void P2PNode::joinFinishedTransfers(bool all) {
    std::vector<OutgoingTransfer> to_join;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        for (auto it = outgoing_transfers_.begin(); it != outgoing_transfers_.end();) {
            if (all || it->done->load()) {
                to_join.push_back(std::move(*it));
                it = outgoing_transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& transfer : to_join) {
        if (transfer.worker.joinable()) {
            transfer.worker.join();
        }
    }
}

std::vector<PeerDescriptor> P2PNode::getPeers() const {
    if (!connection_manager_) {
        return {};
    }
    return connection_manager_->listPeers();
}

std::vector<std::string> P2PNode::getStatusLines() const {
    std::vector<std::string> lines;
    lines.push_back("Node: " + display_name_ + " (" + peer_id_ + ")");
    lines.push_back("Running: " + std::string(running_ ? "yes" : "no"));
    if (!connection_manager_) {
        return lines;
    }

    const uint16_t port = getServerPort();
    lines.push_back("TCP port: " + (port ? std::to_string(port) : std::string("not listening")));
    lines.push_back("Connected peers: " + std::to_string(connection_manager_->connectedCount()));

    const TransferStats stats = file_transfer_->getStats();
    lines.push_back("Files: received " + std::to_string(stats.files_received) + " (" +
                    FileTransferManager::formatSize(stats.bytes_received) + "), sent " +
                    std::to_string(stats.files_sent) + " (" +
                    FileTransferManager::formatSize(stats.bytes_sent) + "), failed " +
                    std::to_string(stats.failed_transfers) + ", in progress " +
                    std::to_string(file_transfer_->activeTransferCount()));

    const PowerStatus power = battery_->get_power_status();
    lines.push_back("Power: " + std::to_string(power.level_percent) + "%" +
                    (power.charging ? " charging" : "") +
                    (power.power_save_mode ? " power-save" : ""));

    if (scheduler_) {
        lines.push_back("Discovery: " + std::string(to_string(scheduler_->state())) +
                        ", interval " + std::to_string(scheduler_->current_interval_ms() / 1000) + "s" +
                        (scheduler_->is_continuous_mode() ? " (continuous)" : "") +
                        ", scans " + std::to_string(scheduler_->total_scans()) +
                        ", success " + std::to_string(static_cast<int>(scheduler_->success_rate() * 100)) + "%");
    } else {
        lines.push_back("Discovery: off");
    }
    return lines;
}
