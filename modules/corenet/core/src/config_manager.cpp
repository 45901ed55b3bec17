#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include <fstream>
#include <iterator>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_ERROR("Config: Failed to open config file: " + config_path);
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(config_file)), std::istreambuf_iterator<char>());
    if (!loadFromString(content)) {
        LOG_ERROR("Config: Failed to parse " + config_path);
        return false;
    }
    LOG_INFO("Config: Configuration loaded from " + config_path);
    return true;
}

bool ConfigManager::loadFromString(const std::string& content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: Top-level value must be an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR(std::string("Config: Parse error: ") + e.what());
        return false;
    }
}

bool ConfigManager::setValueAtPath(std::initializer_list<std::string> path, const json& value) {
    if (path.size() == 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (const auto& key : path) {
        if (!node->is_object()) {
            *node = json::object();
        }
        node = &(*node)[key];
    }
    *node = value;
    return true;
}

template <typename T>
T ConfigManager::valueAt(std::initializer_list<const char*> path, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = &m_config;
    for (const char* key : path) {
        if (!node->is_object()) {
            return fallback;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return fallback;
        }
        node = &(*it);
    }
    try {
        return node->get<T>();
    } catch (const json::exception& e) {
        LOG_WARN(std::string("Config: Wrong type for key, using default: ") + e.what());
        return fallback;
    }
}

std::string ConfigManager::getDisplayName() const {
    return valueAt<std::string>({"device", "display_name"}, "DNC-Desktop");
}

std::vector<std::string> ConfigManager::getValidNamePrefixes() const {
    return valueAt<std::vector<std::string>>({"device", "valid_name_prefixes"},
                                             {"DNC-", "Ive-", "IVT-", "DNCS-"});
}

int ConfigManager::getTCPPort() const {
    return valueAt<int>({"communication", "tcp", "port"}, DEFAULT_SERVER_PORT);
}

std::vector<uint16_t> ConfigManager::getTCPFallbackPorts() const {
    std::vector<uint16_t> defaults(std::begin(DEFAULT_FALLBACK_PORTS), std::end(DEFAULT_FALLBACK_PORTS));
    return valueAt<std::vector<uint16_t>>({"communication", "tcp", "fallback_ports"}, defaults);
}

int ConfigManager::getTCPConnectTimeoutMs() const {
    return valueAt<int>({"communication", "tcp", "connect_timeout_ms"}, TCP_CONNECT_TIMEOUT_MS);
}

bool ConfigManager::isTCPNoDelayEnabled() const {
    return valueAt<bool>({"communication", "tcp", "no_delay"}, true);
}

bool ConfigManager::isTCPKeepAliveEnabled() const {
    return valueAt<bool>({"communication", "tcp", "keepalive"}, true);
}

int ConfigManager::getListenBacklog() const {
    return valueAt<int>({"communication", "tcp", "listen_backlog"}, DEFAULT_LISTEN_BACKLOG);
}

int ConfigManager::getHeartbeatIntervalSec() const {
    return valueAt<int>({"peer_management", "heartbeat_interval_sec"}, LISTENER_HEARTBEAT_INTERVAL_SEC);
}

int ConfigManager::getSendPollIntervalMs() const {
    return valueAt<int>({"peer_management", "send_poll_interval_ms"}, SEND_POLL_INTERVAL_MS);
}

bool ConfigManager::isAutoConnectEnabled() const {
    return valueAt<bool>({"peer_management", "auto_connect"}, true);
}

int ConfigManager::getFileChunkSize() const {
    return valueAt<int>({"file_transfer", "chunk_size"}, static_cast<int>(DEFAULT_FILE_CHUNK_SIZE));
}

int ConfigManager::getFileChunkDelayMs() const {
    return valueAt<int>({"file_transfer", "chunk_delay_ms"}, DEFAULT_FILE_CHUNK_DELAY_MS);
}

std::string ConfigManager::getDownloadDir() const {
    return valueAt<std::string>({"file_transfer", "download_dir"}, "DNCTransfers");
}

bool ConfigManager::isDiscoveryEnabled() const {
    return valueAt<bool>({"discovery", "enabled"}, true);
}

int ConfigManager::getDiscoveryPort() const {
    return valueAt<int>({"discovery", "port"}, DISCOVERY_PORT);
}

int ConfigManager::getScanWindowMs() const {
    return valueAt<int>({"discovery", "scan_window_ms"}, DEFAULT_SCAN_WINDOW_MS);
}

int ConfigManager::getMaxEmptyScanRetries() const {
    return valueAt<int>({"discovery", "max_empty_retries"}, DEFAULT_MAX_EMPTY_SCAN_RETRIES);
}

bool ConfigManager::isContinuousWhenOptimal() const {
    return valueAt<bool>({"discovery", "continuous_when_optimal"}, false);
}

int64_t ConfigManager::getDefaultScanIntervalMs() const {
    return valueAt<int64_t>({"discovery", "adaptive", "default_interval_ms"}, 120000);
}

int64_t ConfigManager::getMinScanIntervalMs() const {
    return valueAt<int64_t>({"discovery", "adaptive", "min_interval_ms"}, 30000);
}

int64_t ConfigManager::getMaxScanIntervalMs() const {
    return valueAt<int64_t>({"discovery", "adaptive", "max_interval_ms"}, 900000);
}

double ConfigManager::getHighSuccessThreshold() const {
    return valueAt<double>({"discovery", "adaptive", "high_success_threshold"}, 0.7);
}

double ConfigManager::getLowSuccessThreshold() const {
    return valueAt<double>({"discovery", "adaptive", "low_success_threshold"}, 0.2);
}

double ConfigManager::getIntervalAdjustmentFactor() const {
    return valueAt<double>({"discovery", "adaptive", "adjustment_factor"}, 0.15);
}

int ConfigManager::getNightStartHour() const {
    return valueAt<int>({"discovery", "adaptive", "night_start_hour"}, 23);
}

int ConfigManager::getNightEndHour() const {
    return valueAt<int>({"discovery", "adaptive", "night_end_hour"}, 6);
}

int ConfigManager::getLowBatteryThreshold() const {
    return valueAt<int>({"battery_optimizer", "low_battery_threshold"}, 20);
}

int ConfigManager::getMediumBatteryThreshold() const {
    return valueAt<int>({"battery_optimizer", "medium_battery_threshold"}, 50);
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>({"logging", "level"}, "info");
}

bool ConfigManager::isAsyncLogging() const {
    return valueAt<bool>({"logging", "async"}, false);
}

int ConfigManager::getEventThreadPoolWorkers() const {
    return valueAt<int>({"performance", "event_thread_pool_workers"}, 4);
}
