#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& content);

    // Overrides a single value, creating intermediate objects as needed.
    bool setValueAtPath(std::initializer_list<std::string> path, const json& value);

    // Device
    std::string getDisplayName() const;
    std::vector<std::string> getValidNamePrefixes() const;

    // Communication
    int getTCPPort() const;
    std::vector<uint16_t> getTCPFallbackPorts() const;
    int getTCPConnectTimeoutMs() const;
    bool isTCPNoDelayEnabled() const;
    bool isTCPKeepAliveEnabled() const;
    int getListenBacklog() const;

    // Peer management
    int getHeartbeatIntervalSec() const;
    int getSendPollIntervalMs() const;
    bool isAutoConnectEnabled() const;

    // File transfer
    int getFileChunkSize() const;
    int getFileChunkDelayMs() const;
    std::string getDownloadDir() const;

    // Discovery
    bool isDiscoveryEnabled() const;
    int getDiscoveryPort() const;
    int getScanWindowMs() const;
    int getMaxEmptyScanRetries() const;
    bool isContinuousWhenOptimal() const;
    int64_t getDefaultScanIntervalMs() const;
    int64_t getMinScanIntervalMs() const;
    int64_t getMaxScanIntervalMs() const;
    double getHighSuccessThreshold() const;
    double getLowSuccessThreshold() const;
    double getIntervalAdjustmentFactor() const;
    int getNightStartHour() const;
    int getNightEndHour() const;

    // Battery Optimizer
    int getLowBatteryThreshold() const;
    int getMediumBatteryThreshold() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Performance
    int getEventThreadPoolWorkers() const;

private:
    ConfigManager() = default;

    template <typename T>
    T valueAt(std::initializer_list<const char*> path, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
