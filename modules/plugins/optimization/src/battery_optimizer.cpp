#include "battery_optimizer.h"
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace {

bool read_first_line(const std::filesystem::path& path, std::string& line) {
    std::ifstream in(path);
    if (!in) return false;
    std::getline(in, line);
    return !line.empty();
}

} // namespace

BatteryOptimizer::BatteryOptimizer()
    : BatteryOptimizer(Thresholds()) {}

BatteryOptimizer::BatteryOptimizer(Thresholds thresholds)
    : m_thresholds(thresholds) {
    LOG_DEBUG("BatteryOptimizer: low=" + std::to_string(m_thresholds.low_battery_percent) +
              "% medium=" + std::to_string(m_thresholds.medium_battery_percent) + "%");
}

BatteryOptimizer::Thresholds BatteryOptimizer::thresholds_from_config() {
    const ConfigManager& config = ConfigManager::getInstance();
    Thresholds thresholds;
    thresholds.low_battery_percent = config.getLowBatteryThreshold();
    thresholds.medium_battery_percent = config.getMediumBatteryThreshold();
    return thresholds;
}

void BatteryOptimizer::set_power_status(const PowerStatus& status) {
    PowerStatus clamped = status;
    clamped.level_percent = std::clamp(status.level_percent, 0, 100);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (clamped.charging != m_status.charging || clamped.power_save_mode != m_status.power_save_mode) {
        nativeLog("BatteryOptimizer: " + std::string(clamped.charging ? "charging" : "on battery") +
                  ", level " + std::to_string(clamped.level_percent) + "%" +
                  (clamped.power_save_mode ? ", power save" : ""));
    }
    m_status = clamped;
}

PowerStatus BatteryOptimizer::get_power_status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

double BatteryOptimizer::scan_interval_factor() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status.charging) {
        return 0.8;
    }
    if (m_status.level_percent <= m_thresholds.low_battery_percent) {
        return 2.0;
    }
    if (m_status.level_percent <= m_thresholds.medium_battery_percent) {
        return 1.4;
    }
    return 1.0;
}

bool BatteryOptimizer::is_in_optimal_state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status.charging &&
           m_status.level_percent > m_thresholds.medium_battery_percent &&
           !m_status.power_save_mode;
}

std::optional<PowerStatus> BatteryOptimizer::read_system_power_status(const std::string& power_supply_dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(power_supply_dir, ec)) {
        return std::nullopt;
    }

    for (const auto& entry : fs::directory_iterator(power_supply_dir, ec)) {
        std::string type;
        if (!read_first_line(entry.path() / "type", type) || type != "Battery") {
            continue;
        }

        PowerStatus status;
        std::string capacity;
        if (read_first_line(entry.path() / "capacity", capacity)) {
            try {
                status.level_percent = std::clamp(std::stoi(capacity), 0, 100);
            } catch (const std::exception&) {
                LOG_WARN("BatteryOptimizer: Unreadable capacity '" + capacity + "' in " + entry.path().string());
            }
        }
        std::string state;
        if (read_first_line(entry.path() / "status", state)) {
            status.charging = (state == "Charging" || state == "Full" || state == "Not charging");
        }
        return status;
    }
    return std::nullopt;
}
