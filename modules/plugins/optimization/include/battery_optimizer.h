#ifndef BATTERY_OPTIMIZER_H
#define BATTERY_OPTIMIZER_H

#include <mutex>
#include <optional>
#include <string>

// Power-aware scan pacing.
// Target: scan freely on external power, back off as the battery drains.

struct PowerStatus {
    int level_percent = 100;        // 0-100
    bool charging = true;           // also true on machines without a battery
    bool power_save_mode = false;
};

class BatteryOptimizer {
public:
    struct Thresholds {
        int low_battery_percent = 20;
        int medium_battery_percent = 50;
    };

    BatteryOptimizer();
    explicit BatteryOptimizer(Thresholds thresholds);

    // Reads battery thresholds from ConfigManager.
    static Thresholds thresholds_from_config();

    void set_power_status(const PowerStatus& status);
    PowerStatus get_power_status() const;

    /**
     * Multiplier applied to the discovery interval:
     *   charging                      -> 0.8
     *   level <= low threshold        -> 2.0
     *   level <= medium threshold     -> 1.4
     *   otherwise                     -> 1.0
     */
    double scan_interval_factor() const;

    // Charging, above the medium threshold and not in power-save mode.
    bool is_in_optimal_state() const;

    const Thresholds& thresholds() const { return m_thresholds; }

    /**
     * Reads /sys/class/power_supply. Returns nullopt when no battery is found
     * (desktops), in which case callers keep the default "on mains" status.
     */
    static std::optional<PowerStatus> read_system_power_status(
        const std::string& power_supply_dir = "/sys/class/power_supply");

private:
    const Thresholds m_thresholds;
    mutable std::mutex m_mutex;
    PowerStatus m_status;
};

#endif // BATTERY_OPTIMIZER_H
