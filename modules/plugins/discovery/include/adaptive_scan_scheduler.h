#ifndef ADAPTIVE_SCAN_SCHEDULER_H
#define ADAPTIVE_SCAN_SCHEDULER_H

#include "battery_optimizer.h"
#include "discovery.h"
#include "notification_sink.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * Duty-cycles a DiscoverySource.
 *
 * Loop: one scan cycle, then sleep for the recomputed interval. After each
 * cycle the interval is scaled, in order, by success rate, battery state,
 * network density and time of day, then clamped to [min, max]. The sleep is
 * the only suspension point and stop() always interrupts it.
 */
class AdaptiveScanScheduler {
public:
    struct Settings {
        int64_t default_interval_ms = 120000;
        int64_t min_interval_ms = 30000;
        int64_t max_interval_ms = 900000;
        double high_success_threshold = 0.7;
        double low_success_threshold = 0.2;
        double adjustment_factor = 0.15;
        int night_start_hour = 23;              // inclusive
        int night_end_hour = 6;                 // exclusive
        int max_empty_retries = 3;
        int64_t retry_delay_ms = 1000;
        std::chrono::milliseconds scan_window{3000};
        int64_t notify_change_threshold_ms = 30000;

        static Settings fromConfig();
    };

    enum class State {
        IDLE,
        SCANNING
    };

    using HourProvider = std::function<int()>;
    using ScanCallback = std::function<void(const std::vector<DiscoveryEvent>& events)>;

    AdaptiveScanScheduler(Settings settings,
                          std::shared_ptr<DiscoverySource> source,
                          std::shared_ptr<BatteryOptimizer> battery,
                          std::shared_ptr<NotificationSink> notifier = nullptr);
    ~AdaptiveScanScheduler();

    AdaptiveScanScheduler(const AdaptiveScanScheduler&) = delete;
    AdaptiveScanScheduler& operator=(const AdaptiveScanScheduler&) = delete;

    // Local hour of day (0-23). Defaults to the system clock.
    void set_hour_provider(HourProvider provider);
    // Receives the events of every scan that found something.
    void set_scan_callback(ScanCallback callback);

    // Idle -> Scanning. Returns false when already scanning.
    bool start();
    // Scanning -> Idle. Cancels an in-flight scan and wakes the sleep.
    void stop();
    State state() const;

    // Pins the interval to the minimum (used when power is plentiful).
    void set_continuous_mode(bool enabled);
    bool is_continuous_mode() const;

    // Must be called once per completed scan.
    void record_scan_result(size_t device_count);

    // Applies the adjustment chain to the current interval and stores the result.
    int64_t compute_next_interval();

    // Scans until something is found or the retry budget is spent. Every scan
    // is recorded. Returns the device count of the last scan.
    size_t run_scan_cycle();

    bool is_in_optimal_state() const;

    int64_t current_interval_ms() const;
    double success_rate() const;
    double density_score() const;
    uint64_t total_scans() const;
    uint64_t successful_scans() const;
    size_t last_device_count() const;

    // Clears statistics and restores the default interval.
    void reset();

private:
    void scan_loop();
    size_t scan_cycle(bool interruptible);
    bool is_night(int hour) const;
    bool wait_for(int64_t ms);
    void notify(const std::string& message);

    const Settings m_settings;
    std::shared_ptr<DiscoverySource> m_source;
    std::shared_ptr<BatteryOptimizer> m_battery;
    std::shared_ptr<NotificationSink> m_notifier;

    mutable std::mutex m_mutex;
    HourProvider m_hour_provider;
    ScanCallback m_scan_callback;
    int64_t m_current_interval_ms;
    uint64_t m_total_scans = 0;
    uint64_t m_successful_scans = 0;
    size_t m_last_device_count = 0;
    double m_density_score = 1.0;
    bool m_continuous = false;

    std::atomic<bool> m_running{false};
    std::mutex m_wait_mutex;
    std::condition_variable m_wait_cv;
    std::thread m_thread;
};

const char* to_string(AdaptiveScanScheduler::State state);

#endif // ADAPTIVE_SCAN_SCHEDULER_H
