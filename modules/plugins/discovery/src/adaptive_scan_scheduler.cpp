#include "adaptive_scan_scheduler.h"
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>

namespace {

int system_local_hour() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return local.tm_hour;
}

} // namespace

const char* to_string(AdaptiveScanScheduler::State state) {
    return state == AdaptiveScanScheduler::State::SCANNING ? "Scanning" : "Idle";
}

AdaptiveScanScheduler::Settings AdaptiveScanScheduler::Settings::fromConfig() {
    const ConfigManager& config = ConfigManager::getInstance();
    Settings settings;
    settings.default_interval_ms = config.getDefaultScanIntervalMs();
    settings.min_interval_ms = config.getMinScanIntervalMs();
    settings.max_interval_ms = std::max(settings.min_interval_ms, config.getMaxScanIntervalMs());
    settings.high_success_threshold = config.getHighSuccessThreshold();
    settings.low_success_threshold = config.getLowSuccessThreshold();
    settings.adjustment_factor = config.getIntervalAdjustmentFactor();
    settings.night_start_hour = config.getNightStartHour();
    settings.night_end_hour = config.getNightEndHour();
    settings.max_empty_retries = std::max(0, config.getMaxEmptyScanRetries());
    settings.scan_window = std::chrono::milliseconds(config.getScanWindowMs());
    return settings;
}

AdaptiveScanScheduler::AdaptiveScanScheduler(Settings settings,
                                             std::shared_ptr<DiscoverySource> source,
                                             std::shared_ptr<BatteryOptimizer> battery,
                                             std::shared_ptr<NotificationSink> notifier)
    : m_settings(settings),
      m_source(std::move(source)),
      m_battery(std::move(battery)),
      m_notifier(std::move(notifier)),
      m_hour_provider(&system_local_hour),
      m_current_interval_ms(std::clamp(settings.default_interval_ms,
                                       settings.min_interval_ms, settings.max_interval_ms)) {}

AdaptiveScanScheduler::~AdaptiveScanScheduler() {
    stop();
}

void AdaptiveScanScheduler::set_hour_provider(HourProvider provider) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hour_provider = provider ? std::move(provider) : HourProvider(&system_local_hour);
}

void AdaptiveScanScheduler::set_scan_callback(ScanCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scan_callback = std::move(callback);
}

void AdaptiveScanScheduler::notify(const std::string& message) {
    if (m_notifier) {
        m_notifier->notify(message);
    }
}

// ============================================================================
// State machine
// ============================================================================

bool AdaptiveScanScheduler::start() {
    if (!m_source) {
        LOG_ERROR("AdaptiveScan: No discovery source configured");
        return false;
    }
    if (m_running.exchange(true)) {
        LOG_INFO("AdaptiveScan: Already running");
        return false;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }

    const int64_t interval = current_interval_ms();
    LOG_INFO("AdaptiveScan: Starting with " + m_source->name() + ", interval " +
             std::to_string(interval / 1000) + "s");
    notify("Started adaptive scanning (" + std::to_string(interval / 1000) + "s interval)");
    m_thread = std::thread(&AdaptiveScanScheduler::scan_loop, this);
    return true;
}

void AdaptiveScanScheduler::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    LOG_INFO("AdaptiveScan: Stopping");
    if (m_source) {
        m_source->cancel_scan();
    }
    {
        std::lock_guard<std::mutex> lock(m_wait_mutex);
    }
    m_wait_cv.notify_all();

    if (m_thread.joinable()) {
        if (m_thread.get_id() == std::this_thread::get_id()) {
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
    notify("Stopped adaptive scanning");
}

AdaptiveScanScheduler::State AdaptiveScanScheduler::state() const {
    return m_running.load() ? State::SCANNING : State::IDLE;
}

bool AdaptiveScanScheduler::wait_for(int64_t ms) {
    std::unique_lock<std::mutex> lock(m_wait_mutex);
    m_wait_cv.wait_for(lock, std::chrono::milliseconds(ms), [this]() { return !m_running.load(); });
    return m_running.load();
}

void AdaptiveScanScheduler::scan_loop() {
    while (m_running.load()) {
        scan_cycle(true);
        if (!m_running.load()) {
            break;
        }
        const int64_t interval = compute_next_interval();
        LOG_DEBUG("AdaptiveScan: Next scan in " + std::to_string(interval / 1000) + "s");
        if (!wait_for(interval)) {
            break;
        }
    }
    LOG_INFO("AdaptiveScan: Loop exited");
}

size_t AdaptiveScanScheduler::run_scan_cycle() {
    return scan_cycle(false);
}

size_t AdaptiveScanScheduler::scan_cycle(bool interruptible) {
    if (!m_source) {
        return 0;
    }

    size_t found = 0;
    for (int attempt = 0; attempt <= m_settings.max_empty_retries; ++attempt) {
        if (attempt > 0) {
            LOG_DEBUG("AdaptiveScan: Empty scan, retry " + std::to_string(attempt) + "/" +
                      std::to_string(m_settings.max_empty_retries));
            if (interruptible && !wait_for(m_settings.retry_delay_ms)) {
                break;
            }
        }

        ScanOutcome outcome = m_source->scan(m_settings.scan_window);
        if (interruptible && !m_running.load()) {
            // Cancelled mid-scan; the partial result is not a completed scan.
            break;
        }
        if (!outcome.ok) {
            LOG_WARN("AdaptiveScan: Scan failed: " + outcome.error);
            found = 0;
        } else {
            found = outcome.events.size();
        }
        record_scan_result(found);

        if (found > 0) {
            ScanCallback callback;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                callback = m_scan_callback;
            }
            if (callback) {
                callback(outcome.events);
            }
            break;
        }
    }
    return found;
}

// ============================================================================
// Feedback
// ============================================================================

void AdaptiveScanScheduler::record_scan_result(size_t device_count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total_scans++;
    m_last_device_count = device_count;
    if (device_count > 0) {
        m_successful_scans++;
        m_density_score = std::min(3.0, 1.0 + static_cast<double>(device_count) * 0.1);
    } else {
        m_density_score = std::max(1.0, m_density_score * 0.95);
    }
    LOG_DEBUG("AdaptiveScan: Scan #" + std::to_string(m_total_scans) + " found " +
              std::to_string(device_count) + " device(s)");
}

int64_t AdaptiveScanScheduler::compute_next_interval() {
    const double battery_factor = m_battery ? m_battery->scan_interval_factor() : 1.0;
    HourProvider hour_provider;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        hour_provider = m_hour_provider;
    }
    const int hour = hour_provider();

    int64_t previous = 0;
    int64_t next = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_current_interval_ms;
        double interval = static_cast<double>(previous);

        const double rate = m_total_scans > 0
            ? static_cast<double>(m_successful_scans) / static_cast<double>(m_total_scans)
            : 0.0;
        if (rate > m_settings.high_success_threshold) {
            interval *= 1.0 + m_settings.adjustment_factor;
        } else if (rate < m_settings.low_success_threshold) {
            interval *= 1.0 - m_settings.adjustment_factor;
        }

        interval *= battery_factor;
        interval /= m_density_score;
        if (is_night(hour)) {
            interval *= 2.0;
        }

        if (!std::isfinite(interval)) {
            interval = static_cast<double>(m_settings.max_interval_ms);
        }
        const double clamped = std::clamp(interval,
                                          static_cast<double>(m_settings.min_interval_ms),
                                          static_cast<double>(m_settings.max_interval_ms));
        next = m_continuous ? m_settings.min_interval_ms : static_cast<int64_t>(clamped);
        m_current_interval_ms = next;
    }

    if (next != previous) {
        LOG_INFO("AdaptiveScan: Interval adjusted " + std::to_string(previous / 1000) + "s -> " +
                 std::to_string(next / 1000) + "s");
        if (std::llabs(next - previous) > m_settings.notify_change_threshold_ms) {
            notify("Scan interval adjusted to " + std::to_string(next / 1000) + "s");
        }
    }
    return next;
}

bool AdaptiveScanScheduler::is_night(int hour) const {
    const int start = m_settings.night_start_hour;
    const int end = m_settings.night_end_hour;
    if (start == end) {
        return false;
    }
    if (start < end) {
        return hour >= start && hour < end;
    }
    return hour >= start || hour < end;
}

void AdaptiveScanScheduler::set_continuous_mode(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_continuous == enabled) {
            return;
        }
        m_continuous = enabled;
        if (enabled) {
            m_current_interval_ms = m_settings.min_interval_ms;
        }
    }
    LOG_INFO(std::string("AdaptiveScan: Continuous mode ") + (enabled ? "enabled" : "disabled"));
}

bool AdaptiveScanScheduler::is_continuous_mode() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_continuous;
}

bool AdaptiveScanScheduler::is_in_optimal_state() const {
    return m_battery && m_battery->is_in_optimal_state();
}

int64_t AdaptiveScanScheduler::current_interval_ms() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_interval_ms;
}

double AdaptiveScanScheduler::success_rate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_scans > 0
        ? static_cast<double>(m_successful_scans) / static_cast<double>(m_total_scans)
        : 0.0;
}

double AdaptiveScanScheduler::density_score() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_density_score;
}

uint64_t AdaptiveScanScheduler::total_scans() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_scans;
}

uint64_t AdaptiveScanScheduler::successful_scans() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_successful_scans;
}

size_t AdaptiveScanScheduler::last_device_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_device_count;
}

void AdaptiveScanScheduler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total_scans = 0;
    m_successful_scans = 0;
    m_last_device_count = 0;
    m_density_score = 1.0;
    m_current_interval_ms = std::clamp(m_settings.default_interval_ms,
                                       m_settings.min_interval_ms, m_settings.max_interval_ms);
    LOG_INFO("AdaptiveScan: Statistics reset");
}
