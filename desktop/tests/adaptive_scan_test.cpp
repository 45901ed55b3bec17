#include "adaptive_scan_scheduler.h"
#include "battery_optimizer.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

// Returns scripted device counts; an exhausted script yields empty scans.
class ScriptedSource : public DiscoverySource {
public:
    explicit ScriptedSource(std::vector<int> script = {}) : script_(std::move(script)) {}

    ScanOutcome scan(std::chrono::milliseconds window) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (block_for_window_) {
                cv_.wait_for(lock, window, [this]() { return cancelled_; });
                cancelled_ = false;
            }
        }
        const size_t index = calls_.fetch_add(1);
        ScanOutcome outcome;
        const int count = index < script_.size() ? script_[index] : 0;
        if (count < 0) {
            outcome.ok = false;
            outcome.error = "radio off";
            return outcome;
        }
        for (int i = 0; i < count; ++i) {
            DiscoveryEvent event;
            event.peer_id = "peer-" + std::to_string(i);
            event.display_name = "DNC-Peer" + std::to_string(i);
            outcome.events.push_back(event);
        }
        return outcome;
    }

    void cancel_scan() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        cv_.notify_all();
    }

    std::string name() const override { return "scripted"; }

    void set_block_for_window(bool block) {
        std::lock_guard<std::mutex> lock(mutex_);
        block_for_window_ = block;
    }

    size_t calls() const { return calls_.load(); }

private:
    std::vector<int> script_;
    std::atomic<size_t> calls_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool block_for_window_ = false;
};

class RecordingNotifier : public NotificationSink {
public:
    void notify(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(message);
    }
    std::mutex mutex;
    std::vector<std::string> messages;
};

static std::shared_ptr<BatteryOptimizer> battery_at(int level, bool charging, bool power_save = false) {
    auto battery = std::make_shared<BatteryOptimizer>();
    PowerStatus status;
    status.level_percent = level;
    status.charging = charging;
    status.power_save_mode = power_save;
    battery->set_power_status(status);
    return battery;
}

static bool near(int64_t actual, double expected) {
    return std::fabs(static_cast<double>(actual) - expected) <= 1.0;
}

static AdaptiveScanScheduler::Settings fast_settings() {
    AdaptiveScanScheduler::Settings settings;
    settings.scan_window = std::chrono::milliseconds(10);
    settings.retry_delay_ms = 5;
    return settings;
}

static bool test_battery_factor() {
    TEST_ASSERT(battery_at(10, true)->scan_interval_factor() == 0.8, "charging wins over level");
    TEST_ASSERT(battery_at(20, false)->scan_interval_factor() == 2.0, "low threshold is inclusive");
    TEST_ASSERT(battery_at(50, false)->scan_interval_factor() == 1.4, "medium threshold is inclusive");
    TEST_ASSERT(battery_at(51, false)->scan_interval_factor() == 1.0, "healthy battery");

    TEST_ASSERT(battery_at(80, true)->is_in_optimal_state(), "charging at 80% is optimal");
    TEST_ASSERT(!battery_at(80, true, true)->is_in_optimal_state(), "power save is never optimal");
    TEST_ASSERT(!battery_at(80, false)->is_in_optimal_state(), "discharging is not optimal");
    return true;
}

static bool test_factor_order() {
    auto source = std::make_shared<ScriptedSource>();
    AdaptiveScanScheduler scheduler(fast_settings(), source, battery_at(30, false));
    scheduler.set_hour_provider([]() { return 23; });

    // One hit with 10 devices: rate 1.0, density 2.0
    scheduler.record_scan_result(10);
    TEST_ASSERT(scheduler.density_score() == 2.0, "density after 10 devices");

    const int64_t next = scheduler.compute_next_interval();
    // 120000 * 1.15 (success) * 1.4 (battery) / 2.0 (density) * 2 (night)
    TEST_ASSERT(near(next, 193200.0), "unexpected interval " << next);
    TEST_ASSERT(scheduler.current_interval_ms() == next, "interval not stored");
    return true;
}

static bool test_no_scans_counts_as_low_success() {
    auto source = std::make_shared<ScriptedSource>();
    AdaptiveScanScheduler scheduler(fast_settings(), source, battery_at(100, false));
    scheduler.set_hour_provider([]() { return 12; });

    TEST_ASSERT(scheduler.success_rate() == 0.0, "rate with no scans should be 0");
    TEST_ASSERT(near(scheduler.compute_next_interval(), 102000.0), "expected 120000 * 0.85");
    return true;
}

static bool test_night_hours() {
    const int night[] = {23, 0, 3, 5};
    const int day[] = {6, 12, 22};
    for (int hour : night) {
        AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), battery_at(100, false));
        scheduler.set_hour_provider([hour]() { return hour; });
        TEST_ASSERT(near(scheduler.compute_next_interval(), 204000.0), "hour " << hour << " should be night");
    }
    for (int hour : day) {
        AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), battery_at(100, false));
        scheduler.set_hour_provider([hour]() { return hour; });
        TEST_ASSERT(near(scheduler.compute_next_interval(), 102000.0), "hour " << hour << " should be day");
    }
    return true;
}

static bool test_bounds_under_extremes() {
    // Everything pushes the interval up: high success, low battery, night, sparse network
    {
        AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), battery_at(5, false));
        scheduler.set_hour_provider([]() { return 2; });
        scheduler.record_scan_result(1);
        int64_t last = 0;
        for (int i = 0; i < 40; ++i) {
            last = scheduler.compute_next_interval();
            TEST_ASSERT(last >= 30000 && last <= 900000, "interval out of bounds: " << last);
        }
        TEST_ASSERT(last == 900000, "interval should saturate at the ceiling, got " << last);
    }
    // Everything pushes it down: no successes, charging, dense network, daytime
    {
        AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), battery_at(100, true));
        scheduler.set_hour_provider([]() { return 12; });
        for (int i = 0; i < 9; ++i) scheduler.record_scan_result(0);
        scheduler.record_scan_result(100);
        int64_t last = 0;
        for (int i = 0; i < 40; ++i) {
            last = scheduler.compute_next_interval();
            TEST_ASSERT(last >= 30000 && last <= 900000, "interval out of bounds: " << last);
        }
        TEST_ASSERT(last == 30000, "interval should saturate at the floor, got " << last);
    }
    return true;
}

static bool test_density_score() {
    AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), nullptr);
    scheduler.record_scan_result(5);
    TEST_ASSERT(std::fabs(scheduler.density_score() - 1.5) < 1e-9, "density for 5 devices");
    scheduler.record_scan_result(50);
    TEST_ASSERT(scheduler.density_score() == 3.0, "density is capped at 3.0");
    scheduler.record_scan_result(0);
    TEST_ASSERT(std::fabs(scheduler.density_score() - 2.85) < 1e-9, "miss decays density by 5%");
    for (int i = 0; i < 200; ++i) scheduler.record_scan_result(0);
    TEST_ASSERT(scheduler.density_score() == 1.0, "density never drops below 1.0");

    TEST_ASSERT(scheduler.total_scans() == 203, "total scans");
    TEST_ASSERT(scheduler.successful_scans() == 2, "successful scans");
    TEST_ASSERT(scheduler.last_device_count() == 0, "last device count");
    return true;
}

static bool test_empty_scan_retries() {
    auto source = std::make_shared<ScriptedSource>();
    AdaptiveScanScheduler scheduler(fast_settings(), source, nullptr);
    TEST_ASSERT(scheduler.run_scan_cycle() == 0, "empty source should find nothing");
    TEST_ASSERT(source->calls() == 4, "expected 1 scan + 3 retries, got " << source->calls());
    TEST_ASSERT(scheduler.total_scans() == 4, "every retry is a recorded scan");
    return true;
}

static bool test_retry_stops_on_hit() {
    auto source = std::make_shared<ScriptedSource>(std::vector<int>{0, -1, 2});
    AdaptiveScanScheduler scheduler(fast_settings(), source, nullptr);

    std::vector<DiscoveryEvent> delivered;
    int callbacks = 0;
    scheduler.set_scan_callback([&](const std::vector<DiscoveryEvent>& events) {
        delivered = events;
        callbacks++;
    });

    TEST_ASSERT(scheduler.run_scan_cycle() == 2, "third scan should find 2 devices");
    TEST_ASSERT(source->calls() == 3, "no retries after a hit");
    TEST_ASSERT(callbacks == 1 && delivered.size() == 2, "callback should receive the hit once");
    TEST_ASSERT(scheduler.total_scans() == 3 && scheduler.successful_scans() == 1,
                "a failed scan counts as an empty one");
    return true;
}

static bool test_continuous_mode() {
    AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), battery_at(10, false));
    scheduler.set_hour_provider([]() { return 1; });
    scheduler.set_continuous_mode(true);
    TEST_ASSERT(scheduler.is_continuous_mode(), "continuous mode not set");
    TEST_ASSERT(scheduler.current_interval_ms() == 30000, "continuous mode pins the floor");
    TEST_ASSERT(scheduler.compute_next_interval() == 30000, "compute must keep the floor");

    scheduler.set_continuous_mode(false);
    TEST_ASSERT(scheduler.compute_next_interval() > 30000, "adaptive pacing should resume");
    return true;
}

static bool test_interval_change_notification() {
    auto notifier = std::make_shared<RecordingNotifier>();
    AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(),
                                    battery_at(100, false), notifier);
    scheduler.set_hour_provider([]() { return 0; });
    // 120000 -> 204000 is a change of more than 30s
    scheduler.compute_next_interval();

    bool announced = false;
    for (const auto& m : notifier->messages) {
        if (m.rfind("Scan interval adjusted to ", 0) == 0) announced = true;
    }
    TEST_ASSERT(announced, "large interval change should be announced");
    return true;
}

static bool test_reset() {
    AdaptiveScanScheduler scheduler(fast_settings(), std::make_shared<ScriptedSource>(), nullptr);
    scheduler.record_scan_result(7);
    scheduler.compute_next_interval();
    scheduler.reset();
    TEST_ASSERT(scheduler.current_interval_ms() == 120000, "default interval restored");
    TEST_ASSERT(scheduler.total_scans() == 0 && scheduler.successful_scans() == 0, "statistics cleared");
    TEST_ASSERT(scheduler.density_score() == 1.0, "density cleared");
    return true;
}

static bool test_start_stop() {
    auto source = std::make_shared<ScriptedSource>(std::vector<int>{1});
    source->set_block_for_window(true);
    AdaptiveScanScheduler::Settings settings = fast_settings();
    settings.scan_window = std::chrono::milliseconds(50);
    AdaptiveScanScheduler scheduler(settings, source, nullptr);

    TEST_ASSERT(scheduler.state() == AdaptiveScanScheduler::State::IDLE, "initial state");
    TEST_ASSERT(scheduler.start(), "start failed");
    TEST_ASSERT(!scheduler.start(), "second start must be refused");
    TEST_ASSERT(scheduler.state() == AdaptiveScanScheduler::State::SCANNING, "state after start");

    for (int i = 0; i < 100 && scheduler.total_scans() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    TEST_ASSERT(scheduler.total_scans() >= 1, "scheduler never scanned");

    // The loop now sleeps for at least 30s; stop must interrupt it.
    const auto before = std::chrono::steady_clock::now();
    scheduler.stop();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - before).count();
    TEST_ASSERT(elapsed < 2000, "stop took " << elapsed << "ms");
    TEST_ASSERT(scheduler.state() == AdaptiveScanScheduler::State::IDLE, "state after stop");

    scheduler.stop();
    TEST_ASSERT(scheduler.start(), "restart after stop failed");
    scheduler.stop();
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    std::cout << "--- Adaptive scan tests ---" << std::endl;

    if (test_battery_factor()) std::cout << "PASS: battery factor" << std::endl;
    if (test_factor_order()) std::cout << "PASS: factor order" << std::endl;
    if (test_no_scans_counts_as_low_success()) std::cout << "PASS: no scans counts as low success" << std::endl;
    if (test_night_hours()) std::cout << "PASS: night hours" << std::endl;
    if (test_bounds_under_extremes()) std::cout << "PASS: bounds under extremes" << std::endl;
    if (test_density_score()) std::cout << "PASS: density score" << std::endl;
    if (test_empty_scan_retries()) std::cout << "PASS: empty scan retries" << std::endl;
    if (test_retry_stops_on_hit()) std::cout << "PASS: retry stops on hit" << std::endl;
    if (test_continuous_mode()) std::cout << "PASS: continuous mode" << std::endl;
    if (test_interval_change_notification()) std::cout << "PASS: interval change notification" << std::endl;
    if (test_reset()) std::cout << "PASS: reset" << std::endl;
    if (test_start_stop()) std::cout << "PASS: start/stop" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
