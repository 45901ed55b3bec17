#include "event_thread_pool.h"
#include "logger.h"

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
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

static bool test_same_key_runs_in_order() {
    EventThreadPool pool(4);
    std::mutex mutex;
    std::map<std::string, std::vector<int>> seen;

    const std::vector<std::string> keys = {"peer-a", "peer-b", "peer-c", "192.168.1.20"};
    for (int i = 0; i < 200; ++i) {
        for (const auto& key : keys) {
            pool.submit(key, [&mutex, &seen, key, i]() {
                std::lock_guard<std::mutex> lock(mutex);
                seen[key].push_back(i);
            });
        }
    }
    pool.shutdown(true);

    for (const auto& key : keys) {
        const auto& order = seen[key];
        TEST_ASSERT(order.size() == 200, key << " ran " << order.size() << " tasks");
        for (int i = 0; i < 200; ++i) {
            TEST_ASSERT(order[i] == i, key << " out of order at " << i);
        }
    }
    return true;
}

static bool test_submit_any_runs_everything() {
    EventThreadPool pool(3);
    std::atomic<int> count{0};
    for (int i = 0; i < 90; ++i) {
        TEST_ASSERT(pool.submit_any([&count]() { count++; }), "submit_any rejected while running");
    }
    pool.shutdown(true);
    TEST_ASSERT(count.load() == 90, "expected 90 tasks, ran " << count.load());
    return true;
}

static bool test_rejects_after_shutdown() {
    EventThreadPool pool(2);
    pool.shutdown(true);
    TEST_ASSERT(!pool.is_running(), "pool should report stopped");
    TEST_ASSERT(!pool.submit("k", []() {}), "submit accepted after shutdown");
    TEST_ASSERT(!pool.submit_any([]() {}), "submit_any accepted after shutdown");
    pool.shutdown(true);
    return true;
}

static bool test_throwing_task_keeps_worker() {
    EventThreadPool pool(1);
    std::atomic<bool> ran_after{false};
    pool.submit("k", []() { throw std::runtime_error("boom"); });
    pool.submit("k", [&ran_after]() { ran_after = true; });
    pool.shutdown(true);
    TEST_ASSERT(ran_after.load(), "worker died after a throwing task");
    return true;
}

static bool test_default_worker_count() {
    EventThreadPool pool;
    TEST_ASSERT(pool.worker_count() >= 1, "at least one worker");
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);

    std::cout << "--- Event thread pool tests ---" << std::endl;

    if (test_same_key_runs_in_order()) std::cout << "PASS: same key runs in order" << std::endl;
    if (test_submit_any_runs_everything()) std::cout << "PASS: submit_any runs everything" << std::endl;
    if (test_rejects_after_shutdown()) std::cout << "PASS: rejects after shutdown" << std::endl;
    if (test_throwing_task_keeps_worker()) std::cout << "PASS: throwing task keeps worker" << std::endl;
    if (test_default_worker_count()) std::cout << "PASS: default worker count" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
