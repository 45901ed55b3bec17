#include "broadcast_discovery.h"
#include "logger.h"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using Kind = BroadcastDiscovery::MessageKind;

static bool test_request_layout() {
    const std::string probe = BroadcastDiscovery::encode_request("a1b2c3", "DNC-Alice");
    TEST_ASSERT(probe == "NEARLINK_DISCOVERY|REQ|a1b2c3|DNC-Alice", "unexpected probe: " << probe);

    auto message = BroadcastDiscovery::parse_message(probe);
    TEST_ASSERT(message.has_value(), "probe should parse");
    TEST_ASSERT(message->kind == Kind::REQUEST, "expected REQUEST");
    TEST_ASSERT(message->peer_id == "a1b2c3" && message->name == "DNC-Alice", "probe fields");
    TEST_ASSERT(message->tcp_port == 0, "probes carry no port");
    return true;
}

static bool test_response_layout() {
    const std::string reply = BroadcastDiscovery::encode_response("d4e5f6", "DNC-Bob", 8081);
    TEST_ASSERT(reply == "NEARLINK_DISCOVERY|RSP|d4e5f6|DNC-Bob|8081", "unexpected reply: " << reply);

    auto message = BroadcastDiscovery::parse_message(reply);
    TEST_ASSERT(message.has_value() && message->kind == Kind::RESPONSE, "reply should parse");
    TEST_ASSERT(message->name == "DNC-Bob", "reply name");
    TEST_ASSERT(message->tcp_port == 8081, "reply port");
    return true;
}

static bool test_names_with_delimiters() {
    auto reply = BroadcastDiscovery::parse_message(
        BroadcastDiscovery::encode_response("id", "DNC-Lab|Bench 2", 9000));
    TEST_ASSERT(reply.has_value(), "reply with '|' in the name should parse");
    TEST_ASSERT(reply->name == "DNC-Lab|Bench 2", "name mangled: " << reply->name);
    TEST_ASSERT(reply->tcp_port == 9000, "port after a delimited name");

    auto probe = BroadcastDiscovery::parse_message(BroadcastDiscovery::encode_request("id", "a|b"));
    TEST_ASSERT(probe.has_value() && probe->name == "a|b", "probe name with '|'");

    auto unnamed = BroadcastDiscovery::parse_message(BroadcastDiscovery::encode_request("id", ""));
    TEST_ASSERT(unnamed.has_value() && unnamed->name.empty(), "empty name is allowed");
    return true;
}

static bool test_rejects_foreign_datagrams() {
    const char* bad[] = {
        "",
        "HELLO",
        "OTHER_APP|REQ|id|name",
        "NEARLINK_DISCOVERY",
        "NEARLINK_DISCOVERY|REQ",
        "NEARLINK_DISCOVERY|REQ||name",
        "NEARLINK_DISCOVERY|PING|id|name",
        "NEARLINK_DISCOVERY|RSP|id|name",
        "NEARLINK_DISCOVERY|RSP|id|name|port",
        "NEARLINK_DISCOVERY|RSP|id|name|70000",
        "NEARLINK_DISCOVERY|RSP|id|name|80x",
    };
    for (const char* datagram : bad) {
        TEST_ASSERT(!BroadcastDiscovery::parse_message(datagram).has_value(), "accepted: '" << datagram << "'");
    }
    return true;
}

static bool test_scan_requires_start() {
    BroadcastDiscovery::Settings settings;
    settings.port = 0;
    settings.local_peer_id = "self";
    settings.display_name = "DNC-Self";
    BroadcastDiscovery discovery(settings, []() { return static_cast<uint16_t>(0); });

    TEST_ASSERT(!discovery.is_running(), "should not run before start");
    const auto started = std::chrono::steady_clock::now();
    ScanOutcome outcome = discovery.scan(std::chrono::milliseconds(2000));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    TEST_ASSERT(!outcome.ok, "scan on a closed socket must fail");
    TEST_ASSERT(!outcome.error.empty(), "failure should carry a reason");
    TEST_ASSERT(outcome.events.empty(), "no events on failure");
    TEST_ASSERT(elapsed < std::chrono::milliseconds(500), "failed scan should not wait for the window");
    TEST_ASSERT(discovery.name() == "lan-broadcast", "source name");

    discovery.stop();
    return true;
}

static bool test_cancel_before_scan_is_kept() {
    BroadcastDiscovery::Settings settings;
    settings.port = static_cast<uint16_t>(38000 + getpid() % 1000);
    settings.local_peer_id = "self";
    settings.display_name = "DNC-Self";
    BroadcastDiscovery discovery(settings, []() { return static_cast<uint16_t>(0); });
    TEST_ASSERT(discovery.start(), "discovery socket did not bind");

    // A stop request that lands just before the scan begins
    discovery.cancel_scan();
    auto started = std::chrono::steady_clock::now();
    ScanOutcome outcome = discovery.scan(std::chrono::milliseconds(3000));
    auto elapsed = std::chrono::steady_clock::now() - started;
    TEST_ASSERT(elapsed < std::chrono::milliseconds(500), "pending cancel was lost, scan ran its window");
    TEST_ASSERT(outcome.ok && outcome.events.empty(), "cancelled scan should be empty");

    // The cancel is consumed: the next scan runs normally.
    started = std::chrono::steady_clock::now();
    outcome = discovery.scan(std::chrono::milliseconds(200));
    elapsed = std::chrono::steady_clock::now() - started;
    if (outcome.ok) {
        TEST_ASSERT(elapsed >= std::chrono::milliseconds(150), "second scan was cut short");
    }

    // Cancel from another thread while a scan waits
    std::thread canceller([&discovery]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        discovery.cancel_scan();
    });
    started = std::chrono::steady_clock::now();
    outcome = discovery.scan(std::chrono::milliseconds(3000));
    elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();
    TEST_ASSERT(elapsed < std::chrono::milliseconds(2000), "cancel during a scan was ignored");

    discovery.stop();
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    std::cout << "--- Broadcast discovery tests ---" << std::endl;

    if (test_request_layout()) std::cout << "PASS: request layout" << std::endl;
    if (test_response_layout()) std::cout << "PASS: response layout" << std::endl;
    if (test_names_with_delimiters()) std::cout << "PASS: names with delimiters" << std::endl;
    if (test_rejects_foreign_datagrams()) std::cout << "PASS: rejects foreign datagrams" << std::endl;
    if (test_scan_requires_start()) std::cout << "PASS: scan requires start" << std::endl;
    if (test_cancel_before_scan_is_kept()) std::cout << "PASS: cancel before scan is kept" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
