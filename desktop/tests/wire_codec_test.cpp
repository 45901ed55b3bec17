#include "wire_codec.h"
#include "message_types.h"
#include "logger.h"

#include <iostream>
#include <string>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_roundtrip_every_type() {
    const MessageType types[] = {
        MessageType::HANDSHAKE, MessageType::HEARTBEAT, MessageType::TEXT, MessageType::COMMAND,
        MessageType::FILE_START, MessageType::FILE_CHUNK, MessageType::FILE_END,
        MessageType::STATUS, MessageType::ERROR, MessageType::IP_BROADCAST,
    };
    for (MessageType type : types) {
        const std::string encoded = wire::encode_frame(type, "payload", 1700000000123);
        auto frame = wire::decode_frame(encoded);
        TEST_ASSERT(frame.has_value(), "decode failed for " << to_string(type));
        TEST_ASSERT(frame->type == type, "type mismatch for " << to_string(type));
        TEST_ASSERT(frame->timestamp == 1700000000123, "timestamp mismatch");
        TEST_ASSERT(frame->payload == "payload", "payload mismatch");
    }
    return true;
}

static bool test_exact_encoding() {
    TEST_ASSERT(wire::encode_frame(MessageType::TEXT, "hello", 42) == "TEXT|42|hello", "text layout");
    TEST_ASSERT(wire::encode_frame(MessageType::HEARTBEAT, "", 7) == "HEARTBEAT|7|", "empty payload layout");
    return true;
}

static bool test_payload_with_delimiter() {
    const std::string payload = "a|b||c|";
    auto frame = wire::decode_frame(wire::encode_frame(MessageType::FILE_START, payload, 1));
    TEST_ASSERT(frame.has_value(), "decode failed");
    TEST_ASSERT(frame->type == MessageType::FILE_START, "wrong type");
    TEST_ASSERT(frame->payload == payload, "payload with delimiters not preserved: " << frame->payload);
    return true;
}

static bool test_empty_payload() {
    auto frame = wire::decode_frame("HEARTBEAT|100|");
    TEST_ASSERT(frame.has_value(), "empty payload should decode");
    TEST_ASSERT(frame->payload.empty(), "payload should be empty");
    return true;
}

static bool test_malformed_lines() {
    TEST_ASSERT(!wire::decode_frame("").has_value(), "empty line accepted");
    TEST_ASSERT(!wire::decode_frame("TEXT").has_value(), "one field accepted");
    TEST_ASSERT(!wire::decode_frame("TEXT|123").has_value(), "two fields accepted");
    TEST_ASSERT(!wire::decode_frame("garbage without delimiters").has_value(), "garbage accepted");
    return true;
}

static bool test_unknown_type() {
    auto frame = wire::decode_frame("TELEPORT|5|x");
    TEST_ASSERT(frame.has_value(), "unknown type should still decode");
    TEST_ASSERT(frame->type == MessageType::UNKNOWN, "expected UNKNOWN");
    TEST_ASSERT(frame->type_name == "TELEPORT", "type name should be kept");

    // Type names are case-sensitive
    auto lower = wire::decode_frame("text|5|x");
    TEST_ASSERT(lower.has_value() && lower->type == MessageType::UNKNOWN, "lower-case type accepted");
    return true;
}

static bool test_non_numeric_timestamp() {
    auto frame = wire::decode_frame("TEXT|yesterday|hi");
    TEST_ASSERT(frame.has_value(), "bad timestamp should not reject the frame");
    TEST_ASSERT(frame->timestamp == 0, "bad timestamp should decode as 0");
    TEST_ASSERT(frame->payload == "hi", "payload mismatch");

    auto partial = wire::decode_frame("TEXT|12ab|hi");
    TEST_ASSERT(partial.has_value() && partial->timestamp == 0, "partially numeric timestamp should be 0");
    return true;
}

static bool test_type_names() {
    TEST_ASSERT(std::string(to_string(MessageType::IP_BROADCAST)) == "IP_BROADCAST", "IP_BROADCAST name");
    TEST_ASSERT(message_type_from_string("FILE_CHUNK") == MessageType::FILE_CHUNK, "FILE_CHUNK lookup");
    TEST_ASSERT(message_type_from_string("") == MessageType::UNKNOWN, "empty lookup");
    TEST_ASSERT(is_file_message(MessageType::FILE_END), "FILE_END is a file message");
    TEST_ASSERT(!is_file_message(MessageType::TEXT), "TEXT is not a file message");
    return true;
}

static bool test_current_timestamp() {
    const int64_t before = wire::now_millis();
    auto frame = wire::decode_frame(wire::encode_frame(MessageType::TEXT, "x"));
    const int64_t after = wire::now_millis();
    TEST_ASSERT(frame.has_value(), "decode failed");
    TEST_ASSERT(frame->timestamp >= before && frame->timestamp <= after, "timestamp not current");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    std::cout << "--- Wire codec tests ---" << std::endl;

    if (test_roundtrip_every_type()) std::cout << "PASS: roundtrip every type" << std::endl;
    if (test_exact_encoding()) std::cout << "PASS: exact encoding" << std::endl;
    if (test_payload_with_delimiter()) std::cout << "PASS: payload with delimiter" << std::endl;
    if (test_empty_payload()) std::cout << "PASS: empty payload" << std::endl;
    if (test_malformed_lines()) std::cout << "PASS: malformed lines" << std::endl;
    if (test_unknown_type()) std::cout << "PASS: unknown type" << std::endl;
    if (test_non_numeric_timestamp()) std::cout << "PASS: non-numeric timestamp" << std::endl;
    if (test_type_names()) std::cout << "PASS: type names" << std::endl;
    if (test_current_timestamp()) std::cout << "PASS: current timestamp" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
