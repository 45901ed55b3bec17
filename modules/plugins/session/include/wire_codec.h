#pragma once

#include "message_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wire {

inline constexpr char kFieldDelimiter = '|';
inline constexpr char kLineTerminator = '\n';

struct Frame {
    MessageType type = MessageType::UNKNOWN;
    std::string type_name;      // as received, kept for UNKNOWN types
    int64_t timestamp = 0;      // sender wall-clock ms, diagnostics only
    std::string payload;
};

// Text format: TYPE|TIMESTAMP|PAYLOAD (no terminator). The payload is the last
// field, so it may contain the delimiter. It must not contain a raw newline.
std::string encode_frame(MessageType type, std::string_view payload);
std::string encode_frame(MessageType type, std::string_view payload, int64_t timestamp);

// Splits into at most 3 fields. Returns nullopt when fewer than 3 result.
// A non-numeric timestamp decodes as 0. Never throws.
std::optional<Frame> decode_frame(std::string_view line);

int64_t now_millis();

} // namespace wire
