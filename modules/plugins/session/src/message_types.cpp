#include "message_types.h"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<MessageType, const char*>, 10> kTypeNames = {{
    {MessageType::HANDSHAKE,    "HANDSHAKE"},
    {MessageType::HEARTBEAT,    "HEARTBEAT"},
    {MessageType::TEXT,         "TEXT"},
    {MessageType::COMMAND,      "COMMAND"},
    {MessageType::FILE_START,   "FILE_START"},
    {MessageType::FILE_CHUNK,   "FILE_CHUNK"},
    {MessageType::FILE_END,     "FILE_END"},
    {MessageType::STATUS,       "STATUS"},
    {MessageType::ERROR,        "ERROR"},
    {MessageType::IP_BROADCAST, "IP_BROADCAST"},
}};

} // namespace

const char* to_string(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

MessageType message_type_from_string(const std::string& name) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return MessageType::UNKNOWN;
}
