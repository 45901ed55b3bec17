#pragma once

#include <string>

// Frame type tags. The wire form is the upper-case name.
enum class MessageType {
    HANDSHAKE,
    HEARTBEAT,
    TEXT,
    COMMAND,
    FILE_START,
    FILE_CHUNK,
    FILE_END,
    STATUS,
    ERROR,
    IP_BROADCAST,   // address announcement: dotted-quad payload

    UNKNOWN
};

const char* to_string(MessageType type);

// Returns UNKNOWN for anything that is not an exact type name.
MessageType message_type_from_string(const std::string& name);

inline bool is_file_message(MessageType type) {
    return type == MessageType::FILE_START ||
           type == MessageType::FILE_CHUNK ||
           type == MessageType::FILE_END;
}

// Handshake payload markers
inline constexpr const char* HANDSHAKE_CONNECT = "CONNECT";
inline constexpr const char* HANDSHAKE_ACCEPTED = "ACCEPTED";

// Well-known COMMAND names. The core forwards them; the node executes them.
namespace commands {
inline constexpr const char* PING = "PING";
inline constexpr const char* SHUTDOWN = "SHUTDOWN";
inline constexpr const char* RESTART = "RESTART";
inline constexpr const char* GET_INFO = "GET_INFO";
inline constexpr const char* PONG = "PONG";
} // namespace commands
