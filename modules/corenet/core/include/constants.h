#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstddef>
#include <cstdint>

// Network Configuration
constexpr int DEFAULT_SERVER_PORT = 8080;
constexpr uint16_t DEFAULT_FALLBACK_PORTS[] = {8081, 8082, 8090, 9000};
constexpr int DISCOVERY_PORT = 30000;
constexpr int DEFAULT_LISTEN_BACKLOG = 5;

// Timeouts (in seconds/milliseconds)
constexpr int TCP_CONNECT_TIMEOUT_MS = 5000;
constexpr int TCP_SELECT_TIMEOUT_MS = 1000;
constexpr int SEND_POLL_INTERVAL_MS = 100;
constexpr int LISTENER_HEARTBEAT_INTERVAL_SEC = 30;

// Buffer Sizes
constexpr size_t TCP_BUFFER_SIZE = 4096;
constexpr size_t DISCOVERY_MSG_MAX = 1024;

// Longest accepted line on a peer connection. An 8KB chunk is ~11KB once base64 encoded.
constexpr size_t MAX_FRAME_LINE_BYTES = 4 * 1024 * 1024;

// File transfer
constexpr size_t DEFAULT_FILE_CHUNK_SIZE = 8192;
// Pause between chunks; this is the sender's only flow control.
constexpr int DEFAULT_FILE_CHUNK_DELAY_MS = 50;

// Discovery
constexpr const char* DISCOVERY_MESSAGE_PREFIX = "NEARLINK_DISCOVERY";
constexpr int DEFAULT_SCAN_WINDOW_MS = 3000;
constexpr int DEFAULT_MAX_EMPTY_SCAN_RETRIES = 3;

// Signal strength reported for socket-only peers
constexpr int UNKNOWN_SIGNAL_STRENGTH = -100;

#endif // CONSTANTS_H
