#ifndef CONNECTION_TYPES_H
#define CONNECTION_TYPES_H

#include <cstdint>
#include <string>

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

// Failure taxonomy for connection attempts.
enum class ConnectError {
    NONE,
    NO_ADDRESS,          // peer has no known network address
    SELF_CONNECTION,     // resolved address belongs to this host
    CONNECTION_REFUSED,  // remote refused; fallback ports are tried next
    CONNECT_TIMEOUT,
    IO_ERROR,            // socket creation/configuration/handshake write failed
    NOT_RUNNING          // manager is shutting down
};

enum class ConnectStatus {
    CONNECTED,
    FAILED
};

struct ConnectResult {
    ConnectStatus status = ConnectStatus::FAILED;
    ConnectError error = ConnectError::NONE;
    bool already_connected = false;
    uint16_t port = 0;       // port of the established connection
    int attempts = 0;        // TCP connect attempts made by this call
    std::string reason;

    bool ok() const { return status == ConnectStatus::CONNECTED; }

    static ConnectResult connected(uint16_t port, int attempts) {
        ConnectResult r;
        r.status = ConnectStatus::CONNECTED;
        r.port = port;
        r.attempts = attempts;
        return r;
    }

    static ConnectResult failed(ConnectError error, std::string reason, int attempts = 0) {
        ConnectResult r;
        r.status = ConnectStatus::FAILED;
        r.error = error;
        r.reason = std::move(reason);
        r.attempts = attempts;
        return r;
    }
};

const char* to_string(ConnectionState state);
const char* to_string(ConnectError error);

#endif // CONNECTION_TYPES_H
