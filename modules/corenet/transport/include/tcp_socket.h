#ifndef TCP_SOCKET_H
#define TCP_SOCKET_H

#include "connection_types.h"

#include <cstdint>
#include <string>
#include <vector>

struct TcpConnectOutcome {
    int fd = -1;
    ConnectError error = ConnectError::NONE;
    std::string reason;
};

enum class LineReadStatus {
    LINE,       // a complete line was returned
    TIMEOUT,    // nothing complete within the poll interval
    CLOSED,     // orderly EOF from the remote side
    ERROR,      // recv/poll failure
    OVERFLOW    // a line exceeded the configured maximum
};

namespace tcp {

// Non-blocking connect bounded by timeout_ms. The returned socket is back in
// blocking mode. Refusal and timeout are reported as distinct errors.
TcpConnectOutcome connect_with_timeout(const std::string& ip, uint16_t port, int timeout_ms);

// TCP_NODELAY and SO_KEEPALIVE for interactive peer links. Failures are logged only.
void configure_peer_socket(int fd, bool no_delay, bool keepalive);

// Binds and listens on INADDR_ANY:port. Returns the fd or -1 with `error` set.
int bind_listener(uint16_t port, int backlog, std::string& error);

// Writes the whole buffer, retrying on EINTR. SIGPIPE is suppressed.
bool send_all(int fd, const std::string& data, std::string& error);

// Half-closes both directions so blocked readers wake up; the fd stays open.
void shutdown_socket(int fd);
void close_socket(int fd);

std::string remote_address(int fd);
uint16_t remote_port(int fd);
std::string local_address(int fd);

} // namespace tcp

/**
 * Splits a byte stream into '\n'-terminated lines. Every other byte, '\r'
 * included, is part of the line.
 */
class LineReader {
public:
    LineReader(int fd, size_t max_line_bytes);

    // Waits at most poll_timeout_ms for data.
    LineReadStatus readLine(std::string& line, int poll_timeout_ms);

    const std::string& lastError() const { return m_last_error; }

private:
    bool takeBufferedLine(std::string& line);

    int m_fd;
    size_t m_max_line_bytes;
    std::vector<char> m_chunk;
    std::string m_buffer;
    std::string m_last_error;
};

#endif // TCP_SOCKET_H
