#include "tcp_socket.h"
#include "constants.h"
#include "logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::string errno_text(int err) {
    return std::string(strerror(err));
}

std::string format_address(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
        return "";
    }
    return std::string(ip);
}

} // namespace

namespace tcp {

TcpConnectOutcome connect_with_timeout(const std::string& ip, uint16_t port, int timeout_ms) {
    TcpConnectOutcome outcome;
    const std::string target = ip + ":" + std::to_string(port);

    sockaddr_in dest_addr{};
    dest_addr.sin_family = AF_INET;
    dest_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &dest_addr.sin_addr) != 1) {
        outcome.error = ConnectError::NO_ADDRESS;
        outcome.reason = "Invalid IPv4 address: " + ip;
        return outcome;
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        outcome.error = ConnectError::IO_ERROR;
        outcome.reason = "socket() failed: " + errno_text(errno);
        return outcome;
    }

    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        outcome.error = ConnectError::IO_ERROR;
        outcome.reason = "fcntl(O_NONBLOCK) failed: " + errno_text(errno);
        close(sock);
        return outcome;
    }

    int result = ::connect(sock, reinterpret_cast<sockaddr*>(&dest_addr), sizeof(dest_addr));
    if (result < 0) {
        if (errno == ECONNREFUSED) {
            outcome.error = ConnectError::CONNECTION_REFUSED;
            outcome.reason = "Connection refused by " + target;
            close(sock);
            return outcome;
        }
        if (errno != EINPROGRESS) {
            outcome.error = ConnectError::IO_ERROR;
            outcome.reason = "connect() to " + target + " failed: " + errno_text(errno);
            close(sock);
            return outcome;
        }

        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(sock, &write_fds);

        timeval timeout;
        timeout.tv_sec = timeout_ms / 1000;
        timeout.tv_usec = (timeout_ms % 1000) * 1000;

        do {
            result = select(sock + 1, nullptr, &write_fds, nullptr, &timeout);
        } while (result < 0 && errno == EINTR);

        if (result == 0) {
            outcome.error = ConnectError::CONNECT_TIMEOUT;
            outcome.reason = "Connection to " + target + " timed out after " + std::to_string(timeout_ms) + " ms";
            close(sock);
            return outcome;
        }
        if (result < 0) {
            outcome.error = ConnectError::IO_ERROR;
            outcome.reason = "select() failed while connecting to " + target + ": " + errno_text(errno);
            close(sock);
            return outcome;
        }

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
            error = errno;
        }
        if (error != 0) {
            outcome.error = (error == ECONNREFUSED) ? ConnectError::CONNECTION_REFUSED
                          : (error == ETIMEDOUT)    ? ConnectError::CONNECT_TIMEOUT
                                                    : ConnectError::IO_ERROR;
            outcome.reason = "Failed to connect to " + target + ": " + errno_text(error);
            close(sock);
            return outcome;
        }
    }

    // Reader and writer threads use blocking I/O with poll().
    if (fcntl(sock, F_SETFL, flags) < 0) {
        outcome.error = ConnectError::IO_ERROR;
        outcome.reason = "fcntl(restore) failed: " + errno_text(errno);
        close(sock);
        return outcome;
    }

    LOG_DEBUG("TCP_CONNECT: Connection established to " + target + ", fd=" + std::to_string(sock));
    outcome.fd = sock;
    return outcome;
}

void configure_peer_socket(int fd, bool no_delay, bool keepalive) {
    int nodelay_flag = no_delay ? 1 : 0;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay_flag, sizeof(nodelay_flag)) < 0) {
        LOG_WARN("TCP Warning: Failed to set TCP_NODELAY: " + errno_text(errno));
    }
    int keepalive_flag = keepalive ? 1 : 0;
    if (setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive_flag, sizeof(keepalive_flag)) < 0) {
        LOG_WARN("TCP Warning: Failed to set SO_KEEPALIVE: " + errno_text(errno));
    }
#ifdef __APPLE__
    int nosigpipe = 1;
    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe, sizeof(nosigpipe));
#endif
}

int bind_listener(uint16_t port, int backlog, std::string& error) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        error = "socket() failed: " + errno_text(errno);
        return -1;
    }

    int opt = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        error = "setsockopt(SO_REUSEADDR) failed: " + errno_text(errno);
        close(sock);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);
    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind() to port " + std::to_string(port) + " failed: " + errno_text(errno);
        close(sock);
        return -1;
    }

    if (listen(sock, backlog) < 0) {
        error = "listen() failed: " + errno_text(errno);
        close(sock);
        return -1;
    }
    return sock;
}

bool send_all(int fd, const std::string& data, std::string& error) {
    if (fd < 0) {
        error = "invalid socket";
        return false;
    }

    size_t total_sent = 0;
    const char* data_ptr = data.data();
    while (total_sent < data.size()) {
#ifdef __APPLE__
        ssize_t sent = ::send(fd, data_ptr + total_sent, data.size() - total_sent, 0);
#else
        ssize_t sent = ::send(fd, data_ptr + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
#endif
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = errno_text(errno);
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

void shutdown_socket(int fd) {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void close_socket(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

std::string remote_address(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return "";
    }
    return format_address(addr);
}

uint16_t remote_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string local_address(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return "";
    }
    return format_address(addr);
}

} // namespace tcp

// ============================================================================
// LineReader
// ============================================================================

LineReader::LineReader(int fd, size_t max_line_bytes)
    : m_fd(fd), m_max_line_bytes(max_line_bytes), m_chunk(TCP_BUFFER_SIZE) {}

bool LineReader::takeBufferedLine(std::string& line) {
    size_t pos = m_buffer.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line.assign(m_buffer, 0, pos);
    m_buffer.erase(0, pos + 1);
    return true;
}

LineReadStatus LineReader::readLine(std::string& line, int poll_timeout_ms) {
    if (takeBufferedLine(line)) {
        return LineReadStatus::LINE;
    }
    if (m_buffer.size() > m_max_line_bytes) {
        m_last_error = "line exceeds " + std::to_string(m_max_line_bytes) + " bytes";
        return LineReadStatus::OVERFLOW;
    }

    pollfd pfd{};
    pfd.fd = m_fd;
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, poll_timeout_ms);
    if (ready == 0) {
        return LineReadStatus::TIMEOUT;
    }
    if (ready < 0) {
        if (errno == EINTR) {
            return LineReadStatus::TIMEOUT;
        }
        m_last_error = "poll() failed: " + errno_text(errno);
        return LineReadStatus::ERROR;
    }

    ssize_t received = recv(m_fd, m_chunk.data(), m_chunk.size(), 0);
    if (received == 0) {
        return LineReadStatus::CLOSED;
    }
    if (received < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            return LineReadStatus::TIMEOUT;
        }
        m_last_error = "recv() failed: " + errno_text(errno);
        return LineReadStatus::ERROR;
    }

    m_buffer.append(m_chunk.data(), static_cast<size_t>(received));
    if (takeBufferedLine(line)) {
        return LineReadStatus::LINE;
    }
    if (m_buffer.size() > m_max_line_bytes) {
        m_last_error = "line exceeds " + std::to_string(m_max_line_bytes) + " bytes";
        return LineReadStatus::OVERFLOW;
    }
    return LineReadStatus::TIMEOUT;
}
