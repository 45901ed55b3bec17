#include "peer_communicator.h"
#include "logger.h"
#include "tcp_socket.h"

#include <chrono>

PeerCommunicator::PeerCommunicator(std::string peer_id, int fd, Settings settings,
                                   std::shared_ptr<EventThreadPool> pool,
                                   FrameHandler on_frame, ClosedHandler on_closed)
    : m_peer_id(std::move(peer_id)),
      m_fd(fd),
      m_settings(std::move(settings)),
      m_pool(std::move(pool)),
      m_on_frame(std::move(on_frame)),
      m_on_closed(std::move(on_closed)) {}

PeerCommunicator::~PeerCommunicator() {
    if (!m_closed.exchange(true)) {
        tcp::shutdown_socket(m_fd);
        m_queue_cv.notify_all();
    }
    {
        std::lock_guard<std::mutex> lock(m_thread_mutex);
        // The last reference can be dropped by our own reader or writer.
        for (std::thread* t : {&m_reader, &m_writer}) {
            if (!t->joinable()) continue;
            if (t->get_id() == std::this_thread::get_id()) {
                t->detach();
            } else {
                t->join();
            }
        }
    }
    tcp::close_socket(m_fd);
}

void PeerCommunicator::start() {
    if (m_started.exchange(true)) {
        return;
    }
    auto self = shared_from_this();
    std::lock_guard<std::mutex> lock(m_thread_mutex);
    m_reader = std::thread([self]() { self->readLoop(); });
    m_writer = std::thread([self]() { self->writeLoop(); });
    LOG_DEBUG("PC: Started reader/writer for " + m_peer_id);
}

bool PeerCommunicator::enqueue(MessageType type, const std::string& payload) {
    if (m_closed.load()) {
        LOG_DEBUG("PC: Dropping " + std::string(to_string(type)) + " for closed connection " + m_peer_id);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_outbound.push_back(wire::encode_frame(type, payload));
    }
    m_queue_cv.notify_one();
    return true;
}

bool PeerCommunicator::sendText(const std::string& text) {
    return enqueue(MessageType::TEXT, text);
}

bool PeerCommunicator::sendCommand(const std::string& command, const std::string& args) {
    return enqueue(MessageType::COMMAND, args.empty() ? command : command + ":" + args);
}

void PeerCommunicator::close(const std::string& reason) {
    if (m_closed.exchange(true)) {
        return;
    }
    LOG_INFO("PC: Closing connection " + m_peer_id + " (" + reason + ")");
    tcp::shutdown_socket(m_fd);
    m_queue_cv.notify_all();
    if (m_on_closed) {
        m_on_closed(shared_from_this(), reason);
    }
}

void PeerCommunicator::waitStopped() {
    std::lock_guard<std::mutex> lock(m_thread_mutex);
    for (std::thread* t : {&m_reader, &m_writer}) {
        if (t->joinable() && t->get_id() != std::this_thread::get_id()) {
            t->join();
        }
    }
}

size_t PeerCommunicator::pendingFrames() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_outbound.size();
}

void PeerCommunicator::readLoop() {
    LineReader reader(m_fd, m_settings.max_line_bytes);
    std::string line;

    while (!m_closed.load()) {
        LineReadStatus status = reader.readLine(line, m_settings.send_poll_interval_ms);
        switch (status) {
            case LineReadStatus::LINE:
                handleLine(line);
                break;
            case LineReadStatus::TIMEOUT:
                break;
            case LineReadStatus::CLOSED:
                close("remote closed connection");
                return;
            case LineReadStatus::ERROR:
                if (!m_closed.load()) {
                    LOG_WARN("PC: Read error on " + m_peer_id + ": " + reader.lastError());
                }
                close("read failed: " + reader.lastError());
                return;
            case LineReadStatus::OVERFLOW:
                LOG_WARN("PC: Oversized frame from " + m_peer_id + ": " + reader.lastError());
                close("protocol error: " + reader.lastError());
                return;
        }
    }
}

void PeerCommunicator::writeLoop() {
    const auto poll_interval = std::chrono::milliseconds(m_settings.send_poll_interval_ms);

    while (true) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait_for(lock, poll_interval, [this]() {
                return !m_outbound.empty() || m_closed.load();
            });
            if (m_closed.load()) {
                return;
            }
            if (m_outbound.empty()) {
                continue;
            }
            line = std::move(m_outbound.front());
            m_outbound.pop_front();
        }

        line.push_back(wire::kLineTerminator);
        std::string error;
        if (!tcp::send_all(m_fd, line, error)) {
            LOG_WARN("PC: Write to " + m_peer_id + " failed: " + error);
            close("write failed: " + error);
            return;
        }
    }
}

void PeerCommunicator::handleLine(const std::string& line) {
    std::optional<wire::Frame> frame = wire::decode_frame(line);
    if (!frame) {
        LOG_WARN("PC: Malformed frame from " + m_peer_id + " dropped: " + line.substr(0, 64));
        return;
    }

    switch (frame->type) {
        case MessageType::UNKNOWN:
            LOG_WARN("PC: Unknown frame type '" + frame->type_name + "' from " + m_peer_id);
            return;
        case MessageType::HEARTBEAT:
            LOG_DEBUG("PC: Heartbeat from " + m_peer_id);
            return;
        case MessageType::HANDSHAKE:
            if (frame->payload.rfind(HANDSHAKE_ACCEPTED, 0) != 0) {
                enqueue(MessageType::HANDSHAKE,
                        std::string(HANDSHAKE_ACCEPTED) + ":" + m_settings.local_display_name);
            }
            break;
        default:
            break;
    }

    if (!m_on_frame) {
        return;
    }
    auto handler = m_on_frame;
    auto peer_id = m_peer_id;
    auto dispatched = std::make_shared<wire::Frame>(std::move(*frame));
    if (!m_pool->submit(m_peer_id, [handler, peer_id, dispatched]() { handler(peer_id, *dispatched); })) {
        LOG_WARN("PC: Event pool stopped, dropping " + dispatched->type_name + " from " + m_peer_id);
    }
}
