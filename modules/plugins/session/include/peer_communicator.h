#ifndef PEER_COMMUNICATOR_H
#define PEER_COMMUNICATOR_H

#include "connection_observer.h"
#include "constants.h"
#include "event_thread_pool.h"
#include "wire_codec.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * Full-duplex pump for one established TCP connection.
 *
 * Owns the socket and two threads: the reader decodes lines and dispatches
 * frames to the event pool (keyed by peer id), the writer drains a FIFO queue.
 * HEARTBEAT frames are consumed here and every HANDSHAKE that is not itself an
 * ACCEPTED reply is answered with one before being forwarded.
 *
 * Reader EOF, read/write errors and close() all converge on a single teardown
 * and a single ClosedHandler call.
 */
class PeerCommunicator : public MessageSender,
                         public std::enable_shared_from_this<PeerCommunicator> {
public:
    struct Settings {
        std::string local_display_name;
        int send_poll_interval_ms = SEND_POLL_INTERVAL_MS;
        size_t max_line_bytes = MAX_FRAME_LINE_BYTES;
    };

    using FrameHandler = std::function<void(const std::string& peer_id, const wire::Frame& frame)>;
    using ClosedHandler = std::function<void(const std::shared_ptr<PeerCommunicator>& self,
                                             const std::string& reason)>;

    PeerCommunicator(std::string peer_id, int fd, Settings settings,
                     std::shared_ptr<EventThreadPool> pool,
                     FrameHandler on_frame, ClosedHandler on_closed);
    ~PeerCommunicator() override;

    PeerCommunicator(const PeerCommunicator&) = delete;
    PeerCommunicator& operator=(const PeerCommunicator&) = delete;

    void start();

    bool enqueue(MessageType type, const std::string& payload) override;
    bool sendText(const std::string& text);
    bool sendCommand(const std::string& command, const std::string& args = "");

    // Idempotent. Safe from any thread, including the reader and writer.
    void close(const std::string& reason);

    // Joins the reader and writer unless called from one of them.
    void waitStopped();

    const std::string& peerId() const override { return m_peer_id; }
    bool isClosed() const override { return m_closed.load(); }
    size_t pendingFrames() const;

private:
    void readLoop();
    void writeLoop();
    void handleLine(const std::string& line);

    const std::string m_peer_id;
    int m_fd;
    const Settings m_settings;
    std::shared_ptr<EventThreadPool> m_pool;
    FrameHandler m_on_frame;
    ClosedHandler m_on_closed;

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::deque<std::string> m_outbound;

    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_started{false};

    std::mutex m_thread_mutex;
    std::thread m_reader;
    std::thread m_writer;
};

#endif // PEER_COMMUNICATOR_H
