#ifndef CONNECTION_OBSERVER_H
#define CONNECTION_OBSERVER_H

#include "message_types.h"
#include "peer.h"
#include "wire_codec.h"

#include <string>

/**
 * Application-facing events of the connection manager.
 * All three are invoked on the event thread pool, keyed by peer id.
 */
class ConnectionObserver {
public:
    virtual ~ConnectionObserver() = default;

    virtual void on_connected(const PeerDescriptor& peer) = 0;
    virtual void on_disconnected(const std::string& peer_id, const std::string& reason) = 0;
    virtual void on_message(const std::string& peer_id, MessageType type, const std::string& payload) = 0;
};

// Consumer of FILE_START / FILE_CHUNK / FILE_END frames.
class FileFrameHandler {
public:
    virtual ~FileFrameHandler() = default;
    virtual void on_file_frame(const std::string& peer_id, const wire::Frame& frame) = 0;
};

// Outbound side of one connection.
class MessageSender {
public:
    virtual ~MessageSender() = default;

    // Never blocks. Returns false once the connection is closed.
    virtual bool enqueue(MessageType type, const std::string& payload) = 0;
    virtual const std::string& peerId() const = 0;
    virtual bool isClosed() const = 0;
};

#endif // CONNECTION_OBSERVER_H
