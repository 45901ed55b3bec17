#ifndef FILE_TRANSFER_MANAGER_H
#define FILE_TRANSFER_MANAGER_H

#include "connection_observer.h"
#include "constants.h"
#include "file_storage_sink.h"
#include "notification_sink.h"
#include "transfer_types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * FILE TRANSFER MODULE
 *
 * Sender: FILE_START, paced FILE_CHUNKs, FILE_END on one connection. The
 * inter-chunk delay is the only flow control.
 *
 * Receiver: one reassembly buffer per (peer, filename). FILE_CHUNK frames carry
 * no filename and belong to the most recently started open transfer of that
 * peer. FILE_END writes whatever was assembled, in offset order, to the sink.
 */
class FileTransferManager : public FileFrameHandler {
public:
    struct Settings {
        size_t chunk_size = DEFAULT_FILE_CHUNK_SIZE;
        int chunk_delay_ms = DEFAULT_FILE_CHUNK_DELAY_MS;

        static Settings fromConfig();
    };

    FileTransferManager(Settings settings,
                        std::shared_ptr<FileStorageSink> storage,
                        std::shared_ptr<NotificationSink> notifier);

    // ==================== SENDING ====================

    /**
     * Sends one file over `sender`. Blocks for the paced duration of the
     * transfer. On failure enqueues a best-effort ERROR frame and returns false.
     */
    bool sendFile(MessageSender& sender, const std::string& filename, const std::string& bytes,
                  std::string* error = nullptr);

    // Reads `path` and sends it under its last path component.
    bool sendFileFromPath(MessageSender& sender, const std::string& path, std::string* error = nullptr);

    // ==================== RECEIVING ====================

    void on_file_frame(const std::string& peer_id, const wire::Frame& frame) override;

    void handleFileStart(const std::string& peer_id, const std::string& payload);
    void handleFileChunk(const std::string& peer_id, const std::string& payload);
    void handleFileEnd(const std::string& peer_id, const std::string& payload);

    // Drops unfinished transfers of a peer (after it disconnected).
    size_t discardTransfers(const std::string& peer_id);

    size_t activeTransferCount() const;
    std::vector<std::string> activeTransferKeys() const;
    TransferStats getStats() const;

    // Wall-clock source for collision-avoiding names (epoch ms).
    void setClock(std::function<int64_t()> clock);

    // ==================== HELPERS ====================

    // "photo.jpg" + 1700000000000 -> "photo_1700000000000.jpg"
    static std::string finalFileName(const std::string& filename, int64_t epoch_ms);
    static std::string formatSize(uint64_t bytes);
    // floor(received * 100 / declared / 25), clamped to [0, 4]; 0 when declared is 0.
    static int progressBucket(uint64_t received, uint64_t declared);

private:
    static std::string transferKey(const std::string& peer_id, const std::string& filename);
    std::shared_ptr<std::mutex> sendLockFor(const std::string& peer_id);
    void notify(const std::string& message);

    const Settings m_settings;
    std::shared_ptr<FileStorageSink> m_storage;
    std::shared_ptr<NotificationSink> m_notifier;
    std::function<int64_t()> m_clock;

    mutable std::mutex m_mutex;
    std::map<std::string, IncomingTransfer> m_incoming;
    std::map<std::string, std::vector<std::string>> m_open_by_peer;   // start order per peer
    TransferStats m_stats;

    std::mutex m_send_locks_mutex;
    std::map<std::string, std::shared_ptr<std::mutex>> m_send_locks;
};

#endif // FILE_TRANSFER_MANAGER_H
