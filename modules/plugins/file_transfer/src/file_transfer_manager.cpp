#include "file_transfer_manager.h"
#include "chunk_codec.h"
#include "config_manager.h"
#include "logger.h"
#include "wire_codec.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

namespace {

// Strips directories so a remote name can never escape the download directory.
std::string base_name(const std::string& filename) {
    std::string name = std::filesystem::path(filename).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return "received_file";
    }
    return name;
}

} // namespace

FileTransferManager::Settings FileTransferManager::Settings::fromConfig() {
    const ConfigManager& config = ConfigManager::getInstance();
    Settings settings;
    settings.chunk_size = static_cast<size_t>(std::max(1, config.getFileChunkSize()));
    settings.chunk_delay_ms = std::max(0, config.getFileChunkDelayMs());
    return settings;
}

FileTransferManager::FileTransferManager(Settings settings,
                                         std::shared_ptr<FileStorageSink> storage,
                                         std::shared_ptr<NotificationSink> notifier)
    : m_settings(settings),
      m_storage(std::move(storage)),
      m_notifier(std::move(notifier)),
      m_clock(&wire::now_millis) {
    chunk_codec::ensure_initialized();
}

void FileTransferManager::setClock(std::function<int64_t()> clock) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_clock = std::move(clock);
}

void FileTransferManager::notify(const std::string& message) {
    if (m_notifier) {
        m_notifier->notify(message);
    }
}

std::string FileTransferManager::transferKey(const std::string& peer_id, const std::string& filename) {
    return peer_id + "/" + filename;
}

// ============================================================================
// SENDING
// ============================================================================

std::shared_ptr<std::mutex> FileTransferManager::sendLockFor(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_send_locks_mutex);
    auto& slot = m_send_locks[peer_id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

bool FileTransferManager::sendFile(MessageSender& sender, const std::string& filename,
                                   const std::string& bytes, std::string* error) {
    const std::string peer_id = sender.peerId();
    auto send_lock = sendLockFor(peer_id);
    std::lock_guard<std::mutex> serialized(*send_lock);

    auto abort = [&](const std::string& reason) {
        LOG_ERROR("FT: Sending " + filename + " to " + peer_id + " failed: " + reason);
        sender.enqueue(MessageType::ERROR, "File transfer failed: " + reason);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stats.failed_transfers++;
        }
        notify("File transfer to " + peer_id + " failed: " + reason);
        if (error) *error = reason;
        return false;
    };

    LOG_INFO("FT: Sending " + filename + " (" + formatSize(bytes.size()) + ") to " + peer_id);
    if (!sender.enqueue(MessageType::FILE_START, chunk_codec::format_file_start(filename, bytes.size()))) {
        return abort("connection closed before FILE_START");
    }

    const size_t chunk_size = std::max<size_t>(1, m_settings.chunk_size);
    for (size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
        if (offset > 0 && m_settings.chunk_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_settings.chunk_delay_ms));
        }
        const std::string chunk = bytes.substr(offset, chunk_size);
        if (!sender.enqueue(MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(offset, chunk))) {
            return abort("connection closed at offset " + std::to_string(offset));
        }
    }

    if (!sender.enqueue(MessageType::FILE_END, filename)) {
        return abort("connection closed before FILE_END");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.files_sent++;
        m_stats.bytes_sent += bytes.size();
    }
    LOG_INFO("FT: Queued " + filename + " for " + peer_id);
    notify("File sent: " + filename + " to " + peer_id);
    return true;
}

bool FileTransferManager::sendFileFromPath(MessageSender& sender, const std::string& path, std::string* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const std::string reason = "cannot open " + path;
        LOG_ERROR("FT: " + reason);
        if (error) *error = reason;
        return false;
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        const std::string reason = "read of " + path + " failed";
        LOG_ERROR("FT: " + reason);
        if (error) *error = reason;
        return false;
    }
    return sendFile(sender, base_name(path), bytes, error);
}

// ============================================================================
// RECEIVING
// ============================================================================

void FileTransferManager::on_file_frame(const std::string& peer_id, const wire::Frame& frame) {
    switch (frame.type) {
        case MessageType::FILE_START:
            handleFileStart(peer_id, frame.payload);
            break;
        case MessageType::FILE_CHUNK:
            handleFileChunk(peer_id, frame.payload);
            break;
        case MessageType::FILE_END:
            handleFileEnd(peer_id, frame.payload);
            break;
        default:
            LOG_WARN("FT: Unexpected " + std::string(to_string(frame.type)) + " frame from " + peer_id);
            break;
    }
}

void FileTransferManager::handleFileStart(const std::string& peer_id, const std::string& payload) {
    std::optional<chunk_codec::FileStart> start = chunk_codec::parse_file_start(payload);
    if (!start) {
        LOG_WARN("FT: Malformed FILE_START from " + peer_id + ": " + payload);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.dropped_frames++;
        return;
    }

    const std::string key = transferKey(peer_id, start->filename);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_incoming.count(key)) {
            LOG_WARN("FT: Restarting transfer " + key);
        }
        IncomingTransfer transfer;
        transfer.transfer_key = key;
        transfer.peer_id = peer_id;
        transfer.filename = start->filename;
        transfer.declared_size = start->declared_size;
        transfer.started_at = std::chrono::steady_clock::now();
        m_incoming[key] = std::move(transfer);

        auto& open = m_open_by_peer[peer_id];
        open.erase(std::remove(open.begin(), open.end(), key), open.end());
        open.push_back(key);
    }

    LOG_INFO("FT: Receiving " + start->filename + " (" + std::to_string(start->declared_size) +
             " bytes) from " + peer_id);
    notify("Starting file transfer: " + start->filename + " (" + formatSize(start->declared_size) +
           ") from " + peer_id);
}

void FileTransferManager::handleFileChunk(const std::string& peer_id, const std::string& payload) {
    std::optional<chunk_codec::FileChunk> chunk = chunk_codec::parse_file_chunk(payload);
    if (!chunk) {
        LOG_WARN("FT: Malformed FILE_CHUNK from " + peer_id + " dropped");
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.dropped_frames++;
        return;
    }
    if (chunk->declared_length != chunk->data.size()) {
        LOG_DEBUG("FT: Chunk at " + std::to_string(chunk->offset) + " declares " +
                  std::to_string(chunk->declared_length) + " bytes, carries " +
                  std::to_string(chunk->data.size()));
    }

    std::string progress_message;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto open = m_open_by_peer.find(peer_id);
        if (open == m_open_by_peer.end() || open->second.empty()) {
            LOG_WARN("FT: FILE_CHUNK from " + peer_id + " without an open transfer");
            m_stats.dropped_frames++;
            return;
        }
        IncomingTransfer& transfer = m_incoming[open->second.back()];

        transfer.received_bytes += chunk->data.size();
        transfer.chunks[chunk->offset] = std::move(chunk->data);

        const int bucket = progressBucket(transfer.received_bytes, transfer.declared_size);
        if (bucket > transfer.last_progress_bucket) {
            transfer.last_progress_bucket = bucket;
            progress_message = "Receiving " + transfer.filename + " from " + peer_id + ": " +
                               std::to_string(bucket * PROGRESS_BUCKET_PERCENT) + "%";
        }
    }

    if (!progress_message.empty()) {
        LOG_INFO("FT: " + progress_message);
        notify(progress_message);
    }
}

void FileTransferManager::handleFileEnd(const std::string& peer_id, const std::string& payload) {
    IncomingTransfer transfer;
    int64_t now_ms = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(transferKey(peer_id, payload));
        if (it == m_incoming.end()) {
            LOG_WARN("FT: FILE_END for unknown transfer " + payload + " from " + peer_id);
            m_stats.dropped_frames++;
            return;
        }
        transfer = std::move(it->second);
        m_incoming.erase(it);

        auto open = m_open_by_peer.find(peer_id);
        if (open != m_open_by_peer.end()) {
            auto& keys = open->second;
            keys.erase(std::remove(keys.begin(), keys.end(), transfer.transfer_key), keys.end());
            if (keys.empty()) {
                m_open_by_peer.erase(open);
            }
        }
        now_ms = m_clock();
    }

    std::string assembled;
    assembled.reserve(static_cast<size_t>(transfer.received_bytes));
    for (const auto& chunk : transfer.chunks) {
        assembled.append(chunk.second);
    }
    if (transfer.declared_size != 0 && assembled.size() != transfer.declared_size) {
        LOG_WARN("FT: " + transfer.filename + " from " + peer_id + " assembled " +
                 std::to_string(assembled.size()) + " of " + std::to_string(transfer.declared_size) +
                 " declared bytes, writing what arrived");
    }

    const std::string final_name = finalFileName(base_name(transfer.filename), now_ms);
    std::string stored_path;
    std::string error = "no storage configured";
    if (!m_storage || !m_storage->store(final_name, assembled, stored_path, error)) {
        LOG_ERROR("FT: Saving " + final_name + " from " + peer_id + " failed: " + error);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stats.failed_transfers++;
        }
        notify("Error saving file from " + peer_id + ": " + error);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.files_received++;
        m_stats.bytes_received += assembled.size();
    }
    LOG_INFO("FT: Saved " + transfer.filename + " from " + peer_id + " as " + stored_path);
    notify("File received: " + final_name + " from " + peer_id);
}

size_t FileTransferManager::discardTransfers(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto open = m_open_by_peer.find(peer_id);
    if (open == m_open_by_peer.end()) {
        return 0;
    }
    const size_t count = open->second.size();
    for (const auto& key : open->second) {
        m_incoming.erase(key);
    }
    m_open_by_peer.erase(open);
    m_stats.failed_transfers += count;
    LOG_WARN("FT: Discarded " + std::to_string(count) + " unfinished transfer(s) from " + peer_id);
    return count;
}

size_t FileTransferManager::activeTransferCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_incoming.size();
}

std::vector<std::string> FileTransferManager::activeTransferKeys() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> keys;
    for (const auto& entry : m_incoming) {
        keys.push_back(entry.first);
    }
    return keys;
}

TransferStats FileTransferManager::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

// ============================================================================
// HELPERS
// ============================================================================

std::string FileTransferManager::finalFileName(const std::string& filename, int64_t epoch_ms) {
    const std::string suffix = "_" + std::to_string(epoch_ms);
    const size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return filename + suffix;
    }
    return filename.substr(0, dot) + suffix + filename.substr(dot);
}

std::string FileTransferManager::formatSize(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    }
    return buffer;
}

int FileTransferManager::progressBucket(uint64_t received, uint64_t declared) {
    if (declared == 0) {
        return 0;
    }
    const uint64_t percent = received * 100 / declared;
    return static_cast<int>(std::min<uint64_t>(MAX_PROGRESS_BUCKET, percent / PROGRESS_BUCKET_PERCENT));
}
