#ifndef TRANSFER_TYPES_H
#define TRANSFER_TYPES_H

#include <cstdint>
#include <chrono>
#include <map>
#include <string>

/**
 * TRANSFER TYPES
 *
 * Shared by the sender and receiver halves of FileTransferManager.
 */

// Progress is reported in quarter steps: 25%, 50%, 75%, 100%.
constexpr int PROGRESS_BUCKET_PERCENT = 25;
constexpr int MAX_PROGRESS_BUCKET = 100 / PROGRESS_BUCKET_PERCENT;

/**
 * Reassembly buffer for one incoming file, keyed by (peer, filename).
 */
struct IncomingTransfer {
    std::string transfer_key;
    std::string peer_id;
    std::string filename;
    uint64_t declared_size = 0;
    std::map<uint64_t, std::string> chunks;     // offset -> bytes, later writes win
    uint64_t received_bytes = 0;                // running total of inserted chunk lengths
    int last_progress_bucket = 0;
    std::chrono::steady_clock::time_point started_at;
};

struct TransferStats {
    uint64_t files_received = 0;
    uint64_t bytes_received = 0;
    uint64_t files_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t failed_transfers = 0;
    uint64_t dropped_frames = 0;    // malformed or unroutable FILE_* frames
};

#endif // TRANSFER_TYPES_H
