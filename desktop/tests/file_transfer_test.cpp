#include "file_transfer_manager.h"
#include "chunk_codec.h"
#include "logger.h"
#include "wire_codec.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static const int64_t kFixedClock = 1700000000000;

// Records frames instead of writing them to a socket. Closes after `accept_limit` frames.
class RecordingSender : public MessageSender {
public:
    explicit RecordingSender(std::string peer_id, size_t accept_limit = SIZE_MAX)
        : peer_id_(std::move(peer_id)), accept_limit_(accept_limit) {}

    bool enqueue(MessageType type, const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.size() >= accept_limit_) {
            closed_ = true;
            return false;
        }
        frames_.emplace_back(type, payload);
        return true;
    }
    const std::string& peerId() const override { return peer_id_; }
    bool isClosed() const override { return closed_; }

    std::vector<std::pair<MessageType, std::string>> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    std::string peer_id_;
    size_t accept_limit_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::vector<std::pair<MessageType, std::string>> frames_;
};

class MemorySink : public FileStorageSink {
public:
    bool store(const std::string& filename, const std::string& bytes,
               std::string& stored_path, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (!fail_with.empty()) {
            error = fail_with;
            return false;
        }
        files[filename] = bytes;
        stored_path = "/mem/" + filename;
        return true;
    }

    std::mutex mutex;
    std::string fail_with;
    std::map<std::string, std::string> files;
};

class RecordingNotifier : public NotificationSink {
public:
    void notify(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(message);
    }
    bool contains(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& m : messages) {
            if (m == text) return true;
        }
        return false;
    }

    std::mutex mutex;
    std::vector<std::string> messages;
};

struct Fixture {
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
    FileTransferManager manager;

    explicit Fixture(size_t chunk_size = 4, int delay_ms = 0)
        : manager(FileTransferManager::Settings{chunk_size, delay_ms}, sink, notifier) {
        manager.setClock([]() { return kFixedClock; });
    }

    void deliver(const std::string& peer, MessageType type, const std::string& payload) {
        auto frame = wire::decode_frame(wire::encode_frame(type, payload));
        manager.on_file_frame(peer, *frame);
    }
};

static std::string random_bytes(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out(n, '\0');
    for (auto& c : out) c = static_cast<char>(dist(rng));
    return out;
}

static bool test_sender_framing() {
    Fixture f(4, 0);
    RecordingSender sender("peerA");
    TEST_ASSERT(f.manager.sendFile(sender, "notes.txt", "abcdefghij"), "sendFile failed");

    const auto frames = sender.frames();
    TEST_ASSERT(frames.size() == 5, "expected START + 3 chunks + END, got " << frames.size());
    TEST_ASSERT(frames[0].first == MessageType::FILE_START && frames[0].second == "notes.txt|10", "bad FILE_START");
    TEST_ASSERT(frames[1].second == "0|4|" + chunk_codec::base64_encode("abcd"), "bad chunk 0");
    TEST_ASSERT(frames[2].second == "4|4|" + chunk_codec::base64_encode("efgh"), "bad chunk 1");
    TEST_ASSERT(frames[3].second == "8|2|" + chunk_codec::base64_encode("ij"), "bad last chunk");
    TEST_ASSERT(frames[4].first == MessageType::FILE_END && frames[4].second == "notes.txt", "bad FILE_END");

    const TransferStats stats = f.manager.getStats();
    TEST_ASSERT(stats.files_sent == 1 && stats.bytes_sent == 10, "send stats not updated");
    TEST_ASSERT(f.notifier->contains("File sent: notes.txt to peerA"), "missing sent notification");
    return true;
}

static bool test_sender_pacing() {
    Fixture f(4, 20);
    RecordingSender sender("peerA");
    const auto start = std::chrono::steady_clock::now();
    TEST_ASSERT(f.manager.sendFile(sender, "paced.bin", std::string(16, 'x')), "sendFile failed");
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    // 4 chunks, a delay between consecutive chunks
    TEST_ASSERT(elapsed >= 60, "chunks were not paced, elapsed " << elapsed << "ms");
    return true;
}

static bool test_sender_abort_on_close() {
    Fixture f(4, 0);
    RecordingSender sender("peerA", 2);
    std::string error;
    TEST_ASSERT(!f.manager.sendFile(sender, "big.bin", std::string(40, 'x'), &error), "send should fail");
    TEST_ASSERT(error.find("connection closed") != std::string::npos, "unexpected error: " << error);
    TEST_ASSERT(f.manager.getStats().failed_transfers == 1, "failure not counted");
    TEST_ASSERT(f.manager.getStats().files_sent == 0, "aborted file counted as sent");
    return true;
}

static bool test_end_to_end_roundtrip() {
    Fixture sender_side(1000, 0);
    Fixture receiver(1000, 0);
    RecordingSender sender("laptop");
    const std::string data = random_bytes(10 * 1024 + 17, 7);

    TEST_ASSERT(sender_side.manager.sendFile(sender, "photo.jpg", data), "sendFile failed");
    for (const auto& frame : sender.frames()) {
        receiver.deliver("laptop", frame.first, frame.second);
    }

    auto it = receiver.sink->files.find("photo_1700000000000.jpg");
    TEST_ASSERT(it != receiver.sink->files.end(), "file not stored under the timestamped name");
    TEST_ASSERT(it->second == data, "content mismatch");
    TEST_ASSERT(receiver.manager.activeTransferCount() == 0, "transfer not finalized");
    TEST_ASSERT(receiver.notifier->contains("File received: photo_1700000000000.jpg from laptop"),
                "missing received notification");
    TEST_ASSERT(receiver.notifier->contains("Starting file transfer: photo.jpg (10.0 KB) from laptop"),
                "missing start notification");
    return true;
}

static bool test_out_of_order_reassembly() {
    Fixture f;
    f.deliver("p", MessageType::FILE_START, "data.bin|12");
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(8, "IJKL"));
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "ABCD"));
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(4, "EFGH"));
    f.deliver("p", MessageType::FILE_END, "data.bin");

    TEST_ASSERT(f.sink->files["data_1700000000000.bin"] == "ABCDEFGHIJKL", "chunks not ordered by offset");
    return true;
}

static bool test_duplicate_chunk_overwrites() {
    Fixture f;
    f.deliver("p", MessageType::FILE_START, "dup.txt|8");
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "AAAA"));
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "BBBB"));
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(4, "CCCC"));
    f.deliver("p", MessageType::FILE_END, "dup.txt");

    TEST_ASSERT(f.sink->files["dup_1700000000000.txt"] == "BBBBCCCC", "later chunk should win");
    return true;
}

static bool test_gap_writes_what_arrived() {
    Fixture f;
    f.deliver("p", MessageType::FILE_START, "gappy.bin|12");
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "AAAA"));
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(8, "CCCC"));
    f.deliver("p", MessageType::FILE_END, "gappy.bin");

    auto it = f.sink->files.find("gappy_1700000000000.bin");
    TEST_ASSERT(it != f.sink->files.end(), "gapped file should still be written");
    TEST_ASSERT(it->second == "AAAACCCC", "expected present chunks in offset order, got " << it->second);
    TEST_ASSERT(f.manager.getStats().files_received == 1, "gapped file not counted");
    return true;
}

static bool test_concurrent_peers() {
    Fixture f;
    f.deliver("alice", MessageType::FILE_START, "same.txt|8");
    f.deliver("bob", MessageType::FILE_START, "same.txt|8");
    f.deliver("alice", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "aaaa"));
    f.deliver("bob", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "bbbb"));
    f.deliver("bob", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(4, "BBBB"));
    f.deliver("alice", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(4, "AAAA"));

    TEST_ASSERT(f.manager.activeTransferCount() == 2, "expected one transfer per peer");

    f.manager.setClock([]() { return kFixedClock + 1; });
    f.deliver("alice", MessageType::FILE_END, "same.txt");
    f.manager.setClock([]() { return kFixedClock + 2; });
    f.deliver("bob", MessageType::FILE_END, "same.txt");

    TEST_ASSERT(f.sink->files["same_1700000000001.txt"] == "aaaaAAAA", "alice's file mixed up");
    TEST_ASSERT(f.sink->files["same_1700000000002.txt"] == "bbbbBBBB", "bob's file mixed up");
    return true;
}

static bool test_chunks_follow_latest_transfer() {
    Fixture f;
    f.deliver("p", MessageType::FILE_START, "first.txt|4");
    f.deliver("p", MessageType::FILE_START, "second.txt|4");
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "2222"));
    f.deliver("p", MessageType::FILE_END, "second.txt");

    TEST_ASSERT(f.sink->files["second_1700000000000.txt"] == "2222", "chunk not routed to newest transfer");
    TEST_ASSERT(f.manager.activeTransferCount() == 1, "first transfer should still be open");
    return true;
}

static bool test_malformed_frames_dropped() {
    Fixture f;
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "orphan"));
    f.deliver("p", MessageType::FILE_START, "ok.txt|4");
    f.deliver("p", MessageType::FILE_CHUNK, "not-a-chunk");
    f.deliver("p", MessageType::FILE_CHUNK, "x|4|QUJDRA==");
    f.deliver("p", MessageType::FILE_CHUNK, "0|4|%%%not base64%%%");
    f.deliver("p", MessageType::FILE_START, "no-size-separator");
    f.deliver("p", MessageType::FILE_END, "never-started.txt");

    TEST_ASSERT(f.manager.getStats().dropped_frames == 6,
                "expected 6 dropped frames, got " << f.manager.getStats().dropped_frames);

    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "good"));
    f.deliver("p", MessageType::FILE_END, "ok.txt");
    TEST_ASSERT(f.sink->files["ok_1700000000000.txt"] == "good", "valid transfer broken by bad frames");
    return true;
}

static bool test_progress_notifications() {
    Fixture f;
    f.deliver("p", MessageType::FILE_START, "hundred.bin|100");
    for (uint64_t offset = 0; offset < 100; offset += 10) {
        f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(offset, std::string(10, 'z')));
    }

    int progress = 0;
    for (const auto& m : f.notifier->messages) {
        if (m.rfind("Receiving hundred.bin from p: ", 0) == 0) progress++;
    }
    TEST_ASSERT(progress == 4, "expected 4 progress notifications, got " << progress);
    TEST_ASSERT(f.notifier->contains("Receiving hundred.bin from p: 25%"), "missing 25%");
    TEST_ASSERT(f.notifier->contains("Receiving hundred.bin from p: 100%"), "missing 100%");

    TEST_ASSERT(FileTransferManager::progressBucket(0, 0) == 0, "zero declared size");
    TEST_ASSERT(FileTransferManager::progressBucket(24, 100) == 0, "24%");
    TEST_ASSERT(FileTransferManager::progressBucket(99, 100) == 3, "99%");
    TEST_ASSERT(FileTransferManager::progressBucket(250, 100) == 4, "over 100% must clamp");
    return true;
}

static bool test_final_file_name() {
    TEST_ASSERT(FileTransferManager::finalFileName("photo.jpg", 5) == "photo_5.jpg", "simple extension");
    TEST_ASSERT(FileTransferManager::finalFileName("README", 5) == "README_5", "no extension");
    TEST_ASSERT(FileTransferManager::finalFileName("archive.tar.gz", 5) == "archive.tar_5.gz", "last dot wins");
    TEST_ASSERT(FileTransferManager::finalFileName(".bashrc", 5) == ".bashrc_5", "leading dot is not an extension");

    Fixture f;
    f.deliver("p", MessageType::FILE_START, "../../etc/passwd|4");
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "root"));
    f.deliver("p", MessageType::FILE_END, "../../etc/passwd");
    TEST_ASSERT(f.sink->files.count("passwd_1700000000000"), "path components not stripped");
    return true;
}

static bool test_sink_failure_reported() {
    Fixture f;
    f.sink->fail_with = "disk full";
    f.deliver("p", MessageType::FILE_START, "x.txt|4");
    f.deliver("p", MessageType::FILE_CHUNK, chunk_codec::format_file_chunk(0, "abcd"));
    f.deliver("p", MessageType::FILE_END, "x.txt");

    TEST_ASSERT(f.notifier->contains("Error saving file from p: disk full"), "storage error not reported");
    TEST_ASSERT(f.manager.getStats().failed_transfers == 1, "failure not counted");
    TEST_ASSERT(f.manager.activeTransferCount() == 0, "failed transfer should be released");
    return true;
}

static bool test_discard_on_disconnect() {
    Fixture f;
    f.deliver("gone", MessageType::FILE_START, "a.txt|10");
    f.deliver("gone", MessageType::FILE_START, "b.txt|10");
    f.deliver("stays", MessageType::FILE_START, "c.txt|10");

    TEST_ASSERT(f.manager.discardTransfers("gone") == 2, "expected 2 discarded transfers");
    TEST_ASSERT(f.manager.discardTransfers("gone") == 0, "second discard should be a no-op");
    const auto keys = f.manager.activeTransferKeys();
    TEST_ASSERT(keys.size() == 1 && keys[0] == "stays/c.txt", "other peer's transfer touched");
    return true;
}

static bool test_format_size() {
    TEST_ASSERT(FileTransferManager::formatSize(512) == "512 B", "bytes");
    TEST_ASSERT(FileTransferManager::formatSize(2048) == "2.0 KB", "kilobytes");
    TEST_ASSERT(FileTransferManager::formatSize(5ull * 1024 * 1024) == "5.0 MB", "megabytes");
    TEST_ASSERT(FileTransferManager::formatSize(3ull * 1024 * 1024 * 1024) == "3.0 GB", "gigabytes");
    return true;
}

static bool test_base64_has_no_line_breaks() {
    const std::string encoded = chunk_codec::base64_encode(random_bytes(4096, 3));
    TEST_ASSERT(encoded.find('\n') == std::string::npos, "base64 must not contain newlines");
    auto decoded = chunk_codec::base64_decode(encoded);
    TEST_ASSERT(decoded && *decoded == random_bytes(4096, 3), "base64 did not restore bytes");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    std::cout << "--- FileTransferManager tests ---" << std::endl;

    if (test_sender_framing()) std::cout << "PASS: sender framing" << std::endl;
    if (test_sender_pacing()) std::cout << "PASS: sender pacing" << std::endl;
    if (test_sender_abort_on_close()) std::cout << "PASS: sender abort on close" << std::endl;
    if (test_end_to_end_roundtrip()) std::cout << "PASS: end-to-end transfer" << std::endl;
    if (test_out_of_order_reassembly()) std::cout << "PASS: out-of-order reassembly" << std::endl;
    if (test_duplicate_chunk_overwrites()) std::cout << "PASS: duplicate chunk overwrites" << std::endl;
    if (test_gap_writes_what_arrived()) std::cout << "PASS: gap writes what arrived" << std::endl;
    if (test_concurrent_peers()) std::cout << "PASS: concurrent peers" << std::endl;
    if (test_chunks_follow_latest_transfer()) std::cout << "PASS: chunks follow latest transfer" << std::endl;
    if (test_malformed_frames_dropped()) std::cout << "PASS: malformed frames dropped" << std::endl;
    if (test_progress_notifications()) std::cout << "PASS: progress notifications" << std::endl;
    if (test_final_file_name()) std::cout << "PASS: final file name" << std::endl;
    if (test_sink_failure_reported()) std::cout << "PASS: sink failure reported" << std::endl;
    if (test_discard_on_disconnect()) std::cout << "PASS: discard on disconnect" << std::endl;
    if (test_format_size()) std::cout << "PASS: format size" << std::endl;
    if (test_base64_has_no_line_breaks()) std::cout << "PASS: base64 without line breaks" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
