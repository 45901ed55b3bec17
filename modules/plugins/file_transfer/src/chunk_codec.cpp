#include "chunk_codec.h"
#include "logger.h"

#include <sodium.h>

#include <charconv>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {

constexpr int kBase64Variant = sodium_base64_VARIANT_ORIGINAL;

bool parse_u64(const std::string& text, uint64_t& value) {
    if (text.empty()) return false;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return result.ec == std::errc() && result.ptr == text.data() + text.size();
}

} // namespace

namespace chunk_codec {

void ensure_initialized() {
    static std::once_flag once;
    static int init_result = 0;
    std::call_once(once, []() { init_result = sodium_init(); });
    if (init_result < 0) {
        nativeLog("Libsodium initialization failed!");
        throw std::runtime_error("Libsodium init failed");
    }
}

std::string base64_encode(const std::string& bytes) {
    ensure_initialized();
    const size_t encoded_len = sodium_base64_encoded_len(bytes.size(), kBase64Variant);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(&encoded[0], encoded_len,
                      reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                      kBase64Variant);
    // encoded_len counts the terminating NUL
    encoded.resize(encoded_len - 1);
    return encoded;
}

std::optional<std::string> base64_decode(const std::string& text) {
    ensure_initialized();
    std::vector<unsigned char> decoded(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(), text.data(), text.size(),
                          nullptr, &decoded_len, &end, kBase64Variant) != 0) {
        return std::nullopt;
    }
    if (end != text.data() + text.size()) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(decoded.data()), decoded_len);
}

std::string format_file_start(const std::string& filename, uint64_t size) {
    return filename + "|" + std::to_string(size);
}

std::string format_file_chunk(uint64_t offset, const std::string& bytes) {
    return std::to_string(offset) + "|" + std::to_string(bytes.size()) + "|" + base64_encode(bytes);
}

std::optional<FileStart> parse_file_start(const std::string& payload) {
    const size_t sep = payload.rfind('|');
    if (sep == std::string::npos || sep == 0) {
        return std::nullopt;
    }
    FileStart start;
    start.filename = payload.substr(0, sep);
    if (!parse_u64(payload.substr(sep + 1), start.declared_size)) {
        start.declared_size = 0;
    }
    return start;
}

std::optional<FileChunk> parse_file_chunk(const std::string& payload) {
    const size_t first = payload.find('|');
    if (first == std::string::npos) return std::nullopt;
    const size_t second = payload.find('|', first + 1);
    if (second == std::string::npos) return std::nullopt;
    // Base64 never contains '|', so a fourth field means a malformed chunk.
    if (payload.find('|', second + 1) != std::string::npos) return std::nullopt;

    FileChunk chunk;
    if (!parse_u64(payload.substr(0, first), chunk.offset)) {
        return std::nullopt;
    }
    if (!parse_u64(payload.substr(first + 1, second - first - 1), chunk.declared_length)) {
        chunk.declared_length = 0;
    }
    std::optional<std::string> data = base64_decode(payload.substr(second + 1));
    if (!data) {
        return std::nullopt;
    }
    chunk.data = std::move(*data);
    return chunk;
}

} // namespace chunk_codec
