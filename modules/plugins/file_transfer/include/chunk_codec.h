#ifndef CHUNK_CODEC_H
#define CHUNK_CODEC_H

#include <cstdint>
#include <optional>
#include <string>

/**
 * Payload grammar of the FILE_* frames.
 *
 *   FILE_START  <filename>|<declared-size>
 *   FILE_CHUNK  <offset>|<chunk-length>|<base64 bytes>
 *   FILE_END    <filename>
 *
 * Base64 is the standard padded alphabet with no line breaks (libsodium).
 */
namespace chunk_codec {

struct FileStart {
    std::string filename;
    uint64_t declared_size = 0;
};

struct FileChunk {
    uint64_t offset = 0;
    uint64_t declared_length = 0;
    std::string data;
};

// Initializes libsodium once. Throws std::runtime_error if that fails.
void ensure_initialized();

std::string base64_encode(const std::string& bytes);
std::optional<std::string> base64_decode(const std::string& text);

std::string format_file_start(const std::string& filename, uint64_t size);
std::string format_file_chunk(uint64_t offset, const std::string& bytes);

// Splits at the last '|'. A non-numeric size becomes 0.
std::optional<FileStart> parse_file_start(const std::string& payload);

// nullopt for a wrong field count, a non-numeric offset or invalid base64.
std::optional<FileChunk> parse_file_chunk(const std::string& payload);

} // namespace chunk_codec

#endif // CHUNK_CODEC_H
