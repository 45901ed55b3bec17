#include "file_storage_sink.h"
#include "logger.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

DirectoryFileSink::DirectoryFileSink(std::string directory)
    : m_directory(std::move(directory)) {}

bool DirectoryFileSink::store(const std::string& filename, const std::string& bytes,
                              std::string& stored_path, std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        error = "cannot create " + m_directory + ": " + ec.message();
        return false;
    }

    const fs::path target = fs::path(m_directory) / filename;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "cannot open " + target.string() + " for writing";
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        error = "write to " + target.string() + " failed";
        return false;
    }

    stored_path = target.string();
    LOG_DEBUG("FT: Stored " + std::to_string(bytes.size()) + " bytes at " + stored_path);
    return true;
}
