#ifndef FILE_STORAGE_SINK_H
#define FILE_STORAGE_SINK_H

#include <mutex>
#include <string>

/**
 * Destination for completed incoming files.
 */
class FileStorageSink {
public:
    virtual ~FileStorageSink() = default;

    // On success stored_path names the written file.
    virtual bool store(const std::string& filename, const std::string& bytes,
                       std::string& stored_path, std::string& error) = 0;
};

// Writes files into one directory, creating it on first use.
class DirectoryFileSink : public FileStorageSink {
public:
    explicit DirectoryFileSink(std::string directory);

    bool store(const std::string& filename, const std::string& bytes,
               std::string& stored_path, std::string& error) override;

    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
    std::mutex m_mutex;
};

#endif // FILE_STORAGE_SINK_H
