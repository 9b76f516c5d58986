#pragma once

#include "transfer_messages.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace peerlink {

/**
 * Read-only file handle served by a TransferUploader.
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual FileInfo info() const = 0;

    /**
     * @brief Read [offset, offset + length)
     * @return false if the range cannot be read completely
     */
    virtual bool read(uint64_t offset, size_t length, std::vector<uint8_t>& out) const = 0;
};

class DiskFileSource : public FileSource {
public:
    /**
     * @brief Open a file from disk
     * @return nullptr if the path is not a readable regular file
     */
    static std::unique_ptr<DiskFileSource> open(const std::string& path);

    FileInfo info() const override { return info_; }
    bool read(uint64_t offset, size_t length, std::vector<uint8_t>& out) const override;

    const std::string& path() const { return path_; }

private:
    DiskFileSource(std::string path, FileInfo info) : path_(std::move(path)), info_(std::move(info)) {}

    std::string path_;
    FileInfo info_;
};

class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name, std::string type, std::vector<uint8_t> data);

    FileInfo info() const override;
    bool read(uint64_t offset, size_t length, std::vector<uint8_t>& out) const override;

private:
    std::string name_;
    std::string type_;
    std::vector<uint8_t> data_;
};

// MIME type by file extension, application/octet-stream when unknown
std::string guess_mime_type(const std::string& path);

} // namespace peerlink
