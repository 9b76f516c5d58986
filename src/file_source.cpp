#include "file_source.h"
#include "fs.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace peerlink {

std::unique_ptr<DiskFileSource> DiskFileSource::open(const std::string& path) {
    if (!file_exists(path) || !is_file(path)) {
        LOG_ERROR("transfer", "Not a regular file: " << path);
        return nullptr;
    }

    int64_t size = get_file_size(path);
    if (size < 0) {
        LOG_ERROR("transfer", "Failed to get size of " << path);
        return nullptr;
    }

    FileInfo info;
    info.name = get_filename_from_path(path);
    info.size = static_cast<uint64_t>(size);
    info.type = guess_mime_type(path);
    return std::unique_ptr<DiskFileSource>(new DiskFileSource(path, std::move(info)));
}

bool DiskFileSource::read(uint64_t offset, size_t length, std::vector<uint8_t>& out) const {
    if (offset > info_.size || length > info_.size - offset) {
        return false;
    }
    out.resize(length);
    if (length == 0) {
        return true;
    }
    return read_file_chunk(path_, offset, out.data(), length);
}

MemoryFileSource::MemoryFileSource(std::string name, std::string type, std::vector<uint8_t> data)
    : name_(std::move(name)), type_(std::move(type)), data_(std::move(data)) {
}

FileInfo MemoryFileSource::info() const {
    FileInfo info;
    info.name = name_;
    info.size = data_.size();
    info.type = type_;
    return info;
}

bool MemoryFileSource::read(uint64_t offset, size_t length, std::vector<uint8_t>& out) const {
    if (offset > data_.size() || length > data_.size() - offset) {
        return false;
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    out.assign(first, first + static_cast<std::ptrdiff_t>(length));
    return true;
}

std::string guess_mime_type(const std::string& path) {
    std::string extension = get_file_extension(path);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".json", "application/json"},
        {".html", "text/html"},
        {".pdf", "application/pdf"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".zip", "application/zip"},
        {".tar", "application/x-tar"},
        {".gz", "application/gzip"},
        {".charx", "application/zip"}
    };

    auto it = mime_types.find(extension);
    return (it != mime_types.end()) ? it->second : "application/octet-stream";
}

} // namespace peerlink
