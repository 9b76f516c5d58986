#include "fs.h"
#include "logger.h"

#include <cstdio>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace peerlink {

bool file_exists(const std::string& path) {
    return !path.empty() && access(path.c_str(), F_OK) == 0;
}

bool is_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISREG(st.st_mode);
    }
    return false;
}

int64_t get_file_size(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return static_cast<int64_t>(st.st_size);
    }
    return -1;
}

bool create_file(const std::string& path, const std::string& content) {
    return create_file_binary(path, content.data(), content.size());
}

bool create_file_binary(const std::string& path, const void* data, size_t size) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("fs", "Failed to create file: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    size_t written = (data && size > 0) ? fwrite(data, 1, size, file) : 0;
    bool closed = fclose(file) == 0;

    if (written != size || !closed) {
        LOG_ERROR("fs", "Failed to write complete data to file: " << path);
        return false;
    }
    return true;
}

bool read_file_text(const std::string& path, std::string& out) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_ERROR("fs", "Failed to open file for reading: " << path);
        return false;
    }

    out.clear();
    char buffer[8192];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        out.append(buffer, n);
    }
    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_ERROR("fs", "Failed to read file: " << path);
        return false;
    }
    return true;
}

bool delete_file(const std::string& path) {
    return remove(path.c_str()) == 0;
}

bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_ERROR("fs", "Failed to open file for chunk read: " << path);
        return false;
    }

    if (fseeko(file, static_cast<off_t>(offset), SEEK_SET) != 0) {
        LOG_ERROR("fs", "Failed to seek to offset " << offset << " in " << path);
        fclose(file);
        return false;
    }

    size_t bytes_read = fread(buffer, 1, size, file);
    fclose(file);

    if (bytes_read != size) {
        LOG_ERROR("fs", "Short read from " << path << ": " << bytes_read << "/" << size << " bytes");
        return false;
    }
    return true;
}

std::string get_filename_from_path(const std::string& path) {
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash == std::string::npos) {
        return path;
    }
    return path.substr(last_slash + 1);
}

std::string get_file_extension(const std::string& path) {
    std::string filename = get_filename_from_path(path);
    size_t last_dot = filename.find_last_of('.');
    if (last_dot == std::string::npos || last_dot == 0) {
        return "";
    }
    return filename.substr(last_dot);
}

} // namespace peerlink
