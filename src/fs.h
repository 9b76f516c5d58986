#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace peerlink {

// File existence and type
bool file_exists(const std::string& path);
bool is_file(const std::string& path);

// -1 when the file cannot be stat'ed
int64_t get_file_size(const std::string& path);

// Whole-file helpers
bool create_file(const std::string& path, const std::string& content);
bool create_file_binary(const std::string& path, const void* data, size_t size);
bool read_file_text(const std::string& path, std::string& out);
bool delete_file(const std::string& path);

// Ranged read, fails unless exactly size bytes were read
bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size);

// Path helpers
std::string get_filename_from_path(const std::string& path);
std::string get_file_extension(const std::string& path);  // includes the dot, "" if none

} // namespace peerlink
