#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace hm {
namespace file {

// Read entire file to string
Result<std::string> readText(const Path& path);

// Read entire file to bytes
Result<ByteBuffer> readBinary(const Path& path);

// Write string to file
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

// Append string to file, creating it when missing
[[nodiscard]] bool appendText(const Path& path, std::string_view content);

// Write bytes to file
[[nodiscard]] bool writeBinary(const Path& path, const ByteBuffer& data);
[[nodiscard]] bool writeBinary(const Path& path, const void* data, usize size);

// File operations
bool exists(const Path& path);
bool isFile(const Path& path);
bool isDirectory(const Path& path);
[[nodiscard]] bool createDirectories(const Path& path);
[[nodiscard]] bool remove(const Path& path);
[[nodiscard]] bool move(const Path& from, const Path& to);

// Get file size in bytes
Result<u64> getFileSize(const Path& path);

// List regular files in directory, sorted by name
std::vector<Path> listFiles(const Path& directory);
std::vector<Path> listFiles(const Path& directory, const std::string& extension);

// Get file extension (lowercase, without dot)
std::string getExtension(const Path& path);

} // namespace file
} // namespace hm
