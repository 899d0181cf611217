#include "file_utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.h"

namespace hm {

namespace {

// Helper for filesystem operations that return bool and log on failure.
// The callable receives a std::error_code& and performs the fs operation.
template <typename F> bool fsOp(const char* opName, const Path& path, F&& fn) {
    std::error_code ec;
    fn(ec);
    if (ec) {
        log::errorf("FileIO", "Failed to %s: %s (%s)", opName, path.string().c_str(),
                    ec.message().c_str());
        return false;
    }
    return true;
}

// Two-path variant for move operations.
template <typename F> bool fsOp2(const char* opName, const Path& from, const Path& to, F&& fn) {
    std::error_code ec;
    fn(ec);
    if (ec) {
        log::errorf("FileIO", "Failed to %s %s to %s: %s", opName, from.string().c_str(),
                    to.string().c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool writeStream(const Path& path, std::ios::openmode mode, const char* data, usize size) {
    std::ofstream file(path, mode);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for writing: %s", path.string().c_str());
        return false;
    }

    file.write(data, static_cast<std::streamsize>(size));
    if (!file.good()) {
        log::errorf("FileIO", "Failed to write: %s", path.string().c_str());
        return false;
    }
    return true;
}

} // anonymous namespace

namespace file {

Result<std::string> readText(const Path& path) {
    std::ifstream file(path, std::ios::in);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

Result<ByteBuffer> readBinary(const Path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    auto size = file.tellg();
    if (size < 0) {
        log::errorf("FileIO", "Failed to size: %s", path.string().c_str());
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    ByteBuffer buffer(static_cast<usize>(size));
    if (!buffer.empty() &&
        !file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size))) {
        log::errorf("FileIO", "Failed to read: %s", path.string().c_str());
        return std::nullopt;
    }

    return buffer;
}

bool writeText(const Path& path, std::string_view content) {
    return writeStream(path, std::ios::out | std::ios::trunc, content.data(), content.size());
}

bool appendText(const Path& path, std::string_view content) {
    return writeStream(path, std::ios::out | std::ios::app, content.data(), content.size());
}

bool writeBinary(const Path& path, const ByteBuffer& data) {
    return writeBinary(path, data.data(), data.size());
}

bool writeBinary(const Path& path, const void* data, usize size) {
    return writeStream(path, std::ios::binary | std::ios::out | std::ios::trunc,
                       static_cast<const char*>(data), size);
}

bool exists(const Path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool isFile(const Path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool isDirectory(const Path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool createDirectories(const Path& path) {
    bool result = false;
    fsOp("create directories", path,
         [&](std::error_code& ec) { result = fs::create_directories(path, ec); });
    return result || file::isDirectory(path);
}

bool remove(const Path& path) {
    bool result = false;
    fsOp("remove", path, [&](std::error_code& ec) { result = fs::remove(path, ec); });
    return result;
}

bool move(const Path& from, const Path& to) {
    return fsOp2("move", from, to, [&](std::error_code& ec) { fs::rename(from, to, ec); });
}

Result<u64> getFileSize(const Path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<u64>(size);
}

std::vector<Path> listFiles(const Path& directory) {
    std::vector<Path> files;
    std::error_code ec;

    if (!fs::is_directory(directory, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<Path> listFiles(const Path& directory, const std::string& extension) {
    std::vector<Path> files;
    for (const auto& path : listFiles(directory)) {
        if (getExtension(path) == extension) {
            files.push_back(path);
        }
    }
    return files;
}

std::string getExtension(const Path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace file
} // namespace hm
