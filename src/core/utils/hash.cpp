#include "hash.h"

#include <iomanip>
#include <sstream>

#include "file_utils.h"

namespace hm {
namespace hash {

// FNV-1a constants
constexpr u64 FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr u64 FNV_PRIME = 1099511628211ULL;

u64 computeBytes(const void* data, usize size) {
    u64 hash = FNV_OFFSET_BASIS;
    const u8* bytes = static_cast<const u8*>(data);

    for (usize i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= FNV_PRIME;
    }

    return hash;
}

std::string computeFile(const Path& path) {
    auto data = file::readBinary(path);
    if (!data) {
        return "";
    }

    return toHex(computeBytes(data->data(), data->size()));
}

std::string computeBuffer(const ByteBuffer& buffer) {
    return toHex(computeBytes(buffer.data(), buffer.size()));
}

std::string toHex(u64 hash) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << hash;
    return ss.str();
}

}  // namespace hash
}  // namespace hm
