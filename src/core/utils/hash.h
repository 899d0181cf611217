#pragma once

#include "../types.h"

#include <string>

namespace hm {

// Content hashes used to detect unchanged documents before rewriting them
namespace hash {

// Compute hash of raw bytes (FNV-1a)
u64 computeBytes(const void* data, usize size);

// Compute hash of a file; empty string when the file cannot be read
std::string computeFile(const Path& path);

// Compute hash of a byte buffer (returns hex string)
std::string computeBuffer(const ByteBuffer& buffer);

// Convert hash to hex string
std::string toHex(u64 hash);

}  // namespace hash
}  // namespace hm
