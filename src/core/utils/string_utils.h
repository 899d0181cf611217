#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hm {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);
std::string trimLeft(std::string_view s);
std::string trimRight(std::string_view s);

// Case conversion
std::string toLower(std::string_view s);

// Split string by delimiter (empty fields are dropped)
std::vector<std::string> split(std::string_view s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, std::string_view delimiter);

// Check prefix
bool startsWith(std::string_view s, std::string_view prefix);

// True if s is non-empty and every character is an ASCII digit
bool isDigits(std::string_view s);

// Parse number from string (whole string must be consumed)
bool parseInt(std::string_view s, int& out);
bool parseInt64(std::string_view s, int64_t& out);
bool parseDouble(std::string_view s, double& out);

// Shortest decimal text for a dimension: 100.0 -> "100", 0.50 -> "0.5"
std::string formatDecimal(double value, int maxPrecision = 3);

// Fixed-width column helpers (pads with spaces, never truncates)
std::string padRight(std::string_view s, size_t width);

// Escape SQL LIKE wildcards (% and _) with backslash
// Use with: WHERE col LIKE ? ESCAPE '\'
std::string escapeLike(std::string_view s);

} // namespace str
} // namespace hm
