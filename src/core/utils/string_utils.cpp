#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>

namespace hm {
namespace str {

std::string trim(std::string_view s) {
    return trimRight(trimLeft(s));
}

std::string trimLeft(std::string_view s) {
    auto it = std::find_if(s.begin(), s.end(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(it, s.end());
}

std::string trimRight(std::string_view s) {
    auto it = std::find_if(s.rbegin(), s.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(s.begin(), it.base());
}

std::string toLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> result;
    std::string current;

    for (char c : s) {
        if (c == delimiter) {
            if (!current.empty()) {
                result.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        result.push_back(std::move(current));
    }

    return result;
}

std::string join(const std::vector<std::string>& parts, std::string_view delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result.append(delimiter);
        }
        result.append(parts[i]);
    }
    return result;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool isDigits(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parseInt(std::string_view s, int& out) {
    auto result = std::from_chars(s.data(), s.data() + s.size(), out);
    return result.ec == std::errc{} && result.ptr == s.data() + s.size();
}

bool parseInt64(std::string_view s, int64_t& out) {
    auto result = std::from_chars(s.data(), s.data() + s.size(), out);
    return result.ec == std::errc{} && result.ptr == s.data() + s.size();
}

bool parseDouble(std::string_view s, double& out) {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    std::string str(s);
    out = std::strtod(str.c_str(), &end);
    return end == str.c_str() + str.size();
}

std::string formatDecimal(double value, int maxPrecision) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", maxPrecision, value);
    std::string result(buffer);

    auto dot = result.find('.');
    if (dot != std::string::npos) {
        while (!result.empty() && result.back() == '0') {
            result.pop_back();
        }
        if (!result.empty() && result.back() == '.') {
            result.pop_back();
        }
    }
    if (result == "-0") {
        result = "0";
    }
    return result;
}

std::string padRight(std::string_view s, size_t width) {
    std::string result(s);
    if (result.size() < width) {
        result.append(width - result.size(), ' ');
    }
    return result;
}

std::string escapeLike(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '%' || c == '_' || c == '\\') {
            result.push_back('\\');
        }
        result.push_back(c);
    }
    return result;
}

} // namespace str
} // namespace hm
