#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace duckdb {
namespace finid {
namespace checksum {

std::string trim(const std::string& str) {
    if (str.empty()) return str;

    size_t start = 0;
    size_t end = str.length() - 1;

    while (start <= end && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }
    if (start > end) {
        return "";
    }

    while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
        end--;
    }

    return str.substr(start, end - start + 1);
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string remove_spaces(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (c != ' ') {
            result += c;
        }
    }
    return result;
}

std::string remove_whitespace(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    return result;
}

std::string keep_digits(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (is_digit_char(c)) {
            result += c;
        }
    }
    return result;
}

std::string left_pad(const std::string& str, size_t width, char fill) {
    if (str.length() >= width) {
        return str;
    }
    return std::string(width - str.length(), fill) + str;
}

// std::isdigit and friends are locale dependent; identifiers are plain ASCII
bool is_digit_char(char c) {
    return c >= '0' && c <= '9';
}

bool is_upper_char(char c) {
    return c >= 'A' && c <= 'Z';
}

bool is_alpha_char(char c) {
    return is_upper_char(c) || (c >= 'a' && c <= 'z');
}

bool is_alnum_char(char c) {
    return is_alpha_char(c) || is_digit_char(c);
}

bool all_digits(const std::string& str) {
    return std::all_of(str.begin(), str.end(), is_digit_char);
}

bool all_upper_alnum(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](char c) { return is_upper_char(c) || is_digit_char(c); });
}

std::vector<std::string> chunk_string(const std::string& str, size_t size) {
    std::vector<std::string> chunks;
    for (size_t i = 0; i < str.length(); i += size) {
        chunks.push_back(str.substr(i, size));
    }
    return chunks;
}

std::string join_strings(const std::vector<std::string>& strings, const std::string& separator) {
    if (strings.empty()) return "";

    std::ostringstream result;
    result << strings[0];

    for (size_t i = 1; i < strings.size(); i++) {
        result << separator << strings[i];
    }

    return result.str();
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
