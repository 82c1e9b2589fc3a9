#pragma once

#include <string>
#include <vector>

namespace duckdb {
namespace finid {
namespace checksum {

// String utilities
std::string trim(const std::string& str);
std::string to_upper(const std::string& str);
std::string remove_spaces(const std::string& str);
std::string remove_whitespace(const std::string& str);
std::string keep_digits(const std::string& str);
std::string left_pad(const std::string& str, size_t width, char fill);

// Character classification helpers (ASCII only)
bool is_digit_char(char c);
bool is_upper_char(char c);
bool is_alpha_char(char c);
bool is_alnum_char(char c);

// Whole-string checks
bool all_digits(const std::string& str);
bool all_upper_alnum(const std::string& str);

// Split into consecutive chunks of at most `size` characters
std::vector<std::string> chunk_string(const std::string& str, size_t size);
std::string join_strings(const std::vector<std::string>& strings, const std::string& separator);

} // namespace checksum
} // namespace finid
} // namespace duckdb
