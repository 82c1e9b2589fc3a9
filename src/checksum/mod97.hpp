#pragma once

#include "checksum_error.hpp"
#include <string>

namespace duckdb {
namespace finid {
namespace checksum {

// ISO 7064 letter transliteration: digits are copied, A..Z (either case)
// become "10".."35". Any other character yields INVALID_CHARACTER and leaves
// `digits` unspecified.
ChecksumError Transliterate(const std::string& input, std::string& digits);

// Remainder of an arbitrarily long decimal digit string modulo 97 (0..96).
// Reduces one digit at a time: r = (r * 10 + d) % 97.
// Non-digit characters are not allowed; callers transliterate first.
int Modulo97(const std::string& digits);

// Luhn (mod 10) check over a string of digits
bool LuhnCheck(const std::string& digits);

// Check digits for `payload` in `country` (two digits, zero padded):
// 98 - Modulo97(Transliterate(payload + country + "00")).
// Throws ChecksumException(INVALID_CHARACTER) for non-alphanumeric input.
std::string CheckDigitsFor(const std::string& country, const std::string& payload);

// Verifies an identifier laid out as country(2) + check digits(2) + ... where
// the checksummed payload starts at `payload_offset`. Characters between
// offset 4 and `payload_offset` are excluded from the checksum.
// Returns NONE, CHECKSUM_MISMATCH, INVALID_CHARACTER or MALFORMED_INPUT
// (identifier shorter than the offset).
ChecksumError VerifyRearranged(const std::string& identifier, size_t payload_offset);

} // namespace checksum
} // namespace finid
} // namespace duckdb
