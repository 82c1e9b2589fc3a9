#pragma once

#include <stdexcept>
#include <string>

namespace duckdb {
namespace finid {
namespace checksum {

// Result codes for identifier checks
enum class ChecksumError {
    NONE = 0,               // Identifier is valid
    INVALID_CHARACTER = -1, // Character outside [0-9A-Za-z] fed to transliteration
    UNKNOWN_COUNTRY = -2,   // Country not present in the scheme registry
    LENGTH_MISMATCH = -3,   // Length disagrees with the registered length
    MALFORMED_INPUT = -4,   // Structural format check failed
    CHECKSUM_MISMATCH = -5  // Well formed, but the check digits do not verify
};

// Stable name of a result code ("OK" for NONE)
const char* ChecksumErrorToString(ChecksumError error);

// Thrown by the generate operations, which never return a malformed identifier
class ChecksumException : public std::runtime_error {
public:
    ChecksumException(ChecksumError error, const std::string& message);

    ChecksumError GetError() const { return error_; }

private:
    ChecksumError error_;
};

} // namespace checksum
} // namespace finid
} // namespace duckdb
