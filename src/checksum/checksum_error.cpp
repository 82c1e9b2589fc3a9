#include "checksum_error.hpp"

namespace duckdb {
namespace finid {
namespace checksum {

const char* ChecksumErrorToString(ChecksumError error) {
    switch (error) {
        case ChecksumError::NONE:
            return "OK";
        case ChecksumError::INVALID_CHARACTER:
            return "INVALID_CHARACTER";
        case ChecksumError::UNKNOWN_COUNTRY:
            return "UNKNOWN_COUNTRY";
        case ChecksumError::LENGTH_MISMATCH:
            return "LENGTH_MISMATCH";
        case ChecksumError::MALFORMED_INPUT:
            return "MALFORMED_INPUT";
        case ChecksumError::CHECKSUM_MISMATCH:
            return "CHECKSUM_MISMATCH";
    }
    return "UNKNOWN";
}

ChecksumException::ChecksumException(ChecksumError error, const std::string& message)
    : std::runtime_error(message), error_(error) {
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
