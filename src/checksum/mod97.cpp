#include "mod97.hpp"
#include "string_utils.hpp"

namespace duckdb {
namespace finid {
namespace checksum {

ChecksumError Transliterate(const std::string& input, std::string& digits) {
    digits.clear();
    digits.reserve(input.length() * 2);

    for (char c : input) {
        if (is_digit_char(c)) {
            digits += c;
        } else if (is_alpha_char(c)) {
            // A=10, B=11, ..., Z=35
            int value = (c >= 'a' ? c - 'a' : c - 'A') + 10;
            digits += static_cast<char>('0' + value / 10);
            digits += static_cast<char>('0' + value % 10);
        } else {
            return ChecksumError::INVALID_CHARACTER;
        }
    }

    return ChecksumError::NONE;
}

int Modulo97(const std::string& digits) {
    int remainder = 0;
    for (char c : digits) {
        remainder = (remainder * 10 + (c - '0')) % 97;
    }
    return remainder;
}

bool LuhnCheck(const std::string& digits) {
    if (digits.empty()) {
        return false;
    }

    int sum = 0;
    bool double_it = false;

    // Walk from the rightmost digit, doubling every second one
    for (size_t i = digits.length(); i > 0; i--) {
        char c = digits[i - 1];
        if (!is_digit_char(c)) {
            return false;
        }

        int digit = c - '0';
        if (double_it) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_it = !double_it;
    }

    return sum % 10 == 0;
}

std::string CheckDigitsFor(const std::string& country, const std::string& payload) {
    std::string numeric;
    if (Transliterate(payload + country + "00", numeric) != ChecksumError::NONE) {
        throw ChecksumException(ChecksumError::INVALID_CHARACTER,
                                "Cannot compute check digits: '" + payload + "' / '" + country +
                                    "' contains characters other than letters and digits");
    }

    int check = 98 - Modulo97(numeric);
    return left_pad(std::to_string(check), 2, '0');
}

ChecksumError VerifyRearranged(const std::string& identifier, size_t payload_offset) {
    if (payload_offset < 4 || identifier.length() < payload_offset) {
        return ChecksumError::MALFORMED_INPUT;
    }

    // Country and check digits move behind the payload
    std::string rearranged = identifier.substr(payload_offset) + identifier.substr(0, 4);

    std::string numeric;
    ChecksumError error = Transliterate(rearranged, numeric);
    if (error != ChecksumError::NONE) {
        return error;
    }

    return Modulo97(numeric) == 1 ? ChecksumError::NONE : ChecksumError::CHECKSUM_MISMATCH;
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
