#pragma once

#include "checksum_error.hpp"
#include "country_registry.hpp"
#include <string>

namespace duckdb {
namespace finid {
namespace checksum {

// Fields of a SEPA creditor identifier: CC PP BBB NNN...
struct CreditorIdParts {
    std::string country_code;    // 2 letters
    std::string check_digits;    // 2 digits
    std::string business_area;   // 3 characters, not covered by the checksum
    std::string national_id;     // Remainder
};

// SEPA creditor identifier validation and generation (MOD 97-10 without the business area)
class CreditorIdEngine {
public:
    // Remove whitespace and uppercase
    static std::string Normalize(const std::string& creditor_id);

    // "DE98 ZZZ 0999 9999 999" style grouping
    static std::string Format(const std::string& creditor_id, const std::string& separator = " ");

    // At least 8 characters, ^[A-Z]{2}[0-9]{2}[A-Z0-9]{3,}$ ignoring case
    static bool IsWellFormed(const std::string& value);

    static ChecksumError Check(const std::string& creditor_id);
    static bool Validate(const std::string& creditor_id);

    // DE + 2 check digits + 3 business area + 11 digit national id, checksum verified
    static bool IsGerman(const std::string& creditor_id);

    // 98 - Modulo97(national_id + country + "00"), zero padded.
    // Throws ChecksumException(MALFORMED_INPUT) for a bad country or national id.
    static std::string CalculateCheckDigits(const std::string& country, const std::string& national_id);

    // Throws ChecksumException when the country is malformed or unregistered,
    // the national id is empty or not alphanumeric, or the result has the wrong length
    static std::string Generate(const std::string& country, const std::string& business_area,
                                const std::string& national_id);
    static std::string Generate(const CountryCode& country, const std::string& business_area,
                                const std::string& national_id);

    // Accessors are total: false when the normalized input is too short
    static bool ExtractCountryCode(const std::string& creditor_id, std::string& country);
    static bool ExtractCheckDigits(const std::string& creditor_id, std::string& check_digits);
    static bool ExtractBusinessArea(const std::string& creditor_id, std::string& business_area);
    static bool ExtractNationalId(const std::string& creditor_id, std::string& national_id);
    static bool Decompose(const std::string& creditor_id, CreditorIdParts& parts);

    static bool MatchesCountry(const std::string& creditor_id, const CountryCode& country);

    // Registered total length for a country
    static bool ExpectedLength(const std::string& country, size_t& length);
};

} // namespace checksum
} // namespace finid
} // namespace duckdb
