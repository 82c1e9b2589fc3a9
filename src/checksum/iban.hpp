#pragma once

#include "bank_directory.hpp"
#include "checksum_error.hpp"
#include "country_registry.hpp"
#include <string>
#include <utility>
#include <vector>

namespace duckdb {
namespace finid {
namespace checksum {

// German bank code / account number pair
struct GermanAccount {
    std::string blz;   // 8-digit bank code
    std::string kto;   // 10-digit account number
};

// IBAN split into its fixed parts plus the country's named BBAN fields
struct IbanComponents {
    std::string country_code;
    std::string check_digits;
    std::string bban;
    std::vector<std::pair<std::string, std::string>> fields;  // In layout order

    bool GetField(const std::string& name, std::string& value) const;
};

// IBAN validation and generation (ISO 13616, MOD 97-10)
class IbanEngine {
public:
    // Remove whitespace and uppercase
    static std::string Normalize(const std::string& iban);

    // Structure only: two letters followed by 13..32 letters or digits,
    // spaces ignored, runs of five or more 'X' rejected
    static bool IsWellFormed(const std::string& value);

    // Redaction pattern CCXX + 11 digits + XXXX + 3 digits
    static bool IsAnonymized(const std::string& value);

    // Loose prefix test: two uppercase letters followed by two digits
    static bool HasIbanFormat(const std::string& value);

    // Full validation with a detailed result
    static ChecksumError Check(const std::string& iban);
    static bool Validate(const std::string& iban);

    // Build an IBAN from a country and its national account part (BBAN).
    // Throws ChecksumException on a bad country or a wrong payload length.
    static std::string Generate(const std::string& country, const std::string& national_part);
    static std::string Generate(const CountryCode& country, const std::string& national_part);

    // German IBAN from BLZ and account number, both left padded with zeros
    static std::string GenerateGerman(const std::string& blz, const std::string& account);

    // Fixed-offset split of a German IBAN (bank code 4..12, account 12..22)
    static bool Split(const std::string& iban, GermanAccount& account);

    // Country aware decomposition; requires a well formed IBAN of the registered length
    static bool SplitComponents(const std::string& iban, IbanComponents& components);
    static bool BankCode(const std::string& iban, std::string& bank_code);
    static bool AccountNumber(const std::string& iban, std::string& account_number);

    // Normalized IBAN grouped in blocks of four
    static std::string Format(const std::string& iban);

    static bool CountryCodeOf(const std::string& iban, std::string& country);
    static bool CheckDigitsOf(const std::string& iban, std::string& check_digits);
    static bool BbanOf(const std::string& iban, std::string& bban);

    static bool IsFromCountry(const std::string& iban, const CountryCode& country);
    static bool IsFromCountry(const std::string& iban, const std::string& country);
    static bool IsSepa(const std::string& iban);

    static bool IsBlz(const std::string& value);
    static bool IsKto(const std::string& value);
    static bool IsBic(const std::string& value);

    // Reference data lookups
    static bool BicFromIban(const std::string& iban, BankDirectory& directory, std::string& bic);
    static bool DescribeBic(const std::string& bic, BankDirectory& directory, std::string& description);
};

} // namespace checksum
} // namespace finid
} // namespace duckdb
