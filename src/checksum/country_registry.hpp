#pragma once

#include <string>
#include <vector>

namespace duckdb {
namespace finid {
namespace checksum {

// Two-letter ISO 3166 country code, always uppercase.
// A default-constructed code is empty and matches no registry entry.
class CountryCode {
public:
    CountryCode() = default;

    // Accepts exactly two ASCII letters (surrounding whitespace ignored)
    static bool TryParse(const std::string& value, CountryCode& code);

    // Same as TryParse, throws ChecksumException(MALFORMED_INPUT) on failure
    static CountryCode FromString(const std::string& value);

    const std::string& GetValue() const { return value_; }
    bool IsEmpty() const { return value_.empty(); }

    bool operator==(const CountryCode& other) const { return value_ == other.value_; }
    bool operator!=(const CountryCode& other) const { return value_ != other.value_; }

private:
    explicit CountryCode(const std::string& value) : value_(value) {}

    std::string value_;
};

// Named fixed-width field inside a BBAN
struct BbanField {
    std::string name;   // bankCode, branchCode, accountNumber, ...
    size_t offset;      // Offset inside the BBAN
    size_t length;
};

// Static, read-only scheme tables keyed by uppercase country code
class CountryRegistry {
public:
    // Total IBAN length for a country (15..34)
    static bool IbanLength(const std::string& country, size_t& length);

    // Total SEPA creditor identifier length for a country
    static bool CreditorIdLength(const std::string& country, size_t& length);

    // SEPA scheme participant (EU, EEA and associated territories)
    static bool IsSepaCountry(const std::string& country);

    // Per-country BBAN field layout; false when the country has none
    static bool BbanLayout(const std::string& country, std::vector<BbanField>& layout);

    // All countries with a registered IBAN length, sorted
    static std::vector<std::string> IbanCountries();

    // All countries with a registered creditor identifier length, sorted
    static std::vector<std::string> CreditorIdCountries();
};

} // namespace checksum
} // namespace finid
} // namespace duckdb
