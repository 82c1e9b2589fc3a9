#pragma once

#include <string>
#include <vector>

namespace duckdb {
namespace finid {
namespace checksum {

// One row of a card type table: a number belongs to the type when it starts
// with one of the prefixes and its length is one of the lengths
struct CardType {
    std::string name;
    std::vector<std::string> prefixes;
    std::vector<size_t> lengths;

    bool Matches(const std::string& digits) const;
};

// Year and month an expiry date is compared against
struct ReferenceDate {
    int year;
    int month;

    // Local calendar date
    static ReferenceDate Today();
};

struct ExpiryDate {
    int month;
    int year;     // As written: 2 or 4 digits
    bool valid;   // Month in range and not expired
};

struct CardValidation {
    bool valid;
    std::vector<std::string> errors;
    std::string card_type;   // Empty when the number failed validation
};

// Payment card numbers: Luhn check, type classification, masking, expiry
class CardEngine {
public:
    // Returned by Classify when no table row matches
    static const char* const UNKNOWN_TYPE;

    // Built-in table, checked in declared order:
    // Visa, Mastercard, American Express, Diners Club, Discover, JCB, Maestro
    static const std::vector<CardType>& DefaultCardTypes();

    // Strip every non-digit character
    static std::string NormalizeDigits(const std::string& number);

    // 12..19 digits after normalization and a passing Luhn check
    static bool IsValidNumber(const std::string& number);

    // First matching row of the table, or UNKNOWN_TYPE
    static std::string Classify(const std::string& number);
    static std::string Classify(const std::string& number, const std::vector<CardType>& table);

    // "4111 ******** 1111" when masked, "4111 1111 1111 1111" otherwise.
    // Numbers shorter than 8 digits are returned normalized and unchanged.
    static std::string Format(const std::string& number, bool mask_middle = true);
    static std::string FormatMasked(const std::string& number);

    // Two-digit years are placed in the current century, or the next one
    // when that would already be in the past
    static bool IsValidExpiry(int month, int year);
    static bool IsValidExpiry(int month, int year, const ReferenceDate& today);

    // "MM/YY" or "MM/YYYY"; false when the text does not have that shape
    static bool ParseExpiry(const std::string& expiry, ExpiryDate& date);
    static bool ParseExpiry(const std::string& expiry, const ReferenceDate& today, ExpiryDate& date);

    // Well known Luhn-valid test number for a card type name
    static bool TestCardNumber(const std::string& card_type, std::string& number);

    // Combined check of number, expiry and (optional, 3-4 digits) CVV
    static CardValidation ValidateCard(const std::string& number, int month, int year);
    static CardValidation ValidateCard(const std::string& number, int month, int year, const std::string& cvv);
    static CardValidation ValidateCard(const std::string& number, int month, int year, const std::string* cvv,
                                       const ReferenceDate& today);
};

} // namespace checksum
} // namespace finid
} // namespace duckdb
