#include "card.hpp"
#include "mod97.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <utility>

namespace duckdb {
namespace finid {
namespace checksum {

const char* const CardEngine::UNKNOWN_TYPE = "unknown";

static const size_t CARD_MIN_LENGTH = 12;
static const size_t CARD_MAX_LENGTH = 19;

// Prefix lists instead of regular expressions; order decides overlaps
static const std::vector<CardType> DEFAULT_CARD_TYPES = {
    {"Visa", {"4"}, {13, 16, 19}},
    {"Mastercard", {"51", "52", "53", "54", "55", "22", "23", "24", "25", "26", "27"}, {16}},
    {"American Express", {"34", "37"}, {15}},
    {"Diners Club", {"30", "36", "38", "39"}, {14}},
    {"Discover", {"6011", "65"}, {16}},
    {"JCB", {"35"}, {16}},
    {"Maestro", {"50", "56", "57", "58", "6304", "6390", "67"}, {12, 13, 14, 15, 16, 17, 18, 19}},
};

static const std::vector<std::pair<std::string, std::string>> TEST_CARD_NUMBERS = {
    {"Visa", "4111111111111111"},
    {"Mastercard", "5555555555554444"},
    {"American Express", "378282246310005"},
    {"Diners Club", "30569309025904"},
    {"Discover", "6011111111111117"},
    {"JCB", "3530111333300000"},
    {"Maestro", "5018000000000009"},
};

bool CardType::Matches(const std::string& digits) const {
    if (std::find(lengths.begin(), lengths.end(), digits.length()) == lengths.end()) {
        return false;
    }
    for (const auto& prefix : prefixes) {
        if (digits.compare(0, prefix.length(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

ReferenceDate ReferenceDate::Today() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm;
#ifdef _WIN32
    localtime_s(&local_tm, &now);
#else
    localtime_r(&now, &local_tm);
#endif

    ReferenceDate today;
    today.year = local_tm.tm_year + 1900;
    today.month = local_tm.tm_mon + 1;
    return today;
}

const std::vector<CardType>& CardEngine::DefaultCardTypes() {
    return DEFAULT_CARD_TYPES;
}

std::string CardEngine::NormalizeDigits(const std::string& number) {
    return keep_digits(number);
}

bool CardEngine::IsValidNumber(const std::string& number) {
    std::string digits = NormalizeDigits(number);
    if (digits.length() < CARD_MIN_LENGTH || digits.length() > CARD_MAX_LENGTH) {
        return false;
    }
    return LuhnCheck(digits);
}

std::string CardEngine::Classify(const std::string& number) {
    return Classify(number, DEFAULT_CARD_TYPES);
}

std::string CardEngine::Classify(const std::string& number, const std::vector<CardType>& table) {
    std::string digits = NormalizeDigits(number);
    for (const auto& type : table) {
        if (type.Matches(digits)) {
            return type.name;
        }
    }
    return UNKNOWN_TYPE;
}

std::string CardEngine::Format(const std::string& number, bool mask_middle) {
    std::string digits = NormalizeDigits(number);
    if (digits.length() < 8) {
        return digits;
    }

    if (mask_middle) {
        std::string masked(digits.length() - 8, '*');
        return digits.substr(0, 4) + " " + masked + " " + digits.substr(digits.length() - 4);
    }

    return join_strings(chunk_string(digits, 4), " ");
}

std::string CardEngine::FormatMasked(const std::string& number) {
    return Format(number, true);
}

bool CardEngine::IsValidExpiry(int month, int year) {
    return IsValidExpiry(month, year, ReferenceDate::Today());
}

bool CardEngine::IsValidExpiry(int month, int year, const ReferenceDate& today) {
    if (month < 1 || month > 12) {
        return false;
    }

    if (year < 100) {
        year += (today.year / 100) * 100;
        if (year < today.year) {
            year += 100;
        }
    }

    // Expired iff (year, month) < (current year, current month)
    return !(year < today.year || (year == today.year && month < today.month));
}

bool CardEngine::ParseExpiry(const std::string& expiry, ExpiryDate& date) {
    return ParseExpiry(expiry, ReferenceDate::Today(), date);
}

bool CardEngine::ParseExpiry(const std::string& expiry, const ReferenceDate& today, ExpiryDate& date) {
    // ^\d{2}/\d{2,4}$
    std::string cleaned = trim(expiry);
    size_t slash = cleaned.find('/');
    if (slash != 2) {
        return false;
    }

    std::string month_part = cleaned.substr(0, 2);
    std::string year_part = cleaned.substr(3);
    if (!all_digits(month_part) || year_part.length() < 2 || year_part.length() > 4 || !all_digits(year_part)) {
        return false;
    }

    date.month = std::stoi(month_part);
    date.year = std::stoi(year_part);
    date.valid = IsValidExpiry(date.month, date.year, today);
    return true;
}

bool CardEngine::TestCardNumber(const std::string& card_type, std::string& number) {
    for (const auto& entry : TEST_CARD_NUMBERS) {
        if (entry.first == card_type) {
            number = entry.second;
            return true;
        }
    }
    return false;
}

CardValidation CardEngine::ValidateCard(const std::string& number, int month, int year) {
    return ValidateCard(number, month, year, nullptr, ReferenceDate::Today());
}

CardValidation CardEngine::ValidateCard(const std::string& number, int month, int year, const std::string& cvv) {
    return ValidateCard(number, month, year, &cvv, ReferenceDate::Today());
}

CardValidation CardEngine::ValidateCard(const std::string& number, int month, int year, const std::string* cvv,
                                        const ReferenceDate& today) {
    CardValidation validation;

    if (!IsValidNumber(number)) {
        validation.errors.push_back("Invalid card number");
    } else {
        validation.card_type = Classify(number);
    }

    if (!IsValidExpiry(month, year, today)) {
        validation.errors.push_back("Invalid or expired expiry date");
    }

    if (cvv && (cvv->length() < 3 || cvv->length() > 4 || !all_digits(*cvv))) {
        validation.errors.push_back("Invalid CVV");
    }

    validation.valid = validation.errors.empty();
    return validation;
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
