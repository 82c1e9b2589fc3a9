#include "creditor_id.hpp"
#include "mod97.hpp"
#include "string_utils.hpp"

namespace duckdb {
namespace finid {
namespace checksum {

static const size_t CI_MIN_LENGTH = 8;
static const size_t BUSINESS_AREA_OFFSET = 4;
static const size_t BUSINESS_AREA_LENGTH = 3;
// The checksum skips the business area
static const size_t NATIONAL_ID_OFFSET = BUSINESS_AREA_OFFSET + BUSINESS_AREA_LENGTH;

std::string CreditorIdEngine::Normalize(const std::string& creditor_id) {
    return to_upper(remove_whitespace(creditor_id));
}

std::string CreditorIdEngine::Format(const std::string& creditor_id, const std::string& separator) {
    std::string normalized = Normalize(creditor_id);
    if (normalized.length() <= BUSINESS_AREA_OFFSET) {
        return normalized;
    }

    std::string formatted = normalized.substr(0, BUSINESS_AREA_OFFSET) + separator +
                            normalized.substr(BUSINESS_AREA_OFFSET, BUSINESS_AREA_LENGTH);

    if (normalized.length() > NATIONAL_ID_OFFSET) {
        formatted += separator + join_strings(chunk_string(normalized.substr(NATIONAL_ID_OFFSET), 4), separator);
    }
    return formatted;
}

bool CreditorIdEngine::IsWellFormed(const std::string& value) {
    if (value.length() < CI_MIN_LENGTH) {
        return false;
    }
    if (!is_alpha_char(value[0]) || !is_alpha_char(value[1])) {
        return false;
    }
    if (!is_digit_char(value[2]) || !is_digit_char(value[3])) {
        return false;
    }
    for (size_t i = 4; i < value.length(); i++) {
        if (!is_alnum_char(value[i])) {
            return false;
        }
    }
    return true;
}

ChecksumError CreditorIdEngine::Check(const std::string& creditor_id) {
    std::string normalized = Normalize(creditor_id);
    if (!IsWellFormed(normalized)) {
        return ChecksumError::MALFORMED_INPUT;
    }
    return VerifyRearranged(normalized, NATIONAL_ID_OFFSET);
}

bool CreditorIdEngine::Validate(const std::string& creditor_id) {
    return Check(creditor_id) == ChecksumError::NONE;
}

bool CreditorIdEngine::IsGerman(const std::string& creditor_id) {
    std::string normalized = Normalize(creditor_id);

    // DE[0-9]{2}[A-Z0-9]{3}[0-9]{11}
    if (normalized.length() != 18 || normalized.compare(0, 2, "DE") != 0) {
        return false;
    }
    if (!all_digits(normalized.substr(2, 2)) ||
        !all_upper_alnum(normalized.substr(BUSINESS_AREA_OFFSET, BUSINESS_AREA_LENGTH)) ||
        !all_digits(normalized.substr(NATIONAL_ID_OFFSET))) {
        return false;
    }

    return Validate(normalized);
}

std::string CreditorIdEngine::CalculateCheckDigits(const std::string& country, const std::string& national_id) {
    CountryCode code = CountryCode::FromString(country);

    std::string id = Normalize(national_id);
    if (id.empty()) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT, "Creditor identifier: national id is missing");
    }
    if (!all_upper_alnum(id)) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT,
                                "Creditor identifier: national id '" + national_id +
                                    "' must contain only letters and digits");
    }

    return CheckDigitsFor(code.GetValue(), id);
}

std::string CreditorIdEngine::Generate(const std::string& country, const std::string& business_area,
                                       const std::string& national_id) {
    return Generate(CountryCode::FromString(country), business_area, national_id);
}

std::string CreditorIdEngine::Generate(const CountryCode& country, const std::string& business_area,
                                       const std::string& national_id) {
    const std::string& code = country.GetValue();

    size_t expected_length;
    if (!CountryRegistry::CreditorIdLength(code, expected_length)) {
        throw ChecksumException(ChecksumError::UNKNOWN_COUNTRY,
                                "No creditor identifier scheme registered for country '" + code + "'");
    }

    std::string area = Normalize(business_area);
    if (!all_upper_alnum(area)) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT,
                                "Creditor identifier: business area '" + business_area +
                                    "' must contain only letters and digits");
    }
    area = left_pad(area, BUSINESS_AREA_LENGTH, '0').substr(0, BUSINESS_AREA_LENGTH);

    std::string id = Normalize(national_id);
    std::string check_digits = CalculateCheckDigits(code, id);

    std::string result = code + check_digits + area + id;
    if (result.length() != expected_length) {
        throw ChecksumException(ChecksumError::LENGTH_MISMATCH,
                                "Creditor identifier for " + code + " must have " +
                                    std::to_string(expected_length) + " characters, national id '" +
                                    national_id + "' gives " + std::to_string(result.length()));
    }
    return result;
}

bool CreditorIdEngine::ExtractCountryCode(const std::string& creditor_id, std::string& country) {
    std::string normalized = Normalize(creditor_id);
    if (normalized.length() < 2 || !is_upper_char(normalized[0]) || !is_upper_char(normalized[1])) {
        return false;
    }
    country = normalized.substr(0, 2);
    return true;
}

bool CreditorIdEngine::ExtractCheckDigits(const std::string& creditor_id, std::string& check_digits) {
    std::string normalized = Normalize(creditor_id);
    if (normalized.length() < 4 || !is_digit_char(normalized[2]) || !is_digit_char(normalized[3])) {
        return false;
    }
    check_digits = normalized.substr(2, 2);
    return true;
}

bool CreditorIdEngine::ExtractBusinessArea(const std::string& creditor_id, std::string& business_area) {
    std::string normalized = Normalize(creditor_id);
    if (normalized.length() < NATIONAL_ID_OFFSET) {
        return false;
    }
    business_area = normalized.substr(BUSINESS_AREA_OFFSET, BUSINESS_AREA_LENGTH);
    return true;
}

bool CreditorIdEngine::ExtractNationalId(const std::string& creditor_id, std::string& national_id) {
    std::string normalized = Normalize(creditor_id);
    if (normalized.length() < CI_MIN_LENGTH) {
        return false;
    }
    national_id = normalized.substr(NATIONAL_ID_OFFSET);
    return true;
}

bool CreditorIdEngine::Decompose(const std::string& creditor_id, CreditorIdParts& parts) {
    CreditorIdParts result;
    if (!ExtractCountryCode(creditor_id, result.country_code) ||
        !ExtractCheckDigits(creditor_id, result.check_digits) ||
        !ExtractBusinessArea(creditor_id, result.business_area) ||
        !ExtractNationalId(creditor_id, result.national_id)) {
        return false;
    }
    parts = result;
    return true;
}

bool CreditorIdEngine::MatchesCountry(const std::string& creditor_id, const CountryCode& country) {
    std::string extracted;
    return ExtractCountryCode(creditor_id, extracted) && extracted == country.GetValue();
}

bool CreditorIdEngine::ExpectedLength(const std::string& country, size_t& length) {
    return CountryRegistry::CreditorIdLength(to_upper(trim(country)), length);
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
