#include "iban.hpp"
#include "mod97.hpp"
#include "string_utils.hpp"

namespace duckdb {
namespace finid {
namespace checksum {

// Total length bounds. Norway's 15 characters is the shortest registered IBAN.
static const size_t IBAN_MIN_LENGTH = 15;
static const size_t IBAN_MAX_LENGTH = 34;
static const size_t IBAN_PAYLOAD_OFFSET = 4;

bool IbanComponents::GetField(const std::string& name, std::string& value) const {
    for (const auto& field : fields) {
        if (field.first == name) {
            value = field.second;
            return true;
        }
    }
    return false;
}

std::string IbanEngine::Normalize(const std::string& iban) {
    return to_upper(remove_whitespace(iban));
}

bool IbanEngine::IsWellFormed(const std::string& value) {
    std::string cleaned = remove_spaces(value);

    // Masked IBANs ("DE00XXXXXXXX...") are never checksum candidates
    if (cleaned.find("XXXXX") != std::string::npos) {
        return false;
    }

    if (cleaned.length() < IBAN_MIN_LENGTH || cleaned.length() > IBAN_MAX_LENGTH) {
        return false;
    }
    if (!is_upper_char(cleaned[0]) || !is_upper_char(cleaned[1])) {
        return false;
    }
    return all_upper_alnum(cleaned.substr(2));
}

bool IbanEngine::IsAnonymized(const std::string& value) {
    // ^[A-Z]{2}XX[0-9]{11}XXXX[0-9]{3}$
    if (value.length() != 22) {
        return false;
    }
    if (!is_upper_char(value[0]) || !is_upper_char(value[1])) {
        return false;
    }
    return value.compare(2, 2, "XX") == 0 &&
           all_digits(value.substr(4, 11)) &&
           value.compare(15, 4, "XXXX") == 0 &&
           all_digits(value.substr(19, 3));
}

bool IbanEngine::HasIbanFormat(const std::string& value) {
    return value.length() >= 4 &&
           is_upper_char(value[0]) && is_upper_char(value[1]) &&
           is_digit_char(value[2]) && is_digit_char(value[3]);
}

ChecksumError IbanEngine::Check(const std::string& iban) {
    std::string cleaned = Normalize(iban);

    if (IsAnonymized(cleaned) || !IsWellFormed(cleaned)) {
        return ChecksumError::MALFORMED_INPUT;
    }

    size_t expected_length;
    if (!CountryRegistry::IbanLength(cleaned.substr(0, 2), expected_length)) {
        return ChecksumError::UNKNOWN_COUNTRY;
    }
    if (cleaned.length() != expected_length) {
        return ChecksumError::LENGTH_MISMATCH;
    }

    return VerifyRearranged(cleaned, IBAN_PAYLOAD_OFFSET);
}

bool IbanEngine::Validate(const std::string& iban) {
    return Check(iban) == ChecksumError::NONE;
}

std::string IbanEngine::Generate(const std::string& country, const std::string& national_part) {
    return Generate(CountryCode::FromString(country), national_part);
}

std::string IbanEngine::Generate(const CountryCode& country, const std::string& national_part) {
    const std::string& code = country.GetValue();

    size_t iban_length;
    if (!CountryRegistry::IbanLength(code, iban_length)) {
        throw ChecksumException(ChecksumError::UNKNOWN_COUNTRY,
                                "Unknown IBAN country code: '" + code + "'");
    }

    std::string payload = Normalize(national_part);
    size_t expected_length = iban_length - IBAN_PAYLOAD_OFFSET;
    if (payload.length() != expected_length) {
        throw ChecksumException(ChecksumError::LENGTH_MISMATCH,
                                "Account part for " + code + " must have " +
                                    std::to_string(expected_length) + " characters, got '" +
                                    national_part + "'");
    }

    std::string iban = code + CheckDigitsFor(code, payload) + payload;
    if (!IsWellFormed(iban)) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT,
                                "Generated IBAN is not well-formed: '" + iban + "'");
    }
    return iban;
}

std::string IbanEngine::GenerateGerman(const std::string& blz, const std::string& account) {
    std::string blz_padded = left_pad(keep_digits(blz), 8, '0');
    std::string kto_padded = left_pad(keep_digits(account), 10, '0');

    if (!IsBlz(blz_padded)) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT,
                                "Invalid BLZ: '" + blz + "' (normalized: '" + blz_padded + "')");
    }
    if (!IsKto(kto_padded)) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT,
                                "Invalid account number: '" + account + "' (normalized: '" +
                                    kto_padded + "')");
    }

    return Generate(std::string("DE"), blz_padded + kto_padded);
}

bool IbanEngine::Split(const std::string& iban, GermanAccount& account) {
    std::string cleaned = Normalize(iban);
    if (cleaned.length() < 22 || cleaned.compare(0, 2, "DE") != 0) {
        return false;
    }

    account.blz = cleaned.substr(4, 8);
    account.kto = cleaned.substr(12, 10);
    return true;
}

bool IbanEngine::SplitComponents(const std::string& iban, IbanComponents& components) {
    std::string cleaned = Normalize(iban);
    if (!IsWellFormed(cleaned)) {
        return false;
    }

    std::string country = cleaned.substr(0, 2);
    size_t expected_length;
    if (!CountryRegistry::IbanLength(country, expected_length) || cleaned.length() != expected_length) {
        return false;
    }

    components.country_code = country;
    components.check_digits = cleaned.substr(2, 2);
    components.bban = cleaned.substr(IBAN_PAYLOAD_OFFSET);
    components.fields.clear();

    std::vector<BbanField> layout;
    if (CountryRegistry::BbanLayout(country, layout)) {
        for (const auto& field : layout) {
            if (field.offset >= components.bban.length()) {
                continue;
            }
            components.fields.push_back(
                std::make_pair(field.name, components.bban.substr(field.offset, field.length)));
        }
    }

    return true;
}

bool IbanEngine::BankCode(const std::string& iban, std::string& bank_code) {
    IbanComponents components;
    return SplitComponents(iban, components) && components.GetField("bankCode", bank_code);
}

bool IbanEngine::AccountNumber(const std::string& iban, std::string& account_number) {
    IbanComponents components;
    return SplitComponents(iban, components) && components.GetField("accountNumber", account_number);
}

std::string IbanEngine::Format(const std::string& iban) {
    return join_strings(chunk_string(Normalize(iban), 4), " ");
}

bool IbanEngine::CountryCodeOf(const std::string& iban, std::string& country) {
    std::string cleaned = Normalize(iban);
    if (cleaned.length() < 2) {
        return false;
    }

    size_t length;
    std::string candidate = cleaned.substr(0, 2);
    if (!CountryRegistry::IbanLength(candidate, length)) {
        return false;
    }
    country = candidate;
    return true;
}

bool IbanEngine::CheckDigitsOf(const std::string& iban, std::string& check_digits) {
    std::string cleaned = Normalize(iban);
    if (cleaned.length() < 4 || !is_digit_char(cleaned[2]) || !is_digit_char(cleaned[3])) {
        return false;
    }
    check_digits = cleaned.substr(2, 2);
    return true;
}

bool IbanEngine::BbanOf(const std::string& iban, std::string& bban) {
    std::string cleaned = Normalize(iban);
    if (cleaned.length() <= IBAN_PAYLOAD_OFFSET) {
        return false;
    }
    bban = cleaned.substr(IBAN_PAYLOAD_OFFSET);
    return true;
}

bool IbanEngine::IsFromCountry(const std::string& iban, const CountryCode& country) {
    std::string iban_country;
    return !country.IsEmpty() && CountryCodeOf(iban, iban_country) && iban_country == country.GetValue();
}

bool IbanEngine::IsFromCountry(const std::string& iban, const std::string& country) {
    CountryCode code;
    return CountryCode::TryParse(country, code) && IsFromCountry(iban, code);
}

bool IbanEngine::IsSepa(const std::string& iban) {
    std::string country;
    return CountryCodeOf(iban, country) && CountryRegistry::IsSepaCountry(country);
}

bool IbanEngine::IsBlz(const std::string& value) {
    return value.length() == 8 && all_digits(value);
}

bool IbanEngine::IsKto(const std::string& value) {
    return value.length() == 10 && all_digits(value);
}

bool IbanEngine::IsBic(const std::string& value) {
    // ^[A-Z]{6}[2-9A-Z][0-9A-NP-Z]([A-Z0-9]{3}|x{3})?$
    if (value.length() != 8 && value.length() != 11) {
        return false;
    }
    for (size_t i = 0; i < 6; i++) {
        if (!is_upper_char(value[i])) {
            return false;
        }
    }

    char location1 = value[6];
    if (!is_upper_char(location1) && !(location1 >= '2' && location1 <= '9')) {
        return false;
    }
    char location2 = value[7];
    if (!(is_upper_char(location2) && location2 != 'O') && !is_digit_char(location2)) {
        return false;
    }

    if (value.length() == 11) {
        std::string branch = value.substr(8, 3);
        return branch == "xxx" || all_upper_alnum(branch);
    }
    return true;
}

bool IbanEngine::BicFromIban(const std::string& iban, BankDirectory& directory, std::string& bic) {
    std::string cleaned = Normalize(iban);
    if (cleaned.length() < 12) {
        return false;
    }
    return directory.ResolveBicByBankCode(cleaned.substr(4, 8), bic);
}

bool IbanEngine::DescribeBic(const std::string& bic, BankDirectory& directory, std::string& description) {
    std::string bic8 = to_upper(trim(bic)).substr(0, 8);
    if (bic8.empty()) {
        return false;
    }

    std::string bank_name;
    if (!directory.ResolveBankNameByBic(bic8, bank_name)) {
        return false;
    }
    description = bic8 + "XXX " + bank_name;
    return true;
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
