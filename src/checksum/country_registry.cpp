#include "country_registry.hpp"
#include "checksum_error.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace duckdb {
namespace finid {
namespace checksum {

// IBAN country code lengths (ISO 13616 registry)
static const std::unordered_map<std::string, size_t> IBAN_LENGTHS = {
    {"AD", 24}, {"AE", 23}, {"AL", 28}, {"AT", 20}, {"AZ", 28},
    {"BA", 20}, {"BE", 16}, {"BG", 22}, {"BH", 22}, {"BR", 29},
    {"BY", 28}, {"CH", 21}, {"CR", 22}, {"CY", 28}, {"CZ", 24},
    {"DE", 22}, {"DK", 18}, {"DO", 28}, {"EE", 20}, {"EG", 29},
    {"ES", 24}, {"FI", 18}, {"FO", 18}, {"FR", 27}, {"GB", 22},
    {"GE", 22}, {"GI", 23}, {"GL", 18}, {"GR", 27}, {"GT", 28},
    {"HR", 21}, {"HU", 28}, {"IE", 22}, {"IL", 23}, {"IS", 26},
    {"IT", 27}, {"JO", 30}, {"KW", 30}, {"KZ", 20}, {"LB", 28},
    {"LC", 32}, {"LI", 21}, {"LT", 20}, {"LU", 20}, {"LV", 21},
    {"MC", 27}, {"MD", 24}, {"ME", 22}, {"MK", 19}, {"MR", 27},
    {"MT", 31}, {"MU", 30}, {"NL", 18}, {"NO", 15}, {"PK", 24},
    {"PL", 28}, {"PS", 29}, {"PT", 25}, {"QA", 29}, {"RO", 24},
    {"RS", 22}, {"SA", 24}, {"SE", 24}, {"SI", 19}, {"SK", 24},
    {"SM", 27}, {"TN", 24}, {"TR", 26}, {"UA", 29}, {"VA", 22},
    {"VG", 24}, {"XK", 20}
};

// SEPA creditor identifier lengths
static const std::unordered_map<std::string, size_t> CREDITOR_ID_LENGTHS = {
    {"DE", 18}, {"AT", 18}, {"BE", 18}, {"NL", 19},
    {"FR", 13}, {"ES", 16}, {"IT", 23}, {"PT", 23}
};

static const std::unordered_set<std::string> SEPA_COUNTRIES = {
    // EU member states
    "AT", "BE", "BG", "HR", "CY", "CZ", "DK", "EE", "FI", "FR", "DE", "GR", "HU", "IE",
    "IT", "LV", "LT", "LU", "MT", "NL", "PL", "PT", "RO", "SK", "SI", "ES", "SE",
    // EEA
    "IS", "LI", "NO",
    // Other participants
    "CH", "MC", "SM", "AD", "VA", "GB", "GI",
    // Channel Islands, Isle of Man, French overseas territories
    "GG", "IM", "JE", "PM", "BL", "MF", "GP", "MQ", "GF", "RE", "YT"
};

static std::unordered_map<std::string, std::vector<BbanField>> BuildBbanLayouts() {
    std::unordered_map<std::string, std::vector<BbanField>> layouts;

    layouts["DE"] = {{"bankCode", 0, 8}, {"accountNumber", 8, 10}};
    layouts["AT"] = {{"bankCode", 0, 5}, {"accountNumber", 5, 11}};
    layouts["CH"] = {{"bankCode", 0, 5}, {"accountNumber", 5, 12}};
    layouts["LI"] = layouts["CH"];
    layouts["FR"] = {{"bankCode", 0, 5}, {"branchCode", 5, 5}, {"accountNumber", 10, 11},
                     {"nationalCheckDigits", 21, 2}};
    layouts["MC"] = layouts["FR"];
    layouts["IT"] = {{"checkChar", 0, 1}, {"bankCode", 1, 5}, {"branchCode", 6, 5},
                     {"accountNumber", 11, 12}};
    layouts["SM"] = layouts["IT"];
    layouts["ES"] = {{"bankCode", 0, 4}, {"branchCode", 4, 4}, {"nationalCheckDigits", 8, 2},
                     {"accountNumber", 10, 10}};
    layouts["NL"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 10}};
    layouts["BE"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 7}, {"nationalCheckDigits", 10, 2}};
    layouts["LU"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 13}};
    layouts["GB"] = {{"bankCode", 0, 4}, {"branchCode", 4, 6}, {"accountNumber", 10, 8}};
    layouts["IE"] = layouts["GB"];
    layouts["PL"] = {{"bankCode", 0, 8}, {"accountNumber", 8, 16}};
    layouts["CZ"] = {{"bankCode", 0, 4}, {"accountPrefix", 4, 6}, {"accountNumber", 10, 10}};
    layouts["SK"] = layouts["CZ"];
    layouts["HU"] = {{"bankCode", 0, 3}, {"branchCode", 3, 4}, {"nationalCheckDigit", 7, 1},
                     {"accountNumber", 8, 16}};
    layouts["PT"] = {{"bankCode", 0, 4}, {"branchCode", 4, 4}, {"accountNumber", 8, 11},
                     {"nationalCheckDigits", 19, 2}};
    layouts["GR"] = {{"bankCode", 0, 3}, {"branchCode", 3, 4}, {"accountNumber", 7, 16}};
    layouts["DK"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 10}};
    layouts["FO"] = layouts["DK"];
    layouts["GL"] = layouts["DK"];
    layouts["SE"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 17}};
    layouts["NO"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 7}};
    layouts["FI"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 11}};
    layouts["EE"] = {{"bankCode", 0, 2}, {"accountNumber", 2, 14}};
    layouts["LV"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 13}};
    layouts["LT"] = {{"bankCode", 0, 5}, {"accountNumber", 5, 11}};
    layouts["HR"] = {{"bankCode", 0, 7}, {"accountNumber", 7, 10}};
    layouts["SI"] = {{"bankCode", 0, 5}, {"accountNumber", 5, 10}};
    layouts["RO"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 16}};
    layouts["BG"] = {{"bankCode", 0, 4}, {"branchCode", 4, 4}, {"accountType", 8, 2},
                     {"accountNumber", 10, 8}};
    layouts["CY"] = {{"bankCode", 0, 3}, {"branchCode", 3, 5}, {"accountNumber", 8, 16}};
    layouts["MT"] = {{"bankCode", 0, 4}, {"branchCode", 4, 5}, {"accountNumber", 9, 18}};
    layouts["TR"] = {{"bankCode", 0, 5}, {"accountNumber", 5, 17}};
    layouts["AL"] = {{"bankCode", 0, 8}, {"accountNumber", 8, 16}};
    layouts["AD"] = {{"bankCode", 0, 4}, {"branchCode", 4, 4}, {"accountNumber", 8, 12}};
    layouts["AZ"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 20}};
    layouts["BH"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 14}};
    layouts["BA"] = {{"bankCode", 0, 3}, {"branchCode", 3, 3}, {"accountNumber", 6, 10}};
    layouts["BR"] = {{"bankCode", 0, 8}, {"branchCode", 8, 5}, {"accountNumber", 13, 10},
                     {"accountType", 23, 1}, {"ownerAccountNumber", 24, 1}};
    layouts["CR"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 14}};
    layouts["DO"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 20}};
    layouts["GE"] = {{"bankCode", 0, 2}, {"accountNumber", 2, 16}};
    layouts["GI"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 15}};
    layouts["GT"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 20}};
    layouts["IS"] = {{"bankCode", 0, 4}, {"branchCode", 4, 2}, {"accountNumber", 6, 6},
                     {"identificationNumber", 12, 10}};
    layouts["IL"] = {{"bankCode", 0, 3}, {"branchCode", 3, 3}, {"accountNumber", 6, 13}};
    layouts["JO"] = {{"bankCode", 0, 4}, {"branchCode", 4, 4}, {"accountNumber", 8, 18}};
    layouts["KZ"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 13}};
    layouts["XK"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 12}};
    layouts["KW"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 22}};
    layouts["LB"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 20}};
    layouts["MR"] = {{"bankCode", 0, 5}, {"branchCode", 5, 5}, {"accountNumber", 10, 11},
                     {"nationalCheckDigits", 21, 2}};
    layouts["MU"] = {{"bankCode", 0, 6}, {"branchCode", 6, 2}, {"accountNumber", 8, 15},
                     {"currencyCode", 23, 3}};
    layouts["MD"] = {{"bankCode", 0, 2}, {"accountNumber", 2, 18}};
    layouts["ME"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 15}};
    layouts["PK"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 16}};
    layouts["PS"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 21}};
    layouts["QA"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 21}};
    layouts["SA"] = {{"bankCode", 0, 2}, {"accountNumber", 2, 18}};
    layouts["RS"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 15}};
    layouts["TN"] = {{"bankCode", 0, 2}, {"branchCode", 2, 3}, {"accountNumber", 5, 15}};
    layouts["AE"] = {{"bankCode", 0, 3}, {"accountNumber", 3, 16}};
    layouts["VG"] = {{"bankCode", 0, 4}, {"accountNumber", 4, 16}};

    return layouts;
}

static const std::unordered_map<std::string, std::vector<BbanField>> BBAN_LAYOUTS = BuildBbanLayouts();

bool CountryCode::TryParse(const std::string& value, CountryCode& code) {
    std::string cleaned = trim(value);
    if (cleaned.length() != 2 || !is_alpha_char(cleaned[0]) || !is_alpha_char(cleaned[1])) {
        return false;
    }
    code = CountryCode(to_upper(cleaned));
    return true;
}

CountryCode CountryCode::FromString(const std::string& value) {
    CountryCode code;
    if (!TryParse(value, code)) {
        throw ChecksumException(ChecksumError::MALFORMED_INPUT,
                                "Invalid country code: '" + value + "' (expected two letters)");
    }
    return code;
}

bool CountryRegistry::IbanLength(const std::string& country, size_t& length) {
    auto it = IBAN_LENGTHS.find(country);
    if (it == IBAN_LENGTHS.end()) {
        return false;
    }
    length = it->second;
    return true;
}

bool CountryRegistry::CreditorIdLength(const std::string& country, size_t& length) {
    auto it = CREDITOR_ID_LENGTHS.find(country);
    if (it == CREDITOR_ID_LENGTHS.end()) {
        return false;
    }
    length = it->second;
    return true;
}

bool CountryRegistry::IsSepaCountry(const std::string& country) {
    return SEPA_COUNTRIES.count(country) > 0;
}

bool CountryRegistry::BbanLayout(const std::string& country, std::vector<BbanField>& layout) {
    auto it = BBAN_LAYOUTS.find(country);
    if (it == BBAN_LAYOUTS.end()) {
        return false;
    }
    layout = it->second;
    return true;
}

std::vector<std::string> CountryRegistry::IbanCountries() {
    std::vector<std::string> countries;
    countries.reserve(IBAN_LENGTHS.size());
    for (const auto& entry : IBAN_LENGTHS) {
        countries.push_back(entry.first);
    }
    std::sort(countries.begin(), countries.end());
    return countries;
}

std::vector<std::string> CountryRegistry::CreditorIdCountries() {
    std::vector<std::string> countries;
    for (const auto& entry : CREDITOR_ID_LENGTHS) {
        countries.push_back(entry.first);
    }
    std::sort(countries.begin(), countries.end());
    return countries;
}

} // namespace checksum
} // namespace finid
} // namespace duckdb
