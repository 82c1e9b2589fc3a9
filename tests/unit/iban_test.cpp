#include "checksum/iban.hpp"
#include "checksum/country_registry.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace duckdb::finid::checksum;

namespace {

// In-memory directory for the lookup tests
class FakeBankDirectory : public BankDirectory {
public:
    bool ResolveBicByBankCode(const std::string& bank_code, std::string& bic) override {
        bank_code_requests++;
        last_bank_code = bank_code;
        auto it = bics.find(bank_code);
        if (it == bics.end()) {
            return false;
        }
        bic = it->second;
        return true;
    }

    bool ResolveBankNameByBic(const std::string& bic, std::string& bank_name) override {
        last_bic = bic;
        auto it = names.find(bic);
        if (it == names.end()) {
            return false;
        }
        bank_name = it->second;
        return true;
    }

    std::map<std::string, std::string> bics;
    std::map<std::string, std::string> names;
    std::string last_bank_code;
    std::string last_bic;
    int bank_code_requests = 0;
};

} // namespace

// ============================================================================
// Validation
// ============================================================================

TEST(IbanValidateTest, KnownValidIbans) {
    EXPECT_TRUE(IbanEngine::Validate("DE89370400440532013000"));
    EXPECT_TRUE(IbanEngine::Validate("GB29NWBK60161331926819"));
    EXPECT_TRUE(IbanEngine::Validate("NO9386011117947"));
    EXPECT_TRUE(IbanEngine::Validate("FR1420041010050500013M02606"));
    EXPECT_TRUE(IbanEngine::Validate("AT611904300234573201"));
    EXPECT_TRUE(IbanEngine::Validate("BE68539007547034"));
    EXPECT_TRUE(IbanEngine::Validate("CH9300762011623852957"));
    EXPECT_TRUE(IbanEngine::Validate("VA59001123000012345678"));
    EXPECT_TRUE(IbanEngine::Validate("BR1800360305000010009795493C1"));
}

TEST(IbanValidateTest, WhitespaceAndCaseAreIgnored) {
    EXPECT_TRUE(IbanEngine::Validate("DE89 3704 0044 0532 0130 00"));
    EXPECT_TRUE(IbanEngine::Validate("de89370400440532013000"));
    EXPECT_TRUE(IbanEngine::Validate("  gb29 nwbk 6016 1331 9268 19\t"));
}

TEST(IbanValidateTest, CheckResultCodes) {
    EXPECT_EQ(IbanEngine::Check("DE89370400440532013000"), ChecksumError::NONE);
    EXPECT_EQ(IbanEngine::Check("DE88370400440532013000"), ChecksumError::CHECKSUM_MISMATCH);
    EXPECT_EQ(IbanEngine::Check("DE8937040044053201300"), ChecksumError::LENGTH_MISMATCH);
    EXPECT_EQ(IbanEngine::Check("US12345678901234567"), ChecksumError::UNKNOWN_COUNTRY);
    EXPECT_EQ(IbanEngine::Check("DE89-3704-0044-0532-0130-00"), ChecksumError::MALFORMED_INPUT);
    EXPECT_EQ(IbanEngine::Check("DE89"), ChecksumError::MALFORMED_INPUT);
    EXPECT_EQ(IbanEngine::Check(""), ChecksumError::MALFORMED_INPUT);
    EXPECT_EQ(IbanEngine::Check("1234567890123456"), ChecksumError::MALFORMED_INPUT);
}

TEST(IbanValidateTest, AnonymizedIbanIsMalformed) {
    EXPECT_TRUE(IbanEngine::IsAnonymized("DEXX12345678901XXXX123"));
    EXPECT_TRUE(IbanEngine::IsWellFormed("DEXX12345678901XXXX123"));
    EXPECT_EQ(IbanEngine::Check("DEXX12345678901XXXX123"), ChecksumError::MALFORMED_INPUT);
    EXPECT_FALSE(IbanEngine::Validate("DEXX12345678901XXXX123"));

    // The 24 character display form is outside the 22 character mask pattern
    EXPECT_FALSE(IbanEngine::IsAnonymized("DE44XX00000000000XXXX123"));
    EXPECT_FALSE(IbanEngine::Validate("DE44XX00000000000XXXX123"));
}

TEST(IbanValidateTest, EverySingleDigitSubstitutionIsDetected) {
    const std::string iban = "DE89370400440532013000";
    for (size_t pos = 2; pos < iban.length(); pos++) {
        for (char digit = '0'; digit <= '9'; digit++) {
            if (digit == iban[pos]) {
                continue;
            }
            std::string mutated = iban;
            mutated[pos] = digit;
            EXPECT_FALSE(IbanEngine::Validate(mutated)) << mutated;
        }
    }
}

// ============================================================================
// Structural checks
// ============================================================================

TEST(IbanFormatTest, IsWellFormed) {
    EXPECT_TRUE(IbanEngine::IsWellFormed("DE89370400440532013000"));
    EXPECT_TRUE(IbanEngine::IsWellFormed("DE89 3704 0044 0532 0130 00"));
    EXPECT_TRUE(IbanEngine::IsWellFormed("US12345678901234567"));
    EXPECT_FALSE(IbanEngine::IsWellFormed("de89370400440532013000"));
    EXPECT_FALSE(IbanEngine::IsWellFormed("DE8937040044"));
    EXPECT_FALSE(IbanEngine::IsWellFormed("DE00XXXXXXXXXXXXXXXX00"));
    EXPECT_FALSE(IbanEngine::IsWellFormed(std::string("DE") + std::string(33, '1')));
}

TEST(IbanFormatTest, WellFormedLengthBounds) {
    EXPECT_FALSE(IbanEngine::IsWellFormed("NO938601111794"));
    EXPECT_TRUE(IbanEngine::IsWellFormed("NO9386011117947"));
    EXPECT_TRUE(IbanEngine::IsWellFormed(std::string("DE") + std::string(32, '1')));
    EXPECT_FALSE(IbanEngine::IsWellFormed(std::string("DE") + std::string(33, '1')));
}

TEST(IbanFormatTest, IsAnonymized) {
    EXPECT_FALSE(IbanEngine::IsAnonymized("DE89370400440532013000"));
    EXPECT_FALSE(IbanEngine::IsAnonymized("DEXX12345678901XXXX12"));
    EXPECT_FALSE(IbanEngine::IsAnonymized("dexx12345678901XXXX123"));
}

TEST(IbanFormatTest, HasIbanFormat) {
    EXPECT_TRUE(IbanEngine::HasIbanFormat("DE89"));
    EXPECT_TRUE(IbanEngine::HasIbanFormat("DE89 anything"));
    EXPECT_FALSE(IbanEngine::HasIbanFormat("de89370400440532013000"));
    EXPECT_FALSE(IbanEngine::HasIbanFormat("DEXX370400440532013000"));
    EXPECT_FALSE(IbanEngine::HasIbanFormat("DE8"));
}

TEST(IbanFormatTest, BlzKtoBic) {
    EXPECT_TRUE(IbanEngine::IsBlz("37040044"));
    EXPECT_FALSE(IbanEngine::IsBlz("3704004"));
    EXPECT_FALSE(IbanEngine::IsBlz("3704004A"));

    EXPECT_TRUE(IbanEngine::IsKto("0532013000"));
    EXPECT_FALSE(IbanEngine::IsKto("532013000"));

    EXPECT_TRUE(IbanEngine::IsBic("DEUTDEFF"));
    EXPECT_TRUE(IbanEngine::IsBic("DEUTDEFF500"));
    EXPECT_TRUE(IbanEngine::IsBic("COBADEFFXXX"));
    EXPECT_TRUE(IbanEngine::IsBic("DEUTDEFFxxx"));
    EXPECT_TRUE(IbanEngine::IsBic("GENODE61"));
    EXPECT_FALSE(IbanEngine::IsBic("deutdeff"));
    EXPECT_FALSE(IbanEngine::IsBic("DEUTDE1F"));
    EXPECT_FALSE(IbanEngine::IsBic("DEUTDEFO"));
    EXPECT_FALSE(IbanEngine::IsBic("DEUTDEF"));
    EXPECT_FALSE(IbanEngine::IsBic("DEUTDEFF50"));
    EXPECT_FALSE(IbanEngine::IsBic("DEUTDEFFxXx"));
}

// ============================================================================
// Generation
// ============================================================================

TEST(IbanGenerateTest, KnownVectors) {
    EXPECT_EQ(IbanEngine::Generate("DE", "370400440532013000"), "DE89370400440532013000");
    EXPECT_EQ(IbanEngine::Generate("gb", "nwbk60161331926819"), "GB29NWBK60161331926819");
    EXPECT_EQ(IbanEngine::Generate(CountryCode::FromString("NO"), "86011117947"), "NO9386011117947");
}

TEST(IbanGenerateTest, CheckDigitsAreZeroPadded) {
    EXPECT_EQ(IbanEngine::Generate("DE", "123456780000000005"), "DE06123456780000000005");
}

TEST(IbanGenerateTest, Errors) {
    try {
        IbanEngine::Generate("D1", "370400440532013000");
        FAIL() << "Expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.GetError(), ChecksumError::MALFORMED_INPUT);
    }

    try {
        IbanEngine::Generate("US", "370400440532013000");
        FAIL() << "Expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.GetError(), ChecksumError::UNKNOWN_COUNTRY);
    }

    try {
        IbanEngine::Generate("DE", "12345");
        FAIL() << "Expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.GetError(), ChecksumError::LENGTH_MISMATCH);
    }

    try {
        IbanEngine::Generate("DE", "37040044053201300-");
        FAIL() << "Expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.GetError(), ChecksumError::INVALID_CHARACTER);
    }

    // A masked account part would produce an IBAN the validator rejects
    try {
        IbanEngine::Generate("GB", "NWBKXXXXX331926819");
        FAIL() << "Expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.GetError(), ChecksumError::MALFORMED_INPUT);
    }

    EXPECT_THROW(IbanEngine::Generate(CountryCode(), "370400440532013000"), ChecksumException);
}

TEST(IbanGenerateTest, GeneratedIbansValidateForEveryCountry) {
    for (const auto& country : CountryRegistry::IbanCountries()) {
        size_t length = 0;
        ASSERT_TRUE(CountryRegistry::IbanLength(country, length));

        std::string payload;
        for (size_t i = 0; i < length - 4; i++) {
            payload += static_cast<char>('0' + (i * 7 + 3) % 10);
        }

        std::string iban = IbanEngine::Generate(country, payload);
        EXPECT_EQ(iban.length(), length) << country;
        EXPECT_EQ(IbanEngine::Check(iban), ChecksumError::NONE) << iban;
    }
}

TEST(IbanGenerateTest, GermanFromBlzAndAccount) {
    EXPECT_EQ(IbanEngine::GenerateGerman("37040044", "0532013000"), "DE89370400440532013000");
    EXPECT_EQ(IbanEngine::GenerateGerman("37040044", "532013000"), "DE89370400440532013000");
    EXPECT_EQ(IbanEngine::GenerateGerman("370 400 44", "532 013 000"), "DE89370400440532013000");
}

TEST(IbanGenerateTest, GermanRejectsOversizedParts) {
    EXPECT_THROW(IbanEngine::GenerateGerman("123456789", "1"), ChecksumException);
    EXPECT_THROW(IbanEngine::GenerateGerman("37040044", "12345678901"), ChecksumException);
}

// ============================================================================
// Decomposition
// ============================================================================

TEST(IbanSplitTest, GermanSplit) {
    GermanAccount account;
    ASSERT_TRUE(IbanEngine::Split("DE89 3704 0044 0532 0130 00", account));
    EXPECT_EQ(account.blz, "37040044");
    EXPECT_EQ(account.kto, "0532013000");
}

TEST(IbanSplitTest, OnlyGermanIbansSplit) {
    GermanAccount account;
    EXPECT_FALSE(IbanEngine::Split("AT611904300234573201", account));
    EXPECT_FALSE(IbanEngine::Split("DE8937040044", account));
}

TEST(IbanSplitTest, ComponentsWithLayout) {
    IbanComponents components;
    ASSERT_TRUE(IbanEngine::SplitComponents("FR14 2004 1010 0505 0001 3M02 606", components));
    EXPECT_EQ(components.country_code, "FR");
    EXPECT_EQ(components.check_digits, "14");
    EXPECT_EQ(components.bban, "20041010050500013M02606");
    ASSERT_EQ(components.fields.size(), 4u);

    std::string value;
    ASSERT_TRUE(components.GetField("bankCode", value));
    EXPECT_EQ(value, "20041");
    ASSERT_TRUE(components.GetField("branchCode", value));
    EXPECT_EQ(value, "01005");
    ASSERT_TRUE(components.GetField("accountNumber", value));
    EXPECT_EQ(value, "0500013M026");
    ASSERT_TRUE(components.GetField("nationalCheckDigits", value));
    EXPECT_EQ(value, "06");
    EXPECT_FALSE(components.GetField("currencyCode", value));
}

TEST(IbanSplitTest, ComponentsKeepLayoutOrder) {
    IbanComponents components;
    ASSERT_TRUE(IbanEngine::SplitComponents("GB29NWBK60161331926819", components));
    ASSERT_EQ(components.fields.size(), 3u);
    EXPECT_EQ(components.fields[0].first, "bankCode");
    EXPECT_EQ(components.fields[0].second, "NWBK");
    EXPECT_EQ(components.fields[1].first, "branchCode");
    EXPECT_EQ(components.fields[1].second, "601613");
    EXPECT_EQ(components.fields[2].first, "accountNumber");
    EXPECT_EQ(components.fields[2].second, "31926819");
}

TEST(IbanSplitTest, ComponentsWithoutLayout) {
    IbanComponents components;
    ASSERT_TRUE(IbanEngine::SplitComponents("VA59001123000012345678", components));
    EXPECT_EQ(components.country_code, "VA");
    EXPECT_EQ(components.bban, "001123000012345678");
    EXPECT_TRUE(components.fields.empty());
}

TEST(IbanSplitTest, ComponentsRequireRegisteredLength) {
    IbanComponents components;
    EXPECT_FALSE(IbanEngine::SplitComponents("DE8937040044053201300", components));
    EXPECT_FALSE(IbanEngine::SplitComponents("US12345678901234567", components));
    EXPECT_FALSE(IbanEngine::SplitComponents("not an iban", components));
}

TEST(IbanSplitTest, BankCodeAndAccountNumber) {
    std::string value;
    ASSERT_TRUE(IbanEngine::BankCode("AT611904300234573201", value));
    EXPECT_EQ(value, "19043");
    ASSERT_TRUE(IbanEngine::AccountNumber("AT611904300234573201", value));
    EXPECT_EQ(value, "00234573201");
    ASSERT_TRUE(IbanEngine::BankCode("CH9300762011623852957", value));
    EXPECT_EQ(value, "00762");
    ASSERT_TRUE(IbanEngine::AccountNumber("CH9300762011623852957", value));
    EXPECT_EQ(value, "011623852957");

    EXPECT_FALSE(IbanEngine::BankCode("VA59001123000012345678", value));
}

// ============================================================================
// Formatting and accessors
// ============================================================================

TEST(IbanAccessorTest, Format) {
    EXPECT_EQ(IbanEngine::Format("de89370400440532013000"), "DE89 3704 0044 0532 0130 00");
    EXPECT_EQ(IbanEngine::Format("DE89 3704 0044 0532 0130 00"), "DE89 3704 0044 0532 0130 00");
    EXPECT_EQ(IbanEngine::Format("NO9386011117947"), "NO93 8601 1117 947");
    EXPECT_EQ(IbanEngine::Format(""), "");
}

TEST(IbanAccessorTest, CountryCheckDigitsBban) {
    std::string value;
    ASSERT_TRUE(IbanEngine::CountryCodeOf("gb29 nwbk 6016 1331 9268 19", value));
    EXPECT_EQ(value, "GB");
    EXPECT_FALSE(IbanEngine::CountryCodeOf("XX89370400440532013000", value));
    EXPECT_FALSE(IbanEngine::CountryCodeOf("D", value));

    ASSERT_TRUE(IbanEngine::CheckDigitsOf("DE89370400440532013000", value));
    EXPECT_EQ(value, "89");
    EXPECT_FALSE(IbanEngine::CheckDigitsOf("DEAB370400440532013000", value));

    ASSERT_TRUE(IbanEngine::BbanOf("DE89370400440532013000", value));
    EXPECT_EQ(value, "370400440532013000");
    EXPECT_FALSE(IbanEngine::BbanOf("DE89", value));
}

TEST(IbanAccessorTest, IsFromCountry) {
    EXPECT_TRUE(IbanEngine::IsFromCountry("DE89370400440532013000", "DE"));
    EXPECT_TRUE(IbanEngine::IsFromCountry("de89370400440532013000", "de"));
    EXPECT_TRUE(IbanEngine::IsFromCountry("DE89370400440532013000", CountryCode::FromString("DE")));
    EXPECT_FALSE(IbanEngine::IsFromCountry("DE89370400440532013000", "AT"));
    EXPECT_FALSE(IbanEngine::IsFromCountry("DE89370400440532013000", "DEU"));
    EXPECT_FALSE(IbanEngine::IsFromCountry("DE89370400440532013000", CountryCode()));
}

TEST(IbanAccessorTest, IsSepa) {
    EXPECT_TRUE(IbanEngine::IsSepa("DE89370400440532013000"));
    EXPECT_TRUE(IbanEngine::IsSepa("GB29NWBK60161331926819"));
    EXPECT_TRUE(IbanEngine::IsSepa("CH9300762011623852957"));
    EXPECT_FALSE(IbanEngine::IsSepa("BR1800360305000010009795493C1"));
    EXPECT_FALSE(IbanEngine::IsSepa("VG96VPVG0000012345678901"));
    EXPECT_FALSE(IbanEngine::IsSepa(""));
}

// ============================================================================
// Reference data lookups
// ============================================================================

TEST(IbanLookupTest, BicFromIbanUsesBankCodeSlice) {
    FakeBankDirectory directory;
    directory.bics["37040044"] = "COBADEFFXXX";

    std::string bic;
    ASSERT_TRUE(IbanEngine::BicFromIban("DE89 3704 0044 0532 0130 00", directory, bic));
    EXPECT_EQ(bic, "COBADEFFXXX");
    EXPECT_EQ(directory.last_bank_code, "37040044");
}

TEST(IbanLookupTest, BicFromIbanMisses) {
    FakeBankDirectory directory;
    std::string bic;
    EXPECT_FALSE(IbanEngine::BicFromIban("DE89370400440532013000", directory, bic));
    EXPECT_EQ(directory.bank_code_requests, 1);

    EXPECT_FALSE(IbanEngine::BicFromIban("DE8937", directory, bic));
    EXPECT_EQ(directory.bank_code_requests, 1);
}

TEST(IbanLookupTest, DescribeBic) {
    FakeBankDirectory directory;
    directory.names["COBADEFF"] = "Commerzbank";

    std::string description;
    ASSERT_TRUE(IbanEngine::DescribeBic("cobadeff370", directory, description));
    EXPECT_EQ(description, "COBADEFFXXX Commerzbank");
    EXPECT_EQ(directory.last_bic, "COBADEFF");

    EXPECT_FALSE(IbanEngine::DescribeBic("DEUTDEFF", directory, description));
    EXPECT_FALSE(IbanEngine::DescribeBic("  ", directory, description));
}
