#include "bank_directory_loader.hpp"
#include "checksum/iban.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using duckdb::finid::BankRecord;
using duckdb::finid::BundesbankDirectory;
using duckdb::finid::checksum::IbanEngine;

namespace {

// One record in the Bundesbank fixed-width layout
std::string BlzLine(const std::string& blz, const std::string& name, const std::string& bic) {
    std::string line(168, ' ');
    line.replace(0, blz.length(), blz);
    line[8] = '1';
    line.replace(9, name.length(), name);
    line.replace(139, bic.length(), bic);
    return line;
}

std::string TempPath(const std::string& filename) {
    return testing::TempDir() + "finid_" + filename;
}

void WriteTextFile(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path.c_str(), std::ios::binary | std::ios::trunc);
    for (const auto& line : lines) {
        out << line << "\n";
    }
}

void WriteGzipFile(const std::string& path, const std::vector<std::string>& lines) {
    gzFile file = gzopen(path.c_str(), "wb");
    ASSERT_NE(file, nullptr);
    for (const auto& line : lines) {
        gzputs(file, (line + "\n").c_str());
    }
    gzclose(file);
}

} // namespace

class BankDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        blz_path_ = TempPath("blz.txt");
        bic_path_ = TempPath("bic.csv");

        WriteTextFile(blz_path_, {
            BlzLine("37040044", "Commerzbank", "COBADEFFXXX"),
            BlzLine("37040044", "Commerzbank Filiale Koeln", "COBADEFF370"),
            BlzLine("10000000", "Bundesbank Berlin", "MARKDEF1100"),
            BlzLine("12030000", "Deutsche Kreditbank Berlin", ""),
            "BADLINE  this is not a bank code record",
            "",
        });

        WriteTextFile(bic_path_, {
            "COBADEFFXXX;Commerzbank;Frankfurt am Main",
            "COBADEFF370;Commerzbank Koeln;Koeln",
            "deutdeff500;Deutsche Bank",
            "no separator on this line",
        });
    }

    void TearDown() override {
        std::remove(blz_path_.c_str());
        std::remove(bic_path_.c_str());
    }

    std::string blz_path_;
    std::string bic_path_;
};

// ============================================================================
// BLZ directory
// ============================================================================

TEST_F(BankDirectoryTest, LookupBank) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    BankRecord record;
    ASSERT_TRUE(directory.LookupBank("10000000", record));
    EXPECT_EQ(record.blz, "10000000");
    EXPECT_EQ(record.bank_name, "Bundesbank Berlin");
    EXPECT_EQ(record.bic, "MARKDEF1100");

    EXPECT_FALSE(directory.LookupBank("99999999", record));
}

TEST_F(BankDirectoryTest, FirstRecordPerBlzWins) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    std::string bic;
    ASSERT_TRUE(directory.ResolveBicByBankCode("37040044", bic));
    EXPECT_EQ(bic, "COBADEFFXXX");
    EXPECT_EQ(directory.BlzEntryCount(), 3u);
}

TEST_F(BankDirectoryTest, RecordWithoutBic) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    BankRecord record;
    ASSERT_TRUE(directory.LookupBank("12030000", record));
    EXPECT_TRUE(record.bic.empty());

    std::string bic;
    EXPECT_FALSE(directory.ResolveBicByBankCode("12030000", bic));
}

TEST_F(BankDirectoryTest, LoadsLazily) {
    BundesbankDirectory directory(blz_path_, bic_path_);
    EXPECT_EQ(directory.BlzEntryCount(), 0u);
    EXPECT_EQ(directory.BicEntryCount(), 0u);

    std::string bic;
    directory.ResolveBicByBankCode("10000000", bic);
    EXPECT_EQ(directory.BlzEntryCount(), 3u);
    EXPECT_EQ(directory.BicEntryCount(), 0u);
}

TEST_F(BankDirectoryTest, GzipCompressedFile) {
    std::string gz_path = TempPath("blz.txt.gz");
    WriteGzipFile(gz_path, {BlzLine("50010517", "ING-DiBa", "INGDDEFFXXX")});

    BundesbankDirectory directory(gz_path, bic_path_);
    std::string bic;
    ASSERT_TRUE(directory.ResolveBicByBankCode("50010517", bic));
    EXPECT_EQ(bic, "INGDDEFFXXX");

    std::remove(gz_path.c_str());
}

TEST_F(BankDirectoryTest, MissingFileThrows) {
    BundesbankDirectory directory(TempPath("does_not_exist.txt"), TempPath("does_not_exist.csv"));

    std::string value;
    EXPECT_THROW(directory.ResolveBicByBankCode("37040044", value), std::runtime_error);
    EXPECT_THROW(directory.ResolveBankNameByBic("COBADEFF", value), std::runtime_error);
}

TEST_F(BankDirectoryTest, EmptyFileThrows) {
    std::string empty_path = TempPath("empty.txt");
    WriteTextFile(empty_path, {});

    BundesbankDirectory directory(empty_path, empty_path);
    std::string value;
    EXPECT_THROW(directory.ResolveBicByBankCode("37040044", value), std::runtime_error);

    std::remove(empty_path.c_str());
}

TEST_F(BankDirectoryTest, ChangingPathReloads) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    std::string bic;
    ASSERT_TRUE(directory.ResolveBicByBankCode("37040044", bic));

    std::string other_path = TempPath("blz_other.txt");
    WriteTextFile(other_path, {BlzLine("37040044", "Other Bank", "OTHRDEFFXXX")});

    directory.SetBlzFilePath(other_path);
    EXPECT_EQ(directory.GetBlzFilePath(), other_path);
    EXPECT_EQ(directory.BlzEntryCount(), 0u);

    ASSERT_TRUE(directory.ResolveBicByBankCode("37040044", bic));
    EXPECT_EQ(bic, "OTHRDEFFXXX");
    EXPECT_FALSE(directory.ResolveBicByBankCode("10000000", bic));

    std::remove(other_path.c_str());
}

TEST_F(BankDirectoryTest, ResetDropsLoadedData) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    std::string value;
    directory.ResolveBicByBankCode("37040044", value);
    directory.ResolveBankNameByBic("COBADEFF", value);
    EXPECT_GT(directory.BlzEntryCount(), 0u);
    EXPECT_GT(directory.BicEntryCount(), 0u);

    directory.Reset();
    EXPECT_EQ(directory.BlzEntryCount(), 0u);
    EXPECT_EQ(directory.BicEntryCount(), 0u);
    EXPECT_EQ(directory.GetBlzFilePath(), blz_path_);
}

// ============================================================================
// BIC directory
// ============================================================================

TEST_F(BankDirectoryTest, BankNameByBic8) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    std::string name;
    ASSERT_TRUE(directory.ResolveBankNameByBic("COBADEFFXXX", name));
    EXPECT_EQ(name, "Commerzbank");
    ASSERT_TRUE(directory.ResolveBankNameByBic("cobadeff370", name));
    EXPECT_EQ(name, "Commerzbank");
    ASSERT_TRUE(directory.ResolveBankNameByBic("DEUTDEFF", name));
    EXPECT_EQ(name, "Deutsche Bank");

    EXPECT_FALSE(directory.ResolveBankNameByBic("MARKDEF1", name));
    EXPECT_EQ(directory.BicEntryCount(), 2u);
}

TEST_F(BankDirectoryTest, BicPathIsConfigurable) {
    BundesbankDirectory directory(blz_path_, bic_path_);
    EXPECT_EQ(directory.GetBicFilePath(), bic_path_);

    std::string other_path = TempPath("bic_other.csv");
    WriteTextFile(other_path, {"MARKDEF1100;Deutsche Bundesbank"});
    directory.SetBicFilePath(other_path);

    std::string name;
    ASSERT_TRUE(directory.ResolveBankNameByBic("MARKDEF1", name));
    EXPECT_EQ(name, "Deutsche Bundesbank");
    EXPECT_FALSE(directory.ResolveBankNameByBic("COBADEFF", name));

    std::remove(other_path.c_str());
}

// ============================================================================
// Engine integration
// ============================================================================

TEST_F(BankDirectoryTest, BicFromIban) {
    BundesbankDirectory directory(blz_path_, bic_path_);

    std::string bic;
    ASSERT_TRUE(IbanEngine::BicFromIban("DE89 3704 0044 0532 0130 00", directory, bic));
    EXPECT_EQ(bic, "COBADEFFXXX");

    std::string description;
    ASSERT_TRUE(IbanEngine::DescribeBic(bic, directory, description));
    EXPECT_EQ(description, "COBADEFFXXX Commerzbank");
}
