#pragma once

#include "checksum/bank_directory.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {
namespace finid {

// One record of the Bundesbank bank code directory
struct BankRecord {
    std::string blz;         // 8-digit bank code
    std::string bank_name;   // Bank name (trimmed)
    std::string bic;         // BIC, empty for records without one
};

// File backed bank directory: the Bundesbank fixed-width BLZ file plus a
// semicolon separated BIC;Name list. Both files may be plain or gzip
// compressed. Each file is loaded once, on its first lookup.
class BundesbankDirectory : public checksum::BankDirectory {
public:
    // Process-wide directory used by the SQL functions
    static BundesbankDirectory& GetInstance();

    // Standalone directory with default file paths
    BundesbankDirectory();
    BundesbankDirectory(const std::string& blz_file_path, const std::string& bic_file_path);

    bool ResolveBicByBankCode(const std::string& bank_code, std::string& bic) override;
    bool ResolveBankNameByBic(const std::string& bic, std::string& bank_name) override;

    // Full record for a BLZ (first record per BLZ, i.e. the main office)
    bool LookupBank(const std::string& blz, BankRecord& record);

    // Configurable file locations; changing a path drops the loaded index
    void SetBlzFilePath(const std::string& path);
    std::string GetBlzFilePath();
    void SetBicFilePath(const std::string& path);
    std::string GetBicFilePath();

    // Forget loaded data; the next lookup reloads
    void Reset();

    size_t BlzEntryCount();
    size_t BicEntryCount();

private:
    BundesbankDirectory(const BundesbankDirectory&) = delete;
    BundesbankDirectory& operator=(const BundesbankDirectory&) = delete;

    // Callers hold mutex_; both throw std::runtime_error when the file is
    // missing or yields no records
    void EnsureBlzLoaded();
    void EnsureBicLoaded();

    bool LoadBlzFile(const std::string& path);
    bool LoadBicFile(const std::string& path);

    static std::string DefaultFilePath(const char* filename);
    static bool FileExists(const std::string& path);
    static bool ReadLines(const std::string& path, std::vector<std::string>& lines);

    std::mutex mutex_;

    bool blz_loaded_;
    bool bic_loaded_;
    std::string blz_file_path_;
    std::string bic_file_path_;
    std::unordered_map<std::string, BankRecord> banks_;        // BLZ -> record
    std::unordered_map<std::string, std::string> bic_names_;   // BIC8 -> bank name

    static constexpr const char* BLZ_FILENAME = "blz.txt";
    static constexpr const char* BIC_FILENAME = "bic.csv";
};

} // namespace finid
} // namespace duckdb
