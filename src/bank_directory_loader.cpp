#include "bank_directory_loader.hpp"
#include "checksum/string_utils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <zlib.h>

namespace duckdb {
namespace finid {

using checksum::all_digits;
using checksum::to_upper;
using checksum::trim;

// Bundesbank "Bankleitzahlendatei" fixed-width columns
static const size_t BLZ_OFFSET = 0;
static const size_t BLZ_LENGTH = 8;
static const size_t NAME_OFFSET = 9;
static const size_t NAME_LENGTH = 58;
static const size_t BIC_OFFSET = 139;
static const size_t BIC_LENGTH = 11;

BundesbankDirectory::BundesbankDirectory() : blz_loaded_(false), bic_loaded_(false) {
}

BundesbankDirectory::BundesbankDirectory(const std::string& blz_file_path, const std::string& bic_file_path)
    : blz_loaded_(false), bic_loaded_(false), blz_file_path_(blz_file_path), bic_file_path_(bic_file_path) {
}

BundesbankDirectory& BundesbankDirectory::GetInstance() {
    static BundesbankDirectory instance;
    return instance;
}

std::string BundesbankDirectory::DefaultFilePath(const char* filename) {
    const char* home = getenv("HOME");
    if (!home) {
        home = getenv("USERPROFILE"); // Windows fallback
    }

    if (!home) {
        throw std::runtime_error("Cannot determine home directory for bank directory files");
    }

    // ~/.finid/<filename>
    return std::string(home) + "/.finid/" + filename;
}

bool BundesbankDirectory::FileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// gzopen reads uncompressed files transparently
bool BundesbankDirectory::ReadLines(const std::string& path, std::vector<std::string>& lines) {
    gzFile file = gzopen(path.c_str(), "rb");
    if (!file) {
        return false;
    }

    char buffer[1024];
    std::string line;
    while (gzgets(file, buffer, sizeof(buffer)) != Z_NULL) {
        line += buffer;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
            line.clear();
        }
    }
    if (!line.empty()) {
        lines.push_back(line);
    }

    int error_code = 0;
    gzerror(file, &error_code);
    bool ok = error_code == Z_OK || error_code == Z_STREAM_END;
    gzclose(file);
    return ok;
}

std::string BundesbankDirectory::GetBlzFilePath() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blz_file_path_.empty()) {
        blz_file_path_ = DefaultFilePath(BLZ_FILENAME);
    }
    return blz_file_path_;
}

std::string BundesbankDirectory::GetBicFilePath() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bic_file_path_.empty()) {
        bic_file_path_ = DefaultFilePath(BIC_FILENAME);
    }
    return bic_file_path_;
}

void BundesbankDirectory::SetBlzFilePath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path != blz_file_path_) {
        blz_file_path_ = path;
        blz_loaded_ = false;
        banks_.clear();
    }
}

void BundesbankDirectory::SetBicFilePath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path != bic_file_path_) {
        bic_file_path_ = path;
        bic_loaded_ = false;
        bic_names_.clear();
    }
}

void BundesbankDirectory::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    blz_loaded_ = false;
    bic_loaded_ = false;
    banks_.clear();
    bic_names_.clear();
}

bool BundesbankDirectory::LoadBlzFile(const std::string& path) {
    std::vector<std::string> lines;
    if (!ReadLines(path, lines)) {
        std::cerr << "Failed to read bank code directory: " << path << std::endl;
        return false;
    }

    banks_.clear();
    size_t skipped = 0;

    for (const auto& line : lines) {
        if (line.length() < BLZ_LENGTH) {
            if (!trim(line).empty()) {
                skipped++;
            }
            continue;
        }

        std::string blz = line.substr(BLZ_OFFSET, BLZ_LENGTH);
        if (!all_digits(blz)) {
            skipped++;
            continue;
        }

        // First record per BLZ is the main office
        if (banks_.find(blz) != banks_.end()) {
            continue;
        }

        BankRecord record;
        record.blz = blz;
        if (line.length() > NAME_OFFSET) {
            record.bank_name = trim(line.substr(NAME_OFFSET, NAME_LENGTH));
        }
        if (line.length() > BIC_OFFSET) {
            record.bic = trim(line.substr(BIC_OFFSET, BIC_LENGTH));
        }
        banks_[blz] = record;
    }

    if (skipped > 0) {
        std::cerr << "Skipped " << skipped << " malformed lines in " << path << std::endl;
    }
    std::cout << "Loaded " << banks_.size() << " bank codes from " << path << std::endl;
    return !banks_.empty();
}

bool BundesbankDirectory::LoadBicFile(const std::string& path) {
    std::vector<std::string> lines;
    if (!ReadLines(path, lines)) {
        std::cerr << "Failed to read BIC directory: " << path << std::endl;
        return false;
    }

    bic_names_.clear();
    size_t skipped = 0;

    for (const auto& line : lines) {
        size_t separator = line.find(';');
        if (separator == std::string::npos) {
            if (!trim(line).empty()) {
                skipped++;
            }
            continue;
        }

        std::string bic8 = to_upper(trim(line.substr(0, separator))).substr(0, 8);
        if (bic8.empty()) {
            skipped++;
            continue;
        }

        size_t name_end = line.find(';', separator + 1);
        std::string name = trim(line.substr(separator + 1,
                                            name_end == std::string::npos ? std::string::npos
                                                                          : name_end - separator - 1));

        // Keep the first name per BIC8
        if (bic_names_.find(bic8) == bic_names_.end()) {
            bic_names_[bic8] = name;
        }
    }

    if (skipped > 0) {
        std::cerr << "Skipped " << skipped << " malformed lines in " << path << std::endl;
    }
    std::cout << "Loaded " << bic_names_.size() << " BIC entries from " << path << std::endl;
    return !bic_names_.empty();
}

void BundesbankDirectory::EnsureBlzLoaded() {
    if (blz_loaded_) {
        return;
    }

    if (blz_file_path_.empty()) {
        blz_file_path_ = DefaultFilePath(BLZ_FILENAME);
    }

    if (!FileExists(blz_file_path_)) {
        std::cerr << "Bank code directory not found at " << blz_file_path_ << std::endl;
        throw std::runtime_error("Bank code directory not found at " + blz_file_path_ +
                                 ". Set its location with finid_set_blz_file().");
    }

    if (!LoadBlzFile(blz_file_path_)) {
        throw std::runtime_error("Failed to load bank code directory from " + blz_file_path_);
    }

    blz_loaded_ = true;
}

void BundesbankDirectory::EnsureBicLoaded() {
    if (bic_loaded_) {
        return;
    }

    if (bic_file_path_.empty()) {
        bic_file_path_ = DefaultFilePath(BIC_FILENAME);
    }

    if (!FileExists(bic_file_path_)) {
        std::cerr << "BIC directory not found at " << bic_file_path_ << std::endl;
        throw std::runtime_error("BIC directory not found at " + bic_file_path_ +
                                 ". Set its location with finid_set_bic_file().");
    }

    if (!LoadBicFile(bic_file_path_)) {
        throw std::runtime_error("Failed to load BIC directory from " + bic_file_path_);
    }

    bic_loaded_ = true;
}

bool BundesbankDirectory::LookupBank(const std::string& blz, BankRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    EnsureBlzLoaded();

    auto it = banks_.find(trim(blz));
    if (it == banks_.end()) {
        return false;
    }
    record = it->second;
    return true;
}

bool BundesbankDirectory::ResolveBicByBankCode(const std::string& bank_code, std::string& bic) {
    BankRecord record;
    if (!LookupBank(bank_code, record) || record.bic.empty()) {
        return false;
    }
    bic = record.bic;
    return true;
}

bool BundesbankDirectory::ResolveBankNameByBic(const std::string& bic, std::string& bank_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    EnsureBicLoaded();

    std::string bic8 = to_upper(trim(bic)).substr(0, 8);
    auto it = bic_names_.find(bic8);
    if (it == bic_names_.end()) {
        return false;
    }
    bank_name = it->second;
    return true;
}

size_t BundesbankDirectory::BlzEntryCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return banks_.size();
}

size_t BundesbankDirectory::BicEntryCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return bic_names_.size();
}

} // namespace finid
} // namespace duckdb
