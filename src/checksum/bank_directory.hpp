#pragma once

#include <string>

namespace duckdb {
namespace finid {
namespace checksum {

// Read-only reference dataset the engines query by key.
// Implementations may load lazily, so lookups are not const.
class BankDirectory {
public:
    virtual ~BankDirectory() = default;

    // BIC of the main office for a national bank code (German BLZ)
    virtual bool ResolveBicByBankCode(const std::string& bank_code, std::string& bic) = 0;

    // Bank name for a BIC; only the first 8 characters are significant
    virtual bool ResolveBankNameByBic(const std::string& bic, std::string& bank_name) = 0;
};

} // namespace checksum
} // namespace finid
} // namespace duckdb
