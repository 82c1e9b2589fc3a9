#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace finid {

// Register IBAN, BIC, BLZ and account number functions
void RegisterIbanValidationFunctions(ExtensionLoader &loader);

} // namespace finid
} // namespace duckdb
