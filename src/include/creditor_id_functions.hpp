#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace finid {

// Register SEPA creditor identifier functions
void RegisterCreditorIdFunctions(ExtensionLoader &loader);

} // namespace finid
} // namespace duckdb
