#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace finid {

// Register BIC/BLZ directory lookups and their configuration functions
void RegisterBankLookupFunctions(ExtensionLoader &loader);

} // namespace finid
} // namespace duckdb
