#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace finid {

// Register payment card functions
void RegisterCardFunctions(ExtensionLoader &loader);

} // namespace finid
} // namespace duckdb
