#include "finid_extension.hpp"

// Include all function registration headers
#include "iban_validation.hpp"
#include "creditor_id_functions.hpp"
#include "card_functions.hpp"
#include "bank_lookup_functions.hpp"

namespace duckdb {

void FinidExtension::Load(ExtensionLoader &loader) {
    // IBAN, BIC, BLZ and account number functions
    finid::RegisterIbanValidationFunctions(loader);

    // SEPA creditor identifier functions
    finid::RegisterCreditorIdFunctions(loader);

    // Payment card functions
    finid::RegisterCardFunctions(loader);

    // Bank directory lookups; files are read lazily on first use
    finid::RegisterBankLookupFunctions(loader);
}

std::string FinidExtension::Name() {
    return "finid";
}

std::string FinidExtension::Version() const {
#ifdef EXT_VERSION
    return EXT_VERSION;
#else
    return "v1.0.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(finid, loader) {
    duckdb::FinidExtension ext;
    ext.Load(loader);
}
}
