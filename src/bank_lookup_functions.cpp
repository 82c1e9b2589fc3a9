#include "include/bank_lookup_functions.hpp"
#include "include/bank_directory_loader.hpp"
#include "include/function_helpers.hpp"
#include "checksum/iban.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <stdexcept>
#include <string>

namespace duckdb {
namespace finid {

using checksum::IbanEngine;

// Directory lookups map a missing key to NULL and an unusable file to an IO Error
template <class LOOKUP>
static void ExecuteDirectoryLookup(DataChunk &args, Vector &result, LOOKUP lookup) {
    auto &directory = BundesbankDirectory::GetInstance();
    ExecuteOptionalString(args, result, [&](const std::string &key, std::string &value) {
        try {
            return lookup(directory, key, value);
        } catch (const std::runtime_error &e) {
            throw IOException(std::string(e.what()));
        }
    });
}

static void FinidBicFromIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteDirectoryLookup(args, result, [](BundesbankDirectory &directory, const std::string &iban, std::string &bic) {
        return IbanEngine::BicFromIban(iban, directory, bic);
    });
}

static void FinidBicFromBlzFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteDirectoryLookup(args, result, [](BundesbankDirectory &directory, const std::string &blz, std::string &bic) {
        return directory.ResolveBicByBankCode(blz, bic);
    });
}

static void FinidBankNameFromBicFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteDirectoryLookup(args, result, [](BundesbankDirectory &directory, const std::string &bic, std::string &name) {
        return directory.ResolveBankNameByBic(bic, name);
    });
}

// 'BIC8XXX Bank name'
static void FinidDescribeBicFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteDirectoryLookup(args, result, [](BundesbankDirectory &directory, const std::string &bic, std::string &description) {
        return IbanEngine::DescribeBic(bic, directory, description);
    });
}

static void FinidSetBlzFileFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string path = input.GetString();
            BundesbankDirectory::GetInstance().SetBlzFilePath(path);
            return StringVector::AddString(result, "Bank code directory set to: " + path);
        });
}

static void FinidGetBlzFileFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    std::string path;
    try {
        path = BundesbankDirectory::GetInstance().GetBlzFilePath();
    } catch (const std::runtime_error &e) {
        throw IOException(std::string(e.what()));
    }
    result.SetVectorType(VectorType::CONSTANT_VECTOR);
    auto result_data = ConstantVector::GetData<string_t>(result);
    result_data[0] = StringVector::AddString(result, path);
}

static void FinidSetBicFileFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            std::string path = input.GetString();
            BundesbankDirectory::GetInstance().SetBicFilePath(path);
            return StringVector::AddString(result, "BIC directory set to: " + path);
        });
}

static void FinidGetBicFileFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    std::string path;
    try {
        path = BundesbankDirectory::GetInstance().GetBicFilePath();
    } catch (const std::runtime_error &e) {
        throw IOException(std::string(e.what()));
    }
    result.SetVectorType(VectorType::CONSTANT_VECTOR);
    auto result_data = ConstantVector::GetData<string_t>(result);
    result_data[0] = StringVector::AddString(result, path);
}

static void RegisterVolatileFunction(ExtensionLoader &loader, const std::string &name,
                                     vector<LogicalType> arguments, scalar_function_t function) {
    ScalarFunctionSet set(name);
    ScalarFunction func(std::move(arguments), LogicalType::VARCHAR, std::move(function));
    func.stability = FunctionStability::VOLATILE;
    set.AddFunction(func);
    loader.RegisterFunction(set);
}

void RegisterBankLookupFunctions(ExtensionLoader &loader) {
    // Lookups read files that can change between queries
    RegisterVolatileFunction(loader, "finid_bic_from_iban", {LogicalType::VARCHAR}, FinidBicFromIbanFunction);
    RegisterVolatileFunction(loader, "finid_bic_from_blz", {LogicalType::VARCHAR}, FinidBicFromBlzFunction);
    RegisterVolatileFunction(loader, "finid_bank_name_from_bic", {LogicalType::VARCHAR}, FinidBankNameFromBicFunction);
    RegisterVolatileFunction(loader, "finid_describe_bic", {LogicalType::VARCHAR}, FinidDescribeBicFunction);

    // finid_set_blz_file(path) / finid_get_blz_file()
    RegisterVolatileFunction(loader, "finid_set_blz_file", {LogicalType::VARCHAR}, FinidSetBlzFileFunction);
    RegisterVolatileFunction(loader, "finid_get_blz_file", {}, FinidGetBlzFileFunction);

    // finid_set_bic_file(path) / finid_get_bic_file()
    RegisterVolatileFunction(loader, "finid_set_bic_file", {LogicalType::VARCHAR}, FinidSetBicFileFunction);
    RegisterVolatileFunction(loader, "finid_get_bic_file", {}, FinidGetBicFileFunction);
}

} // namespace finid
} // namespace duckdb
