#include "include/creditor_id_functions.hpp"
#include "include/function_helpers.hpp"
#include "checksum/creditor_id.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/common/vector_operations/ternary_executor.hpp"
#include <string>

namespace duckdb {
namespace finid {

using checksum::ChecksumException;
using checksum::CountryCode;
using checksum::CreditorIdEngine;
using checksum::CreditorIdParts;

static void FinidIsValidCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, CreditorIdEngine::Validate);
}

static void FinidCreditorIdCheckResultFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t creditor_id) {
            auto check_result = CreditorIdEngine::Check(creditor_id.GetString());
            return StringVector::AddString(result, checksum::ChecksumErrorToString(check_result));
        });
}

static void FinidIsCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, CreditorIdEngine::IsWellFormed);
}

static void FinidIsGermanCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, CreditorIdEngine::IsGerman);
}

// finid_generate_creditor_id(country, business_area, national_id)
static void FinidGenerateCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    TernaryExecutor::Execute<string_t, string_t, string_t, string_t>(
        args.data[0], args.data[1], args.data[2], result, args.size(),
        [&](string_t country, string_t business_area, string_t national_id) {
            try {
                auto creditor_id = CreditorIdEngine::Generate(country.GetString(), business_area.GetString(),
                                                              national_id.GetString());
                return StringVector::AddString(result, creditor_id);
            } catch (const ChecksumException &e) {
                throw ToInvalidInput(e);
            }
        });
}

// finid_creditor_id_check_digits(country, national_id)
static void FinidCreditorIdCheckDigitsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t country, string_t national_id) {
            try {
                auto check_digits = CreditorIdEngine::CalculateCheckDigits(country.GetString(),
                                                                           national_id.GetString());
                return StringVector::AddString(result, check_digits);
            } catch (const ChecksumException &e) {
                throw ToInvalidInput(e);
            }
        });
}

// STRUCT(country_code, check_digits, business_area, national_id); NULL when too short
static void FinidDecomposeCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &input_vector = args.data[0];
    auto count = args.size();

    auto &struct_entries = StructVector::GetEntries(result);

    UnifiedVectorFormat input_data;
    input_vector.ToUnifiedFormat(count, input_data);
    auto input_strings = UnifiedVectorFormat::GetData<string_t>(input_data);

    for (idx_t i = 0; i < count; i++) {
        auto idx = input_data.sel->get_index(i);

        CreditorIdParts parts;
        if (!input_data.validity.RowIsValid(idx) ||
            !CreditorIdEngine::Decompose(input_strings[idx].GetString(), parts)) {
            FlatVector::SetNull(result, i, true);
            for (auto &entry : struct_entries) {
                FlatVector::SetNull(*entry, i, true);
            }
            continue;
        }

        const std::string values[] = {parts.country_code, parts.check_digits, parts.business_area,
                                      parts.national_id};
        FlatVector::SetNull(result, i, false);
        for (idx_t field = 0; field < struct_entries.size(); field++) {
            auto &field_vec = *struct_entries[field];
            FlatVector::SetNull(field_vec, i, false);
            FlatVector::GetData<string_t>(field_vec)[i] = StringVector::AddString(field_vec, values[field]);
        }
    }
}

static void FinidNormalizeCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t creditor_id) {
            return StringVector::AddString(result, CreditorIdEngine::Normalize(creditor_id.GetString()));
        });
}

static void FinidFormatCreditorIdFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t creditor_id) {
            return StringVector::AddString(result, CreditorIdEngine::Format(creditor_id.GetString()));
        });
}

static void FinidFormatCreditorIdSeparatorFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t creditor_id, string_t separator) {
            auto formatted = CreditorIdEngine::Format(creditor_id.GetString(), separator.GetString());
            return StringVector::AddString(result, formatted);
        });
}

static void FinidCreditorIdMatchesCountryFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, bool>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t creditor_id, string_t country) {
            CountryCode code;
            if (!CountryCode::TryParse(country.GetString(), code)) {
                return false;
            }
            return CreditorIdEngine::MatchesCountry(creditor_id.GetString(), code);
        });
}

void RegisterCreditorIdFunctions(ExtensionLoader &loader) {
    // finid_is_valid_creditor_id(ci) - MOD 97-10 over national id + country + check digits
    ScalarFunctionSet is_valid_set("finid_is_valid_creditor_id");
    is_valid_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsValidCreditorIdFunction));
    loader.RegisterFunction(is_valid_set);

    ScalarFunctionSet check_result_set("finid_creditor_id_check_result");
    check_result_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidCreditorIdCheckResultFunction));
    loader.RegisterFunction(check_result_set);

    ScalarFunctionSet is_creditor_id_set("finid_is_creditor_id");
    is_creditor_id_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsCreditorIdFunction));
    loader.RegisterFunction(is_creditor_id_set);

    ScalarFunctionSet is_german_set("finid_is_german_creditor_id");
    is_german_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsGermanCreditorIdFunction));
    loader.RegisterFunction(is_german_set);

    ScalarFunctionSet generate_set("finid_generate_creditor_id");
    generate_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR},
                                            LogicalType::VARCHAR, FinidGenerateCreditorIdFunction));
    loader.RegisterFunction(generate_set);

    ScalarFunctionSet check_digits_set("finid_creditor_id_check_digits");
    check_digits_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                                LogicalType::VARCHAR, FinidCreditorIdCheckDigitsFunction));
    loader.RegisterFunction(check_digits_set);

    child_list_t<LogicalType> struct_children;
    struct_children.push_back(make_pair("country_code", LogicalType::VARCHAR));
    struct_children.push_back(make_pair("check_digits", LogicalType::VARCHAR));
    struct_children.push_back(make_pair("business_area", LogicalType::VARCHAR));
    struct_children.push_back(make_pair("national_id", LogicalType::VARCHAR));
    ScalarFunctionSet decompose_set("finid_decompose_creditor_id");
    decompose_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::STRUCT(std::move(struct_children)),
                                             FinidDecomposeCreditorIdFunction));
    loader.RegisterFunction(decompose_set);

    ScalarFunctionSet normalize_set("finid_normalize_creditor_id");
    normalize_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidNormalizeCreditorIdFunction));
    loader.RegisterFunction(normalize_set);

    // finid_format_creditor_id(ci [, separator])
    ScalarFunctionSet format_set("finid_format_creditor_id");
    format_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidFormatCreditorIdFunction));
    format_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                          FinidFormatCreditorIdSeparatorFunction));
    loader.RegisterFunction(format_set);

    ScalarFunctionSet matches_country_set("finid_creditor_id_matches_country");
    matches_country_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                                   LogicalType::BOOLEAN, FinidCreditorIdMatchesCountryFunction));
    loader.RegisterFunction(matches_country_set);
}

} // namespace finid
} // namespace duckdb
