#include "include/iban_validation.hpp"
#include "include/function_helpers.hpp"
#include "checksum/iban.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <string>

namespace duckdb {
namespace finid {

using checksum::ChecksumException;
using checksum::IbanComponents;
using checksum::IbanEngine;

static void FinidIsValidIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::Validate);
}

// 'OK', 'INVALID_CHARACTER', 'UNKNOWN_COUNTRY', 'LENGTH_MISMATCH', 'MALFORMED_INPUT', 'CHECKSUM_MISMATCH'
static void FinidIbanCheckResultFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t iban) {
            auto check_result = IbanEngine::Check(iban.GetString());
            return StringVector::AddString(result, checksum::ChecksumErrorToString(check_result));
        });
}

static void FinidIsIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::IsWellFormed);
}

static void FinidHasIbanFormatFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::HasIbanFormat);
}

static void FinidIsAnonymizedIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::IsAnonymized);
}

static void FinidIsSepaIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::IsSepa);
}

static void FinidIsBicFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::IsBic);
}

static void FinidIsBlzFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::IsBlz);
}

static void FinidIsKtoFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, IbanEngine::IsKto);
}

static void FinidIsIbanFromCountryFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, bool>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t iban, string_t country) {
            return IbanEngine::IsFromCountry(iban.GetString(), country.GetString());
        });
}

static void FinidGenerateIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t country, string_t account) {
            try {
                auto iban = IbanEngine::Generate(country.GetString(), account.GetString());
                return StringVector::AddString(result, iban);
            } catch (const ChecksumException &e) {
                throw ToInvalidInput(e);
            }
        });
}

static void FinidGenerateGermanIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, string_t, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t blz, string_t kto) {
            try {
                auto iban = IbanEngine::GenerateGerman(blz.GetString(), kto.GetString());
                return StringVector::AddString(result, iban);
            } catch (const ChecksumException &e) {
                throw ToInvalidInput(e);
            }
        });
}

static void FinidFormatIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t iban) {
            return StringVector::AddString(result, IbanEngine::Format(iban.GetString()));
        });
}

static void FinidGetIbanCountryCodeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteOptionalString(args, result, IbanEngine::CountryCodeOf);
}

static void FinidGetIbanCheckDigitsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteOptionalString(args, result, IbanEngine::CheckDigitsOf);
}

static void FinidGetBbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteOptionalString(args, result, IbanEngine::BbanOf);
}

static void FinidGetIbanBankCodeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteOptionalString(args, result, IbanEngine::BankCode);
}

static void FinidGetIbanAccountNumberFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteOptionalString(args, result, IbanEngine::AccountNumber);
}

// STRUCT(blz VARCHAR, kto VARCHAR), NULL for anything but a German IBAN
static void FinidSplitIbanFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &input_vector = args.data[0];
    auto count = args.size();

    auto &struct_entries = StructVector::GetEntries(result);
    auto &blz_vec = *struct_entries[0];
    auto &kto_vec = *struct_entries[1];

    UnifiedVectorFormat input_data;
    input_vector.ToUnifiedFormat(count, input_data);
    auto input_strings = UnifiedVectorFormat::GetData<string_t>(input_data);

    for (idx_t i = 0; i < count; i++) {
        auto idx = input_data.sel->get_index(i);

        checksum::GermanAccount account;
        if (!input_data.validity.RowIsValid(idx) ||
            !IbanEngine::Split(input_strings[idx].GetString(), account)) {
            FlatVector::SetNull(result, i, true);
            FlatVector::SetNull(blz_vec, i, true);
            FlatVector::SetNull(kto_vec, i, true);
            continue;
        }

        FlatVector::SetNull(result, i, false);
        FlatVector::SetNull(blz_vec, i, false);
        FlatVector::SetNull(kto_vec, i, false);
        FlatVector::GetData<string_t>(blz_vec)[i] = StringVector::AddString(blz_vec, account.blz);
        FlatVector::GetData<string_t>(kto_vec)[i] = StringVector::AddString(kto_vec, account.kto);
    }
}

static LogicalType IbanFieldType() {
    child_list_t<LogicalType> field_children;
    field_children.push_back(make_pair("name", LogicalType::VARCHAR));
    field_children.push_back(make_pair("value", LogicalType::VARCHAR));
    return LogicalType::STRUCT(std::move(field_children));
}

static Value OptionalField(const IbanComponents &components, const std::string &name) {
    std::string value;
    if (!components.GetField(name, value)) {
        return Value(LogicalType::VARCHAR);
    }
    return Value(value);
}

// STRUCT(country_code, check_digits, bban, bank_code, branch_code, account_number,
//        fields LIST(STRUCT(name, value)))
static void FinidIbanComponentsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &input_vector = args.data[0];
    auto count = args.size();
    auto field_type = IbanFieldType();

    UnifiedVectorFormat input_data;
    input_vector.ToUnifiedFormat(count, input_data);
    auto input_strings = UnifiedVectorFormat::GetData<string_t>(input_data);

    for (idx_t i = 0; i < count; i++) {
        auto idx = input_data.sel->get_index(i);

        IbanComponents components;
        if (!input_data.validity.RowIsValid(idx) ||
            !IbanEngine::SplitComponents(input_strings[idx].GetString(), components)) {
            result.SetValue(i, Value(result.GetType()));
            continue;
        }

        vector<Value> fields;
        for (const auto &field : components.fields) {
            child_list_t<Value> field_values;
            field_values.push_back(make_pair("name", Value(field.first)));
            field_values.push_back(make_pair("value", Value(field.second)));
            fields.push_back(Value::STRUCT(std::move(field_values)));
        }

        child_list_t<Value> values;
        values.push_back(make_pair("country_code", Value(components.country_code)));
        values.push_back(make_pair("check_digits", Value(components.check_digits)));
        values.push_back(make_pair("bban", Value(components.bban)));
        values.push_back(make_pair("bank_code", OptionalField(components, "bankCode")));
        values.push_back(make_pair("branch_code", OptionalField(components, "branchCode")));
        values.push_back(make_pair("account_number", OptionalField(components, "accountNumber")));
        values.push_back(make_pair("fields", Value::LIST(field_type, std::move(fields))));
        result.SetValue(i, Value::STRUCT(std::move(values)));
    }
}

void RegisterIbanValidationFunctions(ExtensionLoader &loader) {
    // finid_is_valid_iban(iban) - Full check: format, country, length and MOD 97-10
    ScalarFunctionSet is_valid_iban_set("finid_is_valid_iban");
    is_valid_iban_set.AddFunction(ScalarFunction({LogicalType::VARCHAR},
                                                  LogicalType::BOOLEAN,
                                                  FinidIsValidIbanFunction));
    loader.RegisterFunction(is_valid_iban_set);

    // finid_iban_check_result(iban) - Detailed result code
    ScalarFunctionSet check_result_set("finid_iban_check_result");
    check_result_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidIbanCheckResultFunction));
    loader.RegisterFunction(check_result_set);

    // finid_is_iban(iban) - Structural check only
    ScalarFunctionSet is_iban_set("finid_is_iban");
    is_iban_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsIbanFunction));
    loader.RegisterFunction(is_iban_set);

    ScalarFunctionSet has_format_set("finid_has_iban_format");
    has_format_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidHasIbanFormatFunction));
    loader.RegisterFunction(has_format_set);

    ScalarFunctionSet anonymized_set("finid_is_anonymized_iban");
    anonymized_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsAnonymizedIbanFunction));
    loader.RegisterFunction(anonymized_set);

    // finid_generate_iban(country, bban) - Computes the check digits
    ScalarFunctionSet generate_set("finid_generate_iban");
    generate_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                            LogicalType::VARCHAR, FinidGenerateIbanFunction));
    loader.RegisterFunction(generate_set);

    // finid_generate_german_iban(blz, kto)
    ScalarFunctionSet generate_german_set("finid_generate_german_iban");
    generate_german_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                                   LogicalType::VARCHAR, FinidGenerateGermanIbanFunction));
    loader.RegisterFunction(generate_german_set);

    // finid_format_iban(iban) - Format IBAN with spaces every 4 characters
    ScalarFunctionSet format_iban_set("finid_format_iban");
    format_iban_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidFormatIbanFunction));
    loader.RegisterFunction(format_iban_set);

    ScalarFunctionSet get_country_code_set("finid_get_iban_country_code");
    get_country_code_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidGetIbanCountryCodeFunction));
    loader.RegisterFunction(get_country_code_set);

    ScalarFunctionSet get_check_digits_set("finid_get_iban_check_digits");
    get_check_digits_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidGetIbanCheckDigitsFunction));
    loader.RegisterFunction(get_check_digits_set);

    ScalarFunctionSet get_bban_set("finid_get_bban");
    get_bban_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidGetBbanFunction));
    loader.RegisterFunction(get_bban_set);

    // finid_split_iban(iban) - German BLZ/KTO split
    child_list_t<LogicalType> split_children;
    split_children.push_back(make_pair("blz", LogicalType::VARCHAR));
    split_children.push_back(make_pair("kto", LogicalType::VARCHAR));
    ScalarFunctionSet split_set("finid_split_iban");
    split_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::STRUCT(std::move(split_children)),
                                         FinidSplitIbanFunction));
    loader.RegisterFunction(split_set);

    // finid_iban_components(iban) - Country specific BBAN fields
    child_list_t<LogicalType> component_children;
    component_children.push_back(make_pair("country_code", LogicalType::VARCHAR));
    component_children.push_back(make_pair("check_digits", LogicalType::VARCHAR));
    component_children.push_back(make_pair("bban", LogicalType::VARCHAR));
    component_children.push_back(make_pair("bank_code", LogicalType::VARCHAR));
    component_children.push_back(make_pair("branch_code", LogicalType::VARCHAR));
    component_children.push_back(make_pair("account_number", LogicalType::VARCHAR));
    component_children.push_back(make_pair("fields", LogicalType::LIST(IbanFieldType())));
    ScalarFunctionSet components_set("finid_iban_components");
    components_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::STRUCT(std::move(component_children)),
                                              FinidIbanComponentsFunction));
    loader.RegisterFunction(components_set);

    ScalarFunctionSet bank_code_set("finid_get_iban_bank_code");
    bank_code_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidGetIbanBankCodeFunction));
    loader.RegisterFunction(bank_code_set);

    ScalarFunctionSet account_number_set("finid_get_iban_account_number");
    account_number_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidGetIbanAccountNumberFunction));
    loader.RegisterFunction(account_number_set);

    ScalarFunctionSet sepa_set("finid_is_sepa_iban");
    sepa_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsSepaIbanFunction));
    loader.RegisterFunction(sepa_set);

    // finid_is_iban_from_country(iban, country)
    ScalarFunctionSet from_country_set("finid_is_iban_from_country");
    from_country_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR},
                                                LogicalType::BOOLEAN, FinidIsIbanFromCountryFunction));
    loader.RegisterFunction(from_country_set);

    ScalarFunctionSet is_bic_set("finid_is_bic");
    is_bic_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsBicFunction));
    loader.RegisterFunction(is_bic_set);

    ScalarFunctionSet is_blz_set("finid_is_blz");
    is_blz_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsBlzFunction));
    loader.RegisterFunction(is_blz_set);

    ScalarFunctionSet is_kto_set("finid_is_kto");
    is_kto_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsKtoFunction));
    loader.RegisterFunction(is_kto_set);
}

} // namespace finid
} // namespace duckdb
