#include "include/card_functions.hpp"
#include "include/function_helpers.hpp"
#include "checksum/card.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include <string>

namespace duckdb {
namespace finid {

using checksum::CardEngine;
using checksum::CardValidation;
using checksum::ExpiryDate;

static void FinidIsValidCardNumberFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecutePredicate(args, result, CardEngine::IsValidNumber);
}

// Card type name or 'unknown'
static void FinidCardTypeFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t number) {
            return StringVector::AddString(result, CardEngine::Classify(number.GetString()));
        });
}

static void FinidFormatCardNumberFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t number) {
            return StringVector::AddString(result, CardEngine::FormatMasked(number.GetString()));
        });
}

static void FinidFormatCardNumberMaskFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    BinaryExecutor::Execute<string_t, bool, string_t>(
        args.data[0], args.data[1], result, args.size(),
        [&](string_t number, bool mask_middle) {
            return StringVector::AddString(result, CardEngine::Format(number.GetString(), mask_middle));
        });
}

static void FinidIsValidCardExpiryFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto today = checksum::ReferenceDate::Today();
    BinaryExecutor::Execute<int32_t, int32_t, bool>(
        args.data[0], args.data[1], result, args.size(),
        [&](int32_t month, int32_t year) {
            return CardEngine::IsValidExpiry(month, year, today);
        });
}

// STRUCT(month INTEGER, year INTEGER, valid BOOLEAN); NULL unless 'MM/YY' or 'MM/YYYY'
static void FinidParseCardExpiryFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto &input_vector = args.data[0];
    auto count = args.size();

    UnifiedVectorFormat input_data;
    input_vector.ToUnifiedFormat(count, input_data);
    auto input_strings = UnifiedVectorFormat::GetData<string_t>(input_data);

    auto today = checksum::ReferenceDate::Today();

    for (idx_t i = 0; i < count; i++) {
        auto idx = input_data.sel->get_index(i);

        ExpiryDate date;
        if (!input_data.validity.RowIsValid(idx) ||
            !CardEngine::ParseExpiry(input_strings[idx].GetString(), today, date)) {
            result.SetValue(i, Value(result.GetType()));
            continue;
        }

        child_list_t<Value> values;
        values.push_back(make_pair("month", Value::INTEGER(date.month)));
        values.push_back(make_pair("year", Value::INTEGER(date.year)));
        values.push_back(make_pair("valid", Value::BOOLEAN(date.valid)));
        result.SetValue(i, Value::STRUCT(std::move(values)));
    }
}

// finid_validate_card(number, month, year [, cvv])
// -> STRUCT(valid BOOLEAN, errors VARCHAR[], card_type VARCHAR)
static void FinidValidateCardFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto count = args.size();
    bool has_cvv = args.data.size() > 3;

    UnifiedVectorFormat number_data;
    UnifiedVectorFormat month_data;
    UnifiedVectorFormat year_data;
    UnifiedVectorFormat cvv_data;

    args.data[0].ToUnifiedFormat(count, number_data);
    args.data[1].ToUnifiedFormat(count, month_data);
    args.data[2].ToUnifiedFormat(count, year_data);
    if (has_cvv) {
        args.data[3].ToUnifiedFormat(count, cvv_data);
    }

    auto number_ptr = UnifiedVectorFormat::GetData<string_t>(number_data);
    auto month_ptr = UnifiedVectorFormat::GetData<int32_t>(month_data);
    auto year_ptr = UnifiedVectorFormat::GetData<int32_t>(year_data);
    auto cvv_ptr = has_cvv ? UnifiedVectorFormat::GetData<string_t>(cvv_data) : nullptr;

    auto today = checksum::ReferenceDate::Today();

    for (idx_t i = 0; i < count; i++) {
        auto number_idx = number_data.sel->get_index(i);
        auto month_idx = month_data.sel->get_index(i);
        auto year_idx = year_data.sel->get_index(i);

        if (!number_data.validity.RowIsValid(number_idx) ||
            !month_data.validity.RowIsValid(month_idx) ||
            !year_data.validity.RowIsValid(year_idx)) {
            result.SetValue(i, Value(result.GetType()));
            continue;
        }

        // A NULL cvv counts as not given
        std::string cvv;
        bool cvv_given = false;
        if (has_cvv) {
            auto cvv_idx = cvv_data.sel->get_index(i);
            if (cvv_data.validity.RowIsValid(cvv_idx)) {
                cvv = cvv_ptr[cvv_idx].GetString();
                cvv_given = true;
            }
        }

        CardValidation validation = CardEngine::ValidateCard(number_ptr[number_idx].GetString(),
                                                             month_ptr[month_idx], year_ptr[year_idx],
                                                             cvv_given ? &cvv : nullptr, today);

        vector<Value> errors;
        for (const auto &error : validation.errors) {
            errors.push_back(Value(error));
        }

        child_list_t<Value> values;
        values.push_back(make_pair("valid", Value::BOOLEAN(validation.valid)));
        values.push_back(make_pair("errors", Value::LIST(LogicalType::VARCHAR, std::move(errors))));
        values.push_back(make_pair("card_type", validation.card_type.empty() ? Value(LogicalType::VARCHAR)
                                                                               : Value(validation.card_type)));
        result.SetValue(i, Value::STRUCT(std::move(values)));
    }
}

static void FinidTestCardNumberFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    ExecuteOptionalString(args, result, CardEngine::TestCardNumber);
}

void RegisterCardFunctions(ExtensionLoader &loader) {
    // finid_is_valid_card_number(number) - 12..19 digits and Luhn
    ScalarFunctionSet is_valid_set("finid_is_valid_card_number");
    is_valid_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, FinidIsValidCardNumberFunction));
    loader.RegisterFunction(is_valid_set);

    ScalarFunctionSet card_type_set("finid_card_type");
    card_type_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidCardTypeFunction));
    loader.RegisterFunction(card_type_set);

    // finid_format_card_number(number [, mask_middle])
    ScalarFunctionSet format_set("finid_format_card_number");
    format_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidFormatCardNumberFunction));
    format_set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::BOOLEAN}, LogicalType::VARCHAR,
                                          FinidFormatCardNumberMaskFunction));
    loader.RegisterFunction(format_set);

    // Expiry checks depend on the current date
    ScalarFunctionSet expiry_set("finid_is_valid_card_expiry");
    ScalarFunction expiry_func({LogicalType::INTEGER, LogicalType::INTEGER}, LogicalType::BOOLEAN,
                               FinidIsValidCardExpiryFunction);
    expiry_func.stability = FunctionStability::VOLATILE;
    expiry_set.AddFunction(expiry_func);
    loader.RegisterFunction(expiry_set);

    child_list_t<LogicalType> expiry_children;
    expiry_children.push_back(make_pair("month", LogicalType::INTEGER));
    expiry_children.push_back(make_pair("year", LogicalType::INTEGER));
    expiry_children.push_back(make_pair("valid", LogicalType::BOOLEAN));
    ScalarFunctionSet parse_expiry_set("finid_parse_card_expiry");
    ScalarFunction parse_expiry_func({LogicalType::VARCHAR}, LogicalType::STRUCT(std::move(expiry_children)),
                                     FinidParseCardExpiryFunction);
    parse_expiry_func.stability = FunctionStability::VOLATILE;
    parse_expiry_set.AddFunction(parse_expiry_func);
    loader.RegisterFunction(parse_expiry_set);

    child_list_t<LogicalType> validation_children;
    validation_children.push_back(make_pair("valid", LogicalType::BOOLEAN));
    validation_children.push_back(make_pair("errors", LogicalType::LIST(LogicalType::VARCHAR)));
    validation_children.push_back(make_pair("card_type", LogicalType::VARCHAR));
    auto validation_type = LogicalType::STRUCT(std::move(validation_children));

    ScalarFunctionSet validate_set("finid_validate_card");
    ScalarFunction validate_func({LogicalType::VARCHAR, LogicalType::INTEGER, LogicalType::INTEGER},
                                 validation_type, FinidValidateCardFunction);
    validate_func.stability = FunctionStability::VOLATILE;
    validate_set.AddFunction(validate_func);
    ScalarFunction validate_cvv_func({LogicalType::VARCHAR, LogicalType::INTEGER, LogicalType::INTEGER,
                                      LogicalType::VARCHAR},
                                     validation_type, FinidValidateCardFunction);
    validate_cvv_func.stability = FunctionStability::VOLATILE;
    validate_cvv_func.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
    validate_set.AddFunction(validate_cvv_func);
    loader.RegisterFunction(validate_set);

    ScalarFunctionSet test_number_set("finid_test_card_number");
    test_number_set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, FinidTestCardNumberFunction));
    loader.RegisterFunction(test_number_set);
}

} // namespace finid
} // namespace duckdb
