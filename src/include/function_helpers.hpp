#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "checksum/checksum_error.hpp"
#include <string>

namespace duckdb {
namespace finid {

// Unary VARCHAR -> VARCHAR over an accessor with the signature
// bool(const std::string& in, std::string& out); false becomes NULL
template <class ACCESSOR>
void ExecuteOptionalString(DataChunk &args, Vector &result, ACCESSOR accessor) {
    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t input, ValidityMask &mask, idx_t idx) {
            std::string value;
            if (!accessor(input.GetString(), value)) {
                mask.SetInvalid(idx);
                return string_t();
            }
            return StringVector::AddString(result, value);
        });
}

// Unary VARCHAR -> BOOLEAN over a predicate bool(const std::string&)
template <class PREDICATE>
void ExecutePredicate(DataChunk &args, Vector &result, PREDICATE predicate) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t input) {
            return predicate(input.GetString());
        });
}

// Generation failures surface as "Invalid Input Error"
inline InvalidInputException ToInvalidInput(const checksum::ChecksumException &e) {
    return InvalidInputException(std::string(e.what()));
}

} // namespace finid
} // namespace duckdb
