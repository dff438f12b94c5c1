#include "include/gtin_functions.hpp"
#include "include/gtin_settings.hpp"
#include "include/utils.hpp"
#include "checkdigit/gtin_check.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "duckdb/common/vector_operations/vector_operations.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/common/exception.hpp"
#include <string>

namespace duckdb {
namespace gtin {

using checkdigit::FixError;
using checkdigit::FixErrorToString;
using checkdigit::FixResult;
using checkdigit::GtinCheck;

// Variant traits, one per supported length. The SQL layer is templated on
// these so every length gets its own named functions.
struct Gtin8Variant {
    static const char *Suffix() { return "8"; }
    static const char *Label() { return "GTIN-8"; }
    static bool Check(const std::string &code) { return GtinCheck::Check8(code); }
    static FixResult Fix(const std::string &code) { return GtinCheck::Fix8(code); }
};

struct Gtin12Variant {
    static const char *Suffix() { return "12"; }
    static const char *Label() { return "GTIN-12 (UPC-A)"; }
    static bool Check(const std::string &code) { return GtinCheck::Check12(code); }
    static FixResult Fix(const std::string &code) { return GtinCheck::Fix12(code); }
};

struct Gtin13Variant {
    static const char *Suffix() { return "13"; }
    static const char *Label() { return "GTIN-13 (EAN-13)"; }
    static bool Check(const std::string &code) { return GtinCheck::Check13(code); }
    static FixResult Fix(const std::string &code) { return GtinCheck::Fix13(code); }
};

struct Gtin14Variant {
    static const char *Suffix() { return "14"; }
    static const char *Label() { return "GTIN-14"; }
    static bool Check(const std::string &code) { return GtinCheck::Check14(code); }
    static FixResult Fix(const std::string &code) { return GtinCheck::Fix14(code); }
};

// Longest payload accepted by gtin_check_digit (GTIN-14 minus its check digit)
static constexpr idx_t MAX_PAYLOAD_LENGTH = 13;

static std::string DescribeFixFailure(const std::string &function_name, const std::string &code,
                                      const FixResult &fixed) {
    std::string message = function_name + ": cannot fix '" + code + "': " + FixErrorToString(fixed.error);
    if (fixed.error == FixError::BAD_CHARACTER) {
        message += " at position " + std::to_string(fixed.position);
        unsigned char c = static_cast<unsigned char>(fixed.character);
        if (c >= 0x20 && c < 0x7F) {
            message += " ('" + std::string(1, fixed.character) + "')";
        }
    }
    return message;
}

// gtin_check<N>(code VARCHAR) -> BOOLEAN
template <class VARIANT>
static void GtinCheckFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, bool>(
        args.data[0], result, args.size(),
        [&](string_t code) {
            return VARIANT::Check(code.GetString());
        });
}

// gtin_fix<N>(code VARCHAR) -> VARCHAR
// Failures become NULL, or raise when gtin_fix_error_mode = 'error'
template <class VARIANT>
static void GtinFixFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    auto mode = GetFixErrorMode(state.GetContext());
    std::string function_name = std::string("gtin_fix") + VARIANT::Suffix();

    UnaryExecutor::ExecuteWithNulls<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t code, ValidityMask &mask, idx_t idx) -> string_t {
            std::string code_str = code.GetString();
            FixResult fixed = VARIANT::Fix(code_str);

            if (fixed.Ok()) {
                return StringVector::AddString(result, fixed.code);
            }
            if (mode == FixErrorMode::THROW_ERROR) {
                throw InvalidInputException(DescribeFixFailure(function_name, code_str, fixed));
            }
            mask.SetInvalid(idx);
            return string_t();
        });
}

// gtin_fix_result<N>(code VARCHAR) -> VARCHAR
// Returns: 'OK', 'TOO_LONG', 'BAD_CHARACTER' or 'BAD_CHECKSUM'
template <class VARIANT>
static void GtinFixResultFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(
        args.data[0], result, args.size(),
        [&](string_t code) {
            FixResult fixed = VARIANT::Fix(code.GetString());
            return StringVector::AddString(result, FixErrorToString(fixed.error));
        });
}

// gtin_check_digit(payload VARCHAR) -> INTEGER
static void GtinCheckDigitFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::ExecuteWithNulls<string_t, int32_t>(
        args.data[0], result, args.size(),
        [&](string_t payload, ValidityMask &mask, idx_t idx) -> int32_t {
            std::string payload_str = payload.GetString();
            if (payload_str.length() > MAX_PAYLOAD_LENGTH || !is_ascii_digits(payload_str)) {
                mask.SetInvalid(idx);
                return 0;
            }

            uint8_t digits[MAX_PAYLOAD_LENGTH];
            for (idx_t i = 0; i < payload_str.length(); i++) {
                digits[i] = static_cast<uint8_t>(payload_str[i] - '0');
            }
            return GtinCheck::ComputeCheckDigit(digits, payload_str.length());
        });
}

template <class VARIANT>
static void RegisterCheckFunction(ExtensionLoader &loader, const std::string &name) {
    ScalarFunctionSet check_set(name);
    auto check_function = ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN,
                                         GtinCheckFunction<VARIANT>);
    check_function.description = std::string("Checks that a string is a valid ") + VARIANT::Label() +
                                 " code: exact length, digits only, matching check digit.\n"
                                 "Usage: SELECT " + name + "('...');\n"
                                 "Returns: BOOLEAN (false for any malformed input)";
    check_set.AddFunction(check_function);
    loader.RegisterFunction(check_set);
}

template <class VARIANT>
static void RegisterFixFunction(ExtensionLoader &loader, const std::string &name) {
    ScalarFunctionSet fix_set(name);
    auto fix_function = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                       GtinFixFunction<VARIANT>);
    fix_function.description = std::string("Normalizes a ") + VARIANT::Label() +
                               " code: trims surrounding whitespace and restores missing leading zeros. "
                               "The check digit is validated, never rewritten.\n"
                               "Usage: SELECT " + name + "(' 36000291452');\n"
                               "Returns: VARCHAR (NULL if the code cannot be fixed, or an error when "
                               "gtin_fix_error_mode = 'error')";
    fix_set.AddFunction(fix_function);
    loader.RegisterFunction(fix_set);
}

template <class VARIANT>
static void RegisterFixResultFunction(ExtensionLoader &loader, const std::string &name) {
    ScalarFunctionSet fix_result_set(name);
    auto fix_result_function = ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR,
                                              GtinFixResultFunction<VARIANT>);
    fix_result_function.description = std::string("Explains why a ") + VARIANT::Label() +
                                      " code can or cannot be fixed.\n"
                                      "Usage: SELECT " + name + "('...');\n"
                                      "Returns: VARCHAR (one of: 'OK', 'TOO_LONG', 'BAD_CHARACTER', "
                                      "'BAD_CHECKSUM')";
    fix_result_set.AddFunction(fix_result_function);
    loader.RegisterFunction(fix_result_set);
}

template <class VARIANT>
static void RegisterVariantFunctions(ExtensionLoader &loader) {
    RegisterCheckFunction<VARIANT>(loader, std::string("gtin_check") + VARIANT::Suffix());
    RegisterFixFunction<VARIANT>(loader, std::string("gtin_fix") + VARIANT::Suffix());
    RegisterFixResultFunction<VARIANT>(loader, std::string("gtin_fix_result") + VARIANT::Suffix());
}

void RegisterGtinFunctions(ExtensionLoader &loader) {
    RegisterVariantFunctions<Gtin8Variant>(loader);
    RegisterVariantFunctions<Gtin12Variant>(loader);
    RegisterVariantFunctions<Gtin13Variant>(loader);
    RegisterVariantFunctions<Gtin14Variant>(loader);

    // Retail names
    RegisterCheckFunction<Gtin12Variant>(loader, "gtin_check_upca");
    RegisterFixFunction<Gtin12Variant>(loader, "gtin_fix_upca");
    RegisterCheckFunction<Gtin13Variant>(loader, "gtin_check_ean13");
    RegisterFixFunction<Gtin13Variant>(loader, "gtin_fix_ean13");

    // gtin_check_digit(payload) - check digit for a payload of up to 13 digits
    ScalarFunctionSet check_digit_set("gtin_check_digit");
    auto check_digit_function = ScalarFunction({LogicalType::VARCHAR}, LogicalType::INTEGER,
                                               GtinCheckDigitFunction);
    check_digit_function.description = "Computes the GTIN check digit for a payload (the code without its "
                                       "check digit).\n"
                                       "Usage: SELECT gtin_check_digit('03600029145');\n"
                                       "Returns: INTEGER (NULL if the payload has non-digits or more than 13 digits)";
    check_digit_set.AddFunction(check_digit_function);
    loader.RegisterFunction(check_digit_set);
}

} // namespace gtin
} // namespace duckdb
