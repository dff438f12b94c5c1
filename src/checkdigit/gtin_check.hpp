#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace duckdb {
namespace gtin {
namespace checkdigit {

// Reasons a code could not be fixed
enum class FixError : uint8_t {
    NONE = 0,           // Fixed successfully
    TOO_LONG = 1,       // Longer than the variant after trimming
    BAD_CHARACTER = 2,  // Non-digit after trimming/padding (incl. internal whitespace)
    BAD_CHECKSUM = 3    // All digits, but the check digit does not match
};

struct FixResult {
    FixError error = FixError::NONE;

    // Normalized code, only set when error == NONE
    std::string code;

    // First offending character for BAD_CHARACTER, indexed into the
    // trimmed and zero-padded code
    size_t position = 0;
    char character = '\0';

    bool Ok() const { return error == FixError::NONE; }
};

// 'OK', 'TOO_LONG', 'BAD_CHARACTER' or 'BAD_CHECKSUM'
const char *FixErrorToString(FixError error);

// GTIN-family check digit validation (GS1 General Specifications, 7.9)
//
// Each supported length has its own Check/Fix pair so callers state the
// variant they expect at the call site. All of them share the same
// weighting: starting from the rightmost payload digit, weights 3, 1, 3, 1...
class GtinCheck {
public:
    static constexpr size_t GTIN8_LENGTH = 8;
    static constexpr size_t GTIN12_LENGTH = 12;
    static constexpr size_t GTIN13_LENGTH = 13;
    static constexpr size_t GTIN14_LENGTH = 14;

    // Check digit for already-parsed digit values (0-9). An empty payload yields 0.
    static uint8_t ComputeCheckDigit(const uint8_t *payload, size_t count);

    // GTIN-8 (EAN-8)
    static bool Check8(const std::string &code);
    static FixResult Fix8(const std::string &code);

    // GTIN-12 (UPC-A)
    static bool Check12(const std::string &code);
    static FixResult Fix12(const std::string &code);

    // GTIN-13 (EAN-13)
    static bool Check13(const std::string &code);
    static FixResult Fix13(const std::string &code);

    // GTIN-14 (trade item groupings)
    static bool Check14(const std::string &code);
    static FixResult Fix14(const std::string &code);

private:
    // Exact length, all digits, matching check digit
    static bool CheckCode(const std::string &code, size_t length);

    // Trim, zero-pad, then validate. Never rewrites the check digit.
    static FixResult FixCode(const std::string &code, size_t length);

    // True if the last digit of an all-digit code matches its payload
    static bool ChecksumMatches(const std::string &digits);
};

} // namespace checkdigit
} // namespace gtin
} // namespace duckdb
