#include "gtin_check.hpp"
#include "utils.hpp"

namespace duckdb {
namespace gtin {
namespace checkdigit {

constexpr size_t GtinCheck::GTIN8_LENGTH;
constexpr size_t GtinCheck::GTIN12_LENGTH;
constexpr size_t GtinCheck::GTIN13_LENGTH;
constexpr size_t GtinCheck::GTIN14_LENGTH;

const char *FixErrorToString(FixError error) {
    switch (error) {
        case FixError::NONE:
            return "OK";
        case FixError::TOO_LONG:
            return "TOO_LONG";
        case FixError::BAD_CHARACTER:
            return "BAD_CHARACTER";
        case FixError::BAD_CHECKSUM:
            return "BAD_CHECKSUM";
        default:
            return "UNKNOWN";
    }
}

// ======================================================================
// Modulus 10, weights 3, 1, 3, 1, ... from the rightmost payload digit
// ======================================================================
uint8_t GtinCheck::ComputeCheckDigit(const uint8_t *payload, size_t count) {
    int sum = 0;

    for (size_t i = 0; i < count; i++) {
        // Position counted from the right, 1-indexed: odd => 3, even => 1
        size_t position = count - i;
        int weight = (position % 2 == 1) ? 3 : 1;
        sum += payload[i] * weight;
    }

    return static_cast<uint8_t>((10 - (sum % 10)) % 10);
}

bool GtinCheck::ChecksumMatches(const std::string &digits) {
    uint8_t payload[GTIN14_LENGTH];
    size_t count = digits.length() - 1;

    for (size_t i = 0; i < count; i++) {
        payload[i] = static_cast<uint8_t>(digits[i] - '0');
    }

    int expected = digits[count] - '0';
    return ComputeCheckDigit(payload, count) == expected;
}

bool GtinCheck::CheckCode(const std::string &code, size_t length) {
    if (code.length() != length) {
        return false;
    }
    if (!is_ascii_digits(code)) {
        return false;
    }
    return ChecksumMatches(code);
}

FixResult GtinCheck::FixCode(const std::string &code, size_t length) {
    FixResult result;
    std::string fixed = trim(code);

    if (fixed.length() > length) {
        result.error = FixError::TOO_LONG;
        return result;
    }

    // Recovers codes that went through an integer column and lost their leading zeros
    fixed = zero_pad(fixed, length);
    if (fixed.length() != length) {
        result.error = FixError::TOO_LONG;
        return result;
    }

    for (size_t i = 0; i < fixed.length(); i++) {
        if (!is_digit_char(fixed[i])) {
            result.error = FixError::BAD_CHARACTER;
            result.position = i;
            result.character = fixed[i];
            return result;
        }
    }

    if (!ChecksumMatches(fixed)) {
        result.error = FixError::BAD_CHECKSUM;
        return result;
    }

    result.code = fixed;
    return result;
}

bool GtinCheck::Check8(const std::string &code) {
    return CheckCode(code, GTIN8_LENGTH);
}

FixResult GtinCheck::Fix8(const std::string &code) {
    return FixCode(code, GTIN8_LENGTH);
}

bool GtinCheck::Check12(const std::string &code) {
    return CheckCode(code, GTIN12_LENGTH);
}

FixResult GtinCheck::Fix12(const std::string &code) {
    return FixCode(code, GTIN12_LENGTH);
}

bool GtinCheck::Check13(const std::string &code) {
    return CheckCode(code, GTIN13_LENGTH);
}

FixResult GtinCheck::Fix13(const std::string &code) {
    return FixCode(code, GTIN13_LENGTH);
}

bool GtinCheck::Check14(const std::string &code) {
    return CheckCode(code, GTIN14_LENGTH);
}

FixResult GtinCheck::Fix14(const std::string &code) {
    return FixCode(code, GTIN14_LENGTH);
}

} // namespace checkdigit
} // namespace gtin
} // namespace duckdb
