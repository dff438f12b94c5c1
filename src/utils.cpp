#include "include/utils.hpp"
#include <algorithm>
#include <cctype>

namespace duckdb {
namespace gtin {

std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && is_blank_char(str[start])) {
        start++;
    }

    while (end > start && is_blank_char(str[end - 1])) {
        end--;
    }

    return str.substr(start, end - start);
}

// Strings already at or beyond the width are returned unchanged
std::string zero_pad(const std::string& str, size_t width) {
    if (str.length() >= width) {
        return str;
    }
    return std::string(width - str.length(), '0') + str;
}

bool is_blank_char(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// ASCII only: bytes of multi-byte UTF-8 sequences are never digits
bool is_digit_char(char c) {
    return c >= '0' && c <= '9';
}

bool is_ascii_digits(const std::string& str) {
    return std::all_of(str.begin(), str.end(), is_digit_char);
}

} // namespace gtin
} // namespace duckdb
