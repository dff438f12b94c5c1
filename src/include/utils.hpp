#pragma once

#include <string>
#include <cstddef>

namespace duckdb {
namespace gtin {

// String utilities
std::string trim(const std::string& str);
std::string zero_pad(const std::string& str, size_t width);

// Character classification helpers
bool is_blank_char(char c);
bool is_digit_char(char c);
bool is_ascii_digits(const std::string& str);

} // namespace gtin
} // namespace duckdb
