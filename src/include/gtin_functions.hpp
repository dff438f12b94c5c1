#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace gtin {

// Register gtin_check*, gtin_fix*, gtin_fix_result* and gtin_check_digit
void RegisterGtinFunctions(ExtensionLoader &loader);

} // namespace gtin
} // namespace duckdb
