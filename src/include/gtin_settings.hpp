#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {
namespace gtin {

// What gtin_fix*() does with a code it cannot fix
enum class FixErrorMode : uint8_t {
    RETURN_NULL = 0,  // 'null' (default)
    THROW_ERROR = 1   // 'error'
};

static constexpr const char *FIX_ERROR_MODE_SETTING = "gtin_fix_error_mode";

// Register extension options (SET gtin_fix_error_mode = 'error')
void RegisterGtinSettings(ExtensionLoader &loader);

// Current mode for the session, falls back to RETURN_NULL if unset
FixErrorMode GetFixErrorMode(ClientContext &context);

} // namespace gtin
} // namespace duckdb
