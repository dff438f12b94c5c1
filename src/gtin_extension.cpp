#define DUCKDB_EXTENSION_MAIN
#include "gtin_extension.hpp"
#include "gtin_settings.hpp"
#include "gtin_functions.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

void GtinExtension::Load(ExtensionLoader &loader) {
    // Settings first, the fix functions read gtin_fix_error_mode
    gtin::RegisterGtinSettings(loader);
    gtin::RegisterGtinFunctions(loader);
}

std::string GtinExtension::Name() {
    return "gtin";
}

std::string GtinExtension::Version() const {
#ifdef EXT_VERSION
    return EXT_VERSION;
#else
    return "v0.1.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(gtin, loader) {
    duckdb::GtinExtension ext;
    ext.Load(loader);
}
}
