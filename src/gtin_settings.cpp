#include "gtin_settings.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {
namespace gtin {

static bool TryParseFixErrorMode(const std::string &value, FixErrorMode &mode) {
    auto lowered = StringUtil::Lower(value);
    if (lowered == "null") {
        mode = FixErrorMode::RETURN_NULL;
        return true;
    }
    if (lowered == "error") {
        mode = FixErrorMode::THROW_ERROR;
        return true;
    }
    return false;
}

// Rejects unknown modes at SET time and stores the lowercase spelling
static void SetFixErrorMode(ClientContext &context, SetScope scope, Value &parameter) {
    if (parameter.IsNull()) {
        throw InvalidInputException("%s cannot be NULL, expected 'null' or 'error'", FIX_ERROR_MODE_SETTING);
    }

    std::string value = parameter.ToString();
    FixErrorMode mode;
    if (!TryParseFixErrorMode(value, mode)) {
        throw InvalidInputException("Unrecognized value '%s' for %s, expected 'null' or 'error'", value,
                                    FIX_ERROR_MODE_SETTING);
    }
    parameter = Value(StringUtil::Lower(value));
}

void RegisterGtinSettings(ExtensionLoader &loader) {
    auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
    config.AddExtensionOption(FIX_ERROR_MODE_SETTING,
                              "Behavior of gtin_fix* for codes that cannot be fixed: 'null' returns NULL, "
                              "'error' raises an error naming the failure",
                              LogicalType::VARCHAR, Value("null"), SetFixErrorMode);
}

FixErrorMode GetFixErrorMode(ClientContext &context) {
    Value setting;
    FixErrorMode mode = FixErrorMode::RETURN_NULL;

    if (context.TryGetCurrentSetting(FIX_ERROR_MODE_SETTING, setting) && !setting.IsNull()) {
        if (!TryParseFixErrorMode(setting.ToString(), mode)) {
            throw InternalException("Invalid stored value for %s: %s", FIX_ERROR_MODE_SETTING, setting.ToString());
        }
    }
    return mode;
}

} // namespace gtin
} // namespace duckdb
