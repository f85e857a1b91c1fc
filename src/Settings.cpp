#include "catrec/Settings.hpp"
#include "catrec/Errors.hpp"
#include "catrec/Loader.hpp"
#include "catrec/Util.hpp"

#include <spdlog/common.h>

#include <cctype>
#include <cstdlib>
#include <utility>

namespace catrec {

namespace {

const char* const kIdentityPolicyKey = "merge.identity_policy";
const char* const kLogLevelKey = "log.level";
const char* const kLogPatternKey = "log.pattern";

std::string checked_log_level(const std::string& raw) {
    std::string level = to_lower(trim(raw));
    // from_str maps every unknown name to off
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        throw SettingsError(kLogLevelKey, "unknown level '" + raw + "'");
    }
    return level;
}

} // anonymous namespace

const std::vector<std::string>& settings_keys() {
    static const std::vector<std::string> keys{kIdentityPolicyKey, kLogLevelKey, kLogPatternKey};
    return keys;
}

std::string to_string(IdentityPolicy policy) {
    return policy == IdentityPolicy::Strict ? "strict" : "permissive";
}

IdentityPolicy identity_policy_from_string(const std::string& name) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "permissive") return IdentityPolicy::Permissive;
    if (lowered == "strict") return IdentityPolicy::Strict;
    throw SettingsError(kIdentityPolicyKey,
                        "expected 'permissive' or 'strict', got '" + name + "'");
}

void apply_layer(Settings& settings, const SettingsLayer& layer) {
    Settings next = settings;
    for (const auto& [key, value] : layer) {
        if (key == kIdentityPolicyKey) {
            next.merge.identity_policy = identity_policy_from_string(value);
        } else if (key == kLogLevelKey) {
            next.log_level = checked_log_level(value);
        } else if (key == kLogPatternKey) {
            if (value.empty()) {
                throw SettingsError(key, "must not be empty");
            }
            next.log_pattern = value;
        } else {
            throw SettingsError(key, "unknown setting");
        }
    }
    settings = std::move(next);
}

std::string env_name_for(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    while (!name.empty() && name.back() == '_') name.pop_back();
    name += '_';
    // '.' separates sections, so an underscore inside a name is doubled
    for (char c : key) {
        if (c == '.') {
            name += '_';
        } else if (c == '_') {
            name += "__";
        } else {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

SettingsLayer env_layer(const std::string& prefix) {
    SettingsLayer layer;
    for (const auto& key : settings_keys()) {
        if (const char* value = std::getenv(env_name_for(prefix, key).c_str())) {
            layer[key] = value;
        }
    }
    return layer;
}

Settings load_settings(const SettingsLoadOptions& opts) {
    Settings settings;

    if (opts.file_path.has_value()) {
        apply_layer(settings, load_settings_file(*opts.file_path));
    }

    if (opts.env_prefix.has_value() && !opts.env_prefix->empty()) {
        apply_layer(settings, env_layer(*opts.env_prefix));
    }

    apply_layer(settings, opts.overrides);
    return settings;
}

} // namespace catrec
