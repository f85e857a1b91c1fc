#ifndef CATREC_SETTINGS_HPP
#define CATREC_SETTINGS_HPP

#include "catrec/Reconciler.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace catrec {

/**
 * @brief Runtime settings resolved from all configuration layers.
 */
struct Settings {
    MergeOptions merge;
    std::string log_level = "info";
    std::string log_pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

/**
 * @brief Raw values one configuration layer sets, keyed "section.name".
 *
 * Keys not set by the layer are absent. Values are validated only when the
 * layer is applied.
 */
using SettingsLayer = std::map<std::string, std::string>;

/**
 * @brief Where to look for settings.
 *
 * Precedence, lowest first: defaults -> file -> env (prefix) -> overrides.
 */
struct SettingsLoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> env_prefix = std::string("CATREC");
    SettingsLayer overrides;
};

/// Every recognised key: merge.identity_policy, log.level, log.pattern.
const std::vector<std::string>& settings_keys();

// Resolve all layers into Settings. Throws SettingsError / FileNotFoundError.
Settings load_settings(const SettingsLoadOptions& opts);

/**
 * @brief Apply one layer on top of @p settings.
 *
 * @throws SettingsError for an unrecognised key or an unusable value;
 *         @p settings is unchanged in that case
 */
void apply_layer(Settings& settings, const SettingsLayer& layer);

// Environment variable for a key: ("CATREC", "merge.identity_policy") -> "CATREC_MERGE_IDENTITY__POLICY"
std::string env_name_for(const std::string& prefix, const std::string& key);

// Layer read from the PREFIX_* variable of every recognised key.
SettingsLayer env_layer(const std::string& prefix);

std::string to_string(IdentityPolicy policy);
IdentityPolicy identity_policy_from_string(const std::string& name);

} // namespace catrec

#endif // CATREC_SETTINGS_HPP
