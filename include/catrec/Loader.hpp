/**
 * @file Loader.hpp
 * @brief Settings file loading
 *
 * Settings files are JSON (nlohmann::json) or TOML (toml++); the format is
 * picked from the extension. Both hold a [merge] and a [log] table. Tables
 * and keys catrec does not recognise are ignored.
 */

#ifndef CATREC_LOADER_HPP
#define CATREC_LOADER_HPP

#include "catrec/Settings.hpp"

#include <string>

namespace catrec {

/**
 * @brief Read the recognised keys of a settings file.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws SettingsError on syntax errors, a non-string value for a
 *         recognised key, or an extension other than .json/.toml
 */
SettingsLayer load_settings_file(const std::string& path);

} // namespace catrec

#endif // CATREC_LOADER_HPP
