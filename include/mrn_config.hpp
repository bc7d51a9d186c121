#pragma once
/**
 * @page mrngen-config mrngen Configuration File
 * @file mrn_config.hpp
 * @brief Optional per-user defaults for the mrngen CLI.
 *
 * @details
 * PURPOSE
 * -------
 * Engineers who always generate MRNs for the same country or customs office
 * can store those values once instead of repeating flags on every run.
 *
 * LOCATION
 * --------
 *   $XDG_CONFIG_HOME/mrngen/config.json
 *   fallback: $HOME/.config/mrngen/config.json
 *   override: --config <path>
 *
 * FORMAT
 * ------
 * @code
 *   {
 *     "country_code": "DK",
 *     "declaration_office": "004700",
 *     "procedure_category": "B1",
 *     "scheme": "mod37",
 *     "format": "plain"
 *   }
 * @endcode
 *
 * Every key is optional and unknown keys are ignored. Values are strings.
 * Field values are not validated here; they flow into the request and are
 * checked by the field composer like any flag value. `scheme` and `format`
 * are checked here because nothing else would catch a typo in them.
 *
 * ERRORS
 * ------
 * A missing file is not an error. Malformed JSON, a non-object root, a
 * non-string value, or an unknown scheme/format fail with a stable token in
 * `err` ("bad_config:parse", "bad_config:type:<key>", "bad_config:scheme",
 * "bad_config:format", "bad_config:read").
 */

#include <filesystem>
#include <string>

namespace mrngen {

struct MrnConfig {
  std::string country_code;        ///< empty = no default
  std::string declaration_office;  ///< empty = no default
  std::string procedure_category;  ///< empty = no default
  std::string scheme = "mod37";    ///< mod37 | iso6346
  std::string format = "plain";    ///< plain | json
};

/**
 * @brief Resolve the default config path from XDG_CONFIG_HOME / HOME.
 * @return Empty path if neither variable is set.
 */
std::filesystem::path default_config_path();

/**
 * @brief Parse config JSON text into `out` (fields absent from the text keep their value).
 */
bool parse_config(const std::string& text, MrnConfig& out, std::string& err);

/**
 * @brief Load a config file. A missing file leaves `out` untouched and succeeds.
 */
bool load_config(const std::filesystem::path& path, MrnConfig& out, std::string& err);

} // namespace mrngen
