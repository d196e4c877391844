/**
 * @file config.hpp
 * @brief Broker configuration file.
 *
 * @details
 * Location, first hit wins:
 *  1. `--config <path>` on the command line
 *  2. `$XDG_CONFIG_HOME/lorabroker/config.json`
 *  3. `$HOME/.config/lorabroker/config.json`
 *
 * @code{.json}
 * {
 *   "registry_path":    "/var/lib/lorabroker/registry.json",
 *   "log_level":        "info",
 *   "handler_fallback": "-"
 * }
 * @endcode
 *
 * Every key is optional. A missing file is not an error: defaults apply.
 * A file that is not valid JSON, or a key with the wrong type, is Structural.
 * Unknown keys are ignored so newer files still load.
 *
 * `handler_fallback` is the recipient used by `register-device` when no
 * `--recipient` is given.
 */
#ifndef LORABROKER_CONFIG_HPP
#define LORABROKER_CONFIG_HPP

#include "errors.hpp"
#include "log.hpp"

#include <filesystem>
#include <string>

namespace lorabroker {

struct BrokerConfig {
    std::filesystem::path registry_path;          ///< empty: <config dir>/registry.json
    LogLevel              log_level = LogLevel::Info;
    std::string           handler_fallback;       ///< empty: no fallback
};

/// @brief `<config home>/lorabroker`, following XDG.
std::filesystem::path default_config_dir();

/// @brief `default_config_dir() / "config.json"`.
std::filesystem::path default_config_path();

/// @brief Parse JSON text into `out`. Fields absent from the text keep their value in `out`.
Error parse_config(const std::string& text, BrokerConfig& out);

/// @brief Load `path` into `out`; a missing file leaves `out` untouched.
Error load_config(const std::filesystem::path& path, BrokerConfig& out);

} // namespace lorabroker

#endif // LORABROKER_CONFIG_HPP
