#pragma once
/**
 * @file host_config.hpp
 * @brief Safeframe host configuration, loaded from a JSON config file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "host": {
 *     "trusted_origin":          "https://tpc.googlesyndication.com",
 *     "resize_complete_channel": "sfchannel1"
 *   },
 *   "logging": {
 *     "level": "info",
 *     "file":  ""
 *   },
 *   "metadata": {
 *     "flash_ver": "26.0.0",
 *     "ck_on":     1
 *   }
 * }
 * @endcode
 *
 * Every key is optional; missing keys keep the built-in defaults.
 *
 * ## Config loading: layered (priority low → high)
 *
 *  1. Built-in C++ defaults (member initialisers below)
 *  2. The JSON file passed to from_json_file()
 *  3. `SFHOST_TRUSTED_ORIGIN` / `SFHOST_LOG_LEVEL` environment overrides,
 *     applied by apply_env_overrides()
 */

#include "sfhost_export.h"

#include <nlohmann/json.hpp>

#include <string>

namespace sfhost
{

/// Origin of the GPT safeframe container; the only sender whose messages are processed.
inline constexpr const char *kDefaultTrustedOrigin = "https://tpc.googlesyndication.com";

/// Channel named in the fixed "resize-complete" notification sent after a fluid resize.
inline constexpr const char *kDefaultResizeCompleteChannel = "sfchannel1";

/**
 * @struct HostConfig
 * @brief Process-level settings shared by the message router and every host session.
 */
struct SFHOST_EXPORT HostConfig
{
    std::string trusted_origin{kDefaultTrustedOrigin};
    std::string resize_complete_channel{kDefaultResizeCompleteChannel};

    std::string log_level{"info"}; ///< trace/debug/info/warn/error/system
    std::string log_file;          ///< Empty = log to stderr

    // ── Slot metadata exposed to the creative ─────────────────────────────────
    std::string flash_version{"26.0.0"};
    int         cookie_on{1};

    /**
     * @brief Build a config from a parsed JSON document, starting from defaults.
     * @throws std::runtime_error on a wrongly typed or invalid value, naming the key.
     */
    static HostConfig from_json(const nlohmann::json &j);

    /**
     * @brief Read and parse a JSON config file.
     * @throws std::runtime_error if the file cannot be read or parsed, or holds invalid values.
     */
    static HostConfig from_json_file(const std::string &path);

    /// Apply SFHOST_TRUSTED_ORIGIN and SFHOST_LOG_LEVEL if set.
    /// @throws std::runtime_error if an override is invalid.
    void apply_env_overrides();

    /// Configure the process Logger (level and sink) from this config.
    /// @throws std::runtime_error if the log file cannot be opened.
    void apply_logging() const;
};

} // namespace sfhost
