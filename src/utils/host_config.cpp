/**
 * @file host_config.cpp
 * @brief HostConfig JSON parsing and environment overrides.
 */
#include "sfh_base.hpp"
#include "utils/host_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace sfhost
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

std::string get_string(const nlohmann::json &section, const char *key, const std::string &path,
                       const std::string &fallback)
{
    if (!section.contains(key))
        return fallback;
    const auto &v = section.at(key);
    if (!v.is_string())
        throw std::runtime_error("Host config: '" + path + "." + key + "' must be a string");
    return v.get<std::string>();
}

void validate_origin(const std::string &origin)
{
    if (origin.rfind("https://", 0) != 0 && origin.rfind("http://", 0) != 0)
    {
        throw std::runtime_error("Host config: invalid 'host.trusted_origin' = '" + origin +
                                 "' (must start with 'https://' or 'http://')");
    }
    if (origin.back() == '/')
    {
        throw std::runtime_error("Host config: 'host.trusted_origin' = '" + origin +
                                 "' must not end with '/'");
    }
}

void validate_log_level(const std::string &level)
{
    if (!utils::Logger::level_from_string(level))
    {
        throw std::runtime_error("Host config: invalid 'logging.level' = '" + level +
                                 "' (must be trace, debug, info, warn, error or system)");
    }
}

} // anonymous namespace

// ============================================================================
// HostConfig
// ============================================================================

HostConfig HostConfig::from_json(const nlohmann::json &j)
{
    HostConfig cfg;
    if (!j.is_object())
        throw std::runtime_error("Host config: top-level value must be an object");

    if (j.contains("host"))
    {
        const auto &h = j.at("host");
        if (!h.is_object())
            throw std::runtime_error("Host config: 'host' must be an object");
        cfg.trusted_origin = get_string(h, "trusted_origin", "host", cfg.trusted_origin);
        cfg.resize_complete_channel =
            get_string(h, "resize_complete_channel", "host", cfg.resize_complete_channel);
    }

    if (j.contains("logging"))
    {
        const auto &l = j.at("logging");
        if (!l.is_object())
            throw std::runtime_error("Host config: 'logging' must be an object");
        cfg.log_level = get_string(l, "level", "logging", cfg.log_level);
        cfg.log_file = get_string(l, "file", "logging", cfg.log_file);
    }

    if (j.contains("metadata"))
    {
        const auto &m = j.at("metadata");
        if (!m.is_object())
            throw std::runtime_error("Host config: 'metadata' must be an object");
        cfg.flash_version = get_string(m, "flash_ver", "metadata", cfg.flash_version);
        if (m.contains("ck_on"))
        {
            if (!m.at("ck_on").is_number_integer())
                throw std::runtime_error("Host config: 'metadata.ck_on' must be an integer");
            cfg.cookie_on = m.at("ck_on").get<int>();
        }
    }

    validate_origin(cfg.trusted_origin);
    validate_log_level(cfg.log_level);
    if (cfg.resize_complete_channel.empty())
        throw std::runtime_error("Host config: 'host.resize_complete_channel' must not be empty");
    return cfg;
}

HostConfig HostConfig::from_json_file(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("Host config: cannot open '" + path + "'");

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Host config: parse error in '" + path + "': " + e.what());
    }
    HostConfig cfg = from_json(j);
    LOGGER_DEBUG("HostConfig: loaded '{}' (trusted_origin={})", path, cfg.trusted_origin);
    return cfg;
}

void HostConfig::apply_env_overrides()
{
    if (const char *origin = std::getenv("SFHOST_TRUSTED_ORIGIN"); origin != nullptr && *origin)
    {
        validate_origin(origin);
        trusted_origin = origin;
    }
    if (const char *level = std::getenv("SFHOST_LOG_LEVEL"); level != nullptr && *level)
    {
        validate_log_level(level);
        log_level = level;
    }
}

void HostConfig::apply_logging() const
{
    auto &logger = utils::Logger::instance();
    if (!log_file.empty())
    {
        logger.set_logfile(log_file);
    }
    // validate_log_level() has already run for every value reachable here.
    logger.set_level(utils::Logger::level_from_string(log_level).value_or(
        utils::Logger::Level::L_INFO));
}

} // namespace sfhost
