#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <string>

namespace gpgalias
{

    struct SigningPolicy
    {
        bool enabled{false};
        std::string key; // identifier of the designated signing key
    };

    struct AppConfig
    {
        SigningPolicy signing{};
        std::map<std::string, std::string> aliases; // alias -> key identifier
    };

    /**
     * ConfigLoader loads the TOML alias mapping and signing settings, with
     * environment overrides for the signing section.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AppConfig> load(const std::filesystem::path &path);

        /** Load config from path, writing the default config there first if it does not exist. */
        static Result<AppConfig> load_or_create(const std::filesystem::path &path);

        /** Parse config from TOML string content. */
        static Result<AppConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const AppConfig &cfg);

        /** Contents written on first run */
        static const std::string &default_config();

    private:
        static Result<void> apply_env_overrides(AppConfig &cfg);
        static Result<void> validate(const AppConfig &cfg);
    };

} // namespace gpgalias
