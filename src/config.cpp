#include "gpgalias/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>
#include <toml++/toml.h>

namespace gpgalias
{
    namespace
    {
        const std::string kDefaultConfig =
            "# gpg-alias configuration\n"
            "\n"
            "[signing]\n"
            "# When enabled, every alias must be anchored by a signature made with\n"
            "# `key` (or one of its subkeys) before its key ID is printed.\n"
            "enabled = false\n"
            "key = \"\"\n"
            "\n"
            "[aliases]\n"
            "# work = \"1111AAAA\"\n";

        std::optional<bool> parse_env_flag(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (value == "1" || value == "true")
                return true;
            if (value == "0" || value == "false")
                return false;
            return std::nullopt;
        }

        Result<AppConfig> parse_toml(const toml::table &tbl, AppConfig cfg)
        {
            if (auto node = tbl["signing"]; node)
            {
                auto signing = node.as_table();
                if (!signing)
                    return std::unexpected(GpgAliasError::config("`signing` must be a table"));

                if (auto enabled = (*signing)["enabled"]; enabled)
                {
                    auto v = enabled.value<bool>();
                    if (!v)
                        return std::unexpected(GpgAliasError::config("`signing.enabled` must be a boolean"));
                    cfg.signing.enabled = *v;
                }
                if (auto key = (*signing)["key"]; key)
                {
                    auto v = key.value<std::string>();
                    if (!v)
                        return std::unexpected(GpgAliasError::config("`signing.key` must be a string"));
                    cfg.signing.key = *v;
                }
            }

            if (auto node = tbl["aliases"]; node)
            {
                auto aliases = node.as_table();
                if (!aliases)
                    return std::unexpected(GpgAliasError::config("`aliases` must be a table"));

                for (auto &&[k, v] : *aliases)
                {
                    std::string alias(k.str());
                    auto id = v.value<std::string>();
                    if (!v.is_string() || !id)
                        return std::unexpected(GpgAliasError::config("alias `" + alias + "` must map to a string"));
                    cfg.aliases[alias] = *id;
                }
            }

            return cfg;
        }

    } // namespace

    const std::string &ConfigLoader::default_config()
    {
        return kDefaultConfig;
    }

    Result<AppConfig> ConfigLoader::load(const std::filesystem::path &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(GpgAliasError::io("could not open " + path.string()));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
        {
            return std::unexpected(GpgAliasError::io("could not read " + path.string()));
        }
        return from_string(buffer.str());
    }

    Result<AppConfig> ConfigLoader::load_or_create(const std::filesystem::path &path)
    {
        std::error_code ec;
        bool existed = std::filesystem::exists(path, ec);
        if (ec)
        {
            return std::unexpected(GpgAliasError::io("could not open " + path.string() + ": " + ec.message()));
        }

        if (!existed)
        {
            spdlog::debug("writing default config to {}", path.string());
            std::ofstream out(path, std::ios::binary);
            if (!out.is_open())
            {
                return std::unexpected(GpgAliasError::io("could not open " + path.string()));
            }
            out << kDefaultConfig;
            out.flush();
            if (!out)
            {
                return std::unexpected(GpgAliasError::io("could not write default config to " + path.string()));
            }
        }

        return load(path);
    }

    Result<AppConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AppConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(GpgAliasError::config(std::string("could not parse config file: ") +
                                                         std::string(e.description())));
        }

        if (auto ok = apply_env_overrides(cfg); !ok)
            return std::unexpected(ok.error());
        if (auto ok = validate(cfg); !ok)
            return std::unexpected(ok.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(AppConfig &cfg)
    {
        if (const char *enabled = std::getenv("GPG_ALIAS_SIGNING_ENABLED"))
        {
            auto flag = parse_env_flag(enabled);
            if (!flag)
            {
                return std::unexpected(GpgAliasError::config(
                    std::string("GPG_ALIAS_SIGNING_ENABLED must be one of 1, 0, true, false (got `") + enabled + "`)"));
            }
            cfg.signing.enabled = *flag;
        }
        if (const char *key = std::getenv("GPG_ALIAS_SIGNING_KEY"))
            cfg.signing.key = key;
        return {};
    }

    Result<void> ConfigLoader::validate(const AppConfig &cfg)
    {
        if (cfg.signing.enabled && cfg.signing.key.empty())
        {
            return std::unexpected(GpgAliasError::config("`signing.enabled` is set but `signing.key` is empty"));
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AppConfig &cfg)
    {
        nlohmann::json j;
        j["signing"] = {{"enabled", cfg.signing.enabled}, {"key", cfg.signing.key}};
        j["aliases"] = nlohmann::json::object();
        for (const auto &[alias, id] : cfg.aliases)
            j["aliases"][alias] = id;
        return j;
    }

} // namespace gpgalias
