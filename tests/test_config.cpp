#include <catch2/catch_test_macros.hpp>
#include "gpgalias/config.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace gpgalias;
using gpgalias::testing::TempDir;

namespace
{
    void clear_env_overrides()
    {
        ::unsetenv("GPG_ALIAS_SIGNING_ENABLED");
        ::unsetenv("GPG_ALIAS_SIGNING_KEY");
    }
}

TEST_CASE("Config parses signing and aliases", "[config]")
{
    clear_env_overrides();
    auto cfg = ConfigLoader::from_string(R"(
[signing]
enabled = true
key = "ABCD1234"

[aliases]
work = "1111AAAA"
home = "jane@example.org"
)");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->signing.enabled);
    REQUIRE(cfg->signing.key == "ABCD1234");
    REQUIRE(cfg->aliases.size() == 2);
    REQUIRE(cfg->aliases.at("work") == "1111AAAA");
    REQUIRE(cfg->aliases.at("home") == "jane@example.org");
}

TEST_CASE("Missing sections fall back to defaults", "[config]")
{
    clear_env_overrides();
    auto cfg = ConfigLoader::from_string("");
    REQUIRE(cfg.has_value());
    REQUIRE_FALSE(cfg->signing.enabled);
    REQUIRE(cfg->signing.key.empty());
    REQUIRE(cfg->aliases.empty());
}

TEST_CASE("Default config is itself valid", "[config]")
{
    clear_env_overrides();
    auto cfg = ConfigLoader::from_string(ConfigLoader::default_config());
    REQUIRE(cfg.has_value());
    REQUIRE_FALSE(cfg->signing.enabled);
    REQUIRE(cfg->aliases.empty());
}

TEST_CASE("Malformed config is rejected", "[config]")
{
    clear_env_overrides();

    SECTION("Not TOML")
    {
        auto cfg = ConfigLoader::from_string("[signing\nenabled = ");
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::ConfigError);
    }

    SECTION("Non-string alias value")
    {
        auto cfg = ConfigLoader::from_string("[aliases]\nwork = 42\n");
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::ConfigError);
    }

    SECTION("Wrong type for signing.enabled")
    {
        auto cfg = ConfigLoader::from_string("[signing]\nenabled = \"yes\"\n");
        REQUIRE_FALSE(cfg.has_value());
    }

    SECTION("aliases is not a table")
    {
        auto cfg = ConfigLoader::from_string("aliases = \"work\"\n");
        REQUIRE_FALSE(cfg.has_value());
    }

    SECTION("Signing enabled without a key")
    {
        auto cfg = ConfigLoader::from_string("[signing]\nenabled = true\n");
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Environment overrides the signing section", "[config]")
{
    clear_env_overrides();
    ::setenv("GPG_ALIAS_SIGNING_ENABLED", "1", 1);
    ::setenv("GPG_ALIAS_SIGNING_KEY", "FEEDBEEF", 1);

    auto cfg = ConfigLoader::from_string("[signing]\nenabled = false\nkey = \"ABCD1234\"\n");
    clear_env_overrides();

    REQUIRE(cfg.has_value());
    REQUIRE(cfg->signing.enabled);
    REQUIRE(cfg->signing.key == "FEEDBEEF");

    ::setenv("GPG_ALIAS_SIGNING_ENABLED", "0", 1);
    auto disabled = ConfigLoader::from_string("[signing]\nenabled = true\nkey = \"ABCD1234\"\n");
    clear_env_overrides();
    REQUIRE(disabled.has_value());
    REQUIRE_FALSE(disabled->signing.enabled);
}

TEST_CASE("Signing flag in the environment is strict", "[config]")
{
    const std::string toml = "[signing]\nenabled = true\nkey = \"ABCD1234\"\n";

    SECTION("false and FALSE disable")
    {
        for (const char *value : {"false", "FALSE", "False"})
        {
            clear_env_overrides();
            ::setenv("GPG_ALIAS_SIGNING_ENABLED", value, 1);
            auto cfg = ConfigLoader::from_string(toml);
            clear_env_overrides();
            REQUIRE(cfg.has_value());
            REQUIRE_FALSE(cfg->signing.enabled);
        }
    }

    SECTION("TRUE enables")
    {
        clear_env_overrides();
        ::setenv("GPG_ALIAS_SIGNING_ENABLED", "TRUE", 1);
        auto cfg = ConfigLoader::from_string("[signing]\nkey = \"ABCD1234\"\n");
        clear_env_overrides();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->signing.enabled);
    }

    SECTION("Anything else is a config error")
    {
        for (const char *value : {"", "yes", "2", "off"})
        {
            clear_env_overrides();
            ::setenv("GPG_ALIAS_SIGNING_ENABLED", value, 1);
            auto cfg = ConfigLoader::from_string(toml);
            clear_env_overrides();
            REQUIRE_FALSE(cfg.has_value());
            REQUIRE(cfg.error().code == ErrorCode::ConfigError);
        }
    }
}

TEST_CASE("First load writes the default config", "[config]")
{
    clear_env_overrides();
    TempDir tmp;
    auto path = tmp.path() / "gpg-alias.toml";

    auto cfg = ConfigLoader::load_or_create(path);
    REQUIRE(cfg.has_value());
    REQUIRE(std::filesystem::exists(path));

    std::ifstream in(path);
    std::stringstream written;
    written << in.rdbuf();
    REQUIRE(written.str() == ConfigLoader::default_config());

    SECTION("Existing config is left alone")
    {
        {
            std::ofstream out(path, std::ios::trunc);
            out << "[aliases]\nwork = \"1111AAAA\"\n";
        }
        auto again = ConfigLoader::load_or_create(path);
        REQUIRE(again.has_value());
        REQUIRE(again->aliases.at("work") == "1111AAAA");
    }
}

TEST_CASE("Loading a missing file is an I/O error", "[config]")
{
    TempDir tmp;
    auto cfg = ConfigLoader::load(tmp.path() / "nope.toml");
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == ErrorCode::IOError);
}

TEST_CASE("Config serializes to JSON", "[config]")
{
    AppConfig cfg;
    cfg.signing = SigningPolicy{true, "ABCD1234"};
    cfg.aliases["work"] = "1111AAAA";

    auto j = ConfigLoader::to_json(cfg);
    REQUIRE(j["signing"]["enabled"] == true);
    REQUIRE(j["signing"]["key"] == "ABCD1234");
    REQUIRE(j["aliases"]["work"] == "1111AAAA");
}
