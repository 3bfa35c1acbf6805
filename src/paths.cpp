#include "gpgalias/paths.hpp"
#include <cstdlib>
#include <string>
#include <system_error>

namespace gpgalias::paths
{
    namespace
    {
        Result<std::filesystem::path> xdg_dir(const char *xdg_var, const std::filesystem::path &home_fallback,
                                              const std::string &what)
        {
            // Relative XDG paths are ignored.
            if (const char *xdg = std::getenv(xdg_var); xdg && *xdg)
            {
                std::filesystem::path p(xdg);
                if (p.is_absolute())
                    return p;
            }
            if (const char *home = std::getenv("HOME"); home && *home)
            {
                return std::filesystem::path(home) / home_fallback;
            }
            return std::unexpected(GpgAliasError::not_found("could not find a " + what + " directory"));
        }
    } // namespace

    Result<std::filesystem::path> config_dir()
    {
        return xdg_dir("XDG_CONFIG_HOME", ".config", "config");
    }

    Result<std::filesystem::path> data_dir()
    {
        return xdg_dir("XDG_DATA_HOME", std::filesystem::path(".local") / "share", "data");
    }

    Result<void> ensure_directory(const std::filesystem::path &dir)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            return std::unexpected(GpgAliasError::io("could not create " + dir.string() + ": " + ec.message()));
        }
        if (!std::filesystem::is_directory(dir, ec))
        {
            return std::unexpected(GpgAliasError::io("could not create " + dir.string() + ": not a directory"));
        }
        return {};
    }

} // namespace gpgalias::paths
