#pragma once

#include "types.hpp"
#include <filesystem>

namespace gpgalias::paths
{
    /** Name of the per-application subdirectory under the config and data directories */
    inline constexpr const char *kAppDir = "gpg-alias";

    /** Name of the config file inside the application config directory */
    inline constexpr const char *kConfigFile = "gpg-alias.toml";

    /** $XDG_CONFIG_HOME, or $HOME/.config */
    Result<std::filesystem::path> config_dir();

    /** $XDG_DATA_HOME, or $HOME/.local/share */
    Result<std::filesystem::path> data_dir();

    /** Recursively create a directory; succeeds if it already exists */
    Result<void> ensure_directory(const std::filesystem::path &dir);

} // namespace gpgalias::paths
