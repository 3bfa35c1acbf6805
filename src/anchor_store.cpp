#include "gpgalias/anchor_store.hpp"
#include "gpgalias/paths.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace gpgalias
{

    AnchorStore::AnchorStore(std::filesystem::path anchor_dir)
        : dir_(std::move(anchor_dir))
    {
    }

    Result<AnchorStore> AnchorStore::open_default()
    {
        auto data = paths::data_dir();
        if (!data)
            return std::unexpected(data.error());
        return AnchorStore(*data / paths::kAppDir);
    }

    std::filesystem::path AnchorStore::locate(const std::string &alias) const
    {
        return dir_ / (alias + ".asc");
    }

    Result<void> AnchorStore::validate_alias(const std::string &alias)
    {
        if (alias.empty() || alias == "." || alias == "..")
        {
            return std::unexpected(GpgAliasError::invalid_input("invalid alias `" + alias + "`"));
        }
        if (alias.find('/') != std::string::npos || alias.find('\\') != std::string::npos ||
            alias.find('\0') != std::string::npos)
        {
            return std::unexpected(GpgAliasError::invalid_input("alias `" + alias + "` may not contain path separators"));
        }
        return {};
    }

    Result<bool> AnchorStore::exists(const std::string &alias) const
    {
        if (auto ok = validate_alias(alias); !ok)
            return std::unexpected(ok.error());
        if (auto ok = paths::ensure_directory(dir_); !ok)
            return std::unexpected(ok.error());

        auto path = locate(alias);
        std::error_code ec;
        bool present = std::filesystem::exists(path, ec);
        if (ec)
        {
            return std::unexpected(GpgAliasError::io("could not stat " + path.string() + ": " + ec.message()));
        }
        spdlog::debug("anchor for `{}` at {}: {}", alias, path.string(), present ? "present" : "absent");
        return present;
    }

    Result<std::string> AnchorStore::read(const std::string &alias) const
    {
        if (auto ok = validate_alias(alias); !ok)
            return std::unexpected(ok.error());

        auto path = locate(alias);
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            return std::unexpected(GpgAliasError::io("could not open signature file " + path.string()));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
        {
            return std::unexpected(GpgAliasError::io("could not read signature file " + path.string()));
        }
        return buffer.str();
    }

    Result<void> AnchorStore::write(const std::string &alias, const std::string &data) const
    {
        if (auto ok = validate_alias(alias); !ok)
            return ok;
        if (auto ok = paths::ensure_directory(dir_); !ok)
            return ok;

        auto path = locate(alias);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            return std::unexpected(GpgAliasError::io("could not create " + path.string()));
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out)
        {
            return std::unexpected(GpgAliasError::io("could not write signature file " + path.string()));
        }
        return {};
    }

} // namespace gpgalias
