#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace gpgalias
{

    /**
     * Filesystem-resident anchors: one clear-signed `<alias>.asc` per alias
     * under a single directory. Existence of the file is the only record of
     * an alias having been anchored.
     */
    class AnchorStore
    {
    public:
        /** @param anchor_dir Directory holding the artifacts, usually <data_dir>/gpg-alias */
        explicit AnchorStore(std::filesystem::path anchor_dir);

        /** Anchor directory under the user's data directory */
        static Result<AnchorStore> open_default();

        const std::filesystem::path &directory() const { return dir_; }

        /** Path of the artifact for alias. Does not touch the filesystem. */
        std::filesystem::path locate(const std::string &alias) const;

        /** Create the anchor directory if needed, then check whether alias has an artifact */
        Result<bool> exists(const std::string &alias) const;

        /** Read the whole artifact for alias */
        Result<std::string> read(const std::string &alias) const;

        /** Create or truncate the artifact for alias and write data */
        Result<void> write(const std::string &alias, const std::string &data) const;

        /** Aliases become file names, so they may not be empty, `.`/`..` or contain separators */
        static Result<void> validate_alias(const std::string &alias);

    private:
        std::filesystem::path dir_;
    };

} // namespace gpgalias
