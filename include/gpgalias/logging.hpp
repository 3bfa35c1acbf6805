#pragma once

#include "types.hpp"

namespace gpgalias::logging
{
    /** Name of the process-wide logger */
    inline constexpr const char *kLoggerName = "gpg-alias";

    /**
     * Install a coloured stderr logger as spdlog's default, formatted as
     * `[level] message` at info level. SPDLOG_LEVEL in the environment
     * overrides the level.
     */
    Result<void> set_up_logger();

} // namespace gpgalias::logging
