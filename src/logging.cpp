#include "gpgalias/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gpgalias::logging
{

    Result<void> set_up_logger()
    {
        try
        {
            auto logger = spdlog::get(kLoggerName);
            if (!logger)
                logger = spdlog::stderr_color_mt(kLoggerName);

            logger->set_pattern("[%^%l%$] %v");
            logger->set_level(spdlog::level::info);
            spdlog::set_default_logger(logger);

            // SPDLOG_LEVEL=debug (or trace) raises verbosity.
            spdlog::cfg::load_env_levels();
        }
        catch (const spdlog::spdlog_ex &e)
        {
            return std::unexpected(GpgAliasError::config(e.what()));
        }
        return {};
    }

} // namespace gpgalias::logging
