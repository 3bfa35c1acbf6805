#pragma once

#include "config.hpp"
#include "trust_orchestrator.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace gpgalias::cli
{

    struct Options
    {
        std::vector<std::string> aliases;
        std::string config_path; // empty: <config_dir>/gpg-alias/gpg-alias.toml
        bool recipients{false};
        bool sign_all{false};
        bool dump_config{false};
    };

    /** Join key IDs one per line, or as `-r <id>` separated by spaces without a trailing newline */
    std::string format_output(const std::vector<std::string> &key_ids, bool recipients);

    /**
     * Look up every alias in order and, when orchestrator is given, require an
     * accepted trust decision for each. Output is written to out only once every
     * alias passed. Returns the process exit code.
     */
    int resolve(const Options &opts, const AppConfig &cfg, const TrustOrchestrator *orchestrator, std::ostream &out);

    /** Run every configured alias through the orchestrator; prints nothing. Returns the exit code. */
    int sign_all(const AppConfig &cfg, const TrustOrchestrator *orchestrator);

    /**
     * Entry point: parse arguments, set up logging and config, dispatch.
     * Key IDs and `--dump-config` JSON go to out; logs and the consent prompt go to stderr.
     */
    int run(int argc, char *argv[], std::ostream &out);
    int run(int argc, char *argv[]);

} // namespace gpgalias::cli
