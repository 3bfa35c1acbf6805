#include "gpgalias/cli.hpp"
#include "gpgalias/anchor_store.hpp"
#include "gpgalias/consent.hpp"
#include "gpgalias/gpgme_provider.hpp"
#include "gpgalias/logging.hpp"
#include "gpgalias/paths.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#ifndef GPGALIAS_VERSION
#define GPGALIAS_VERSION "0.0.0"
#endif

namespace gpgalias::cli
{

	namespace
	{
		// Returns false if the run must stop; the reason has been logged.
		bool check_binding(const TrustOrchestrator &orchestrator, const std::string &alias, const std::string &key_id)
		{
			auto decision = orchestrator.decide(alias, key_id);
			if (!decision)
			{
				spdlog::error("{}", decision.error().what());
				return false;
			}
			if (!decision->accepted())
			{
				spdlog::debug("alias `{}` rejected: {}", alias, reject_reason_to_string(decision->reason));
				return false;
			}
			return true;
		}

		Result<AppConfig> load_config(const Options &opts)
		{
			if (!opts.config_path.empty())
				return ConfigLoader::load(opts.config_path);

			auto base = paths::config_dir();
			if (!base)
				return std::unexpected(base.error());
			auto dir = *base / paths::kAppDir;
			if (auto ok = paths::ensure_directory(dir); !ok)
				return std::unexpected(ok.error());
			return ConfigLoader::load_or_create(dir / paths::kConfigFile);
		}
	} // namespace

	std::string format_output(const std::vector<std::string> &key_ids, bool recipients)
	{
		std::ostringstream oss;
		for (std::size_t i = 0; i < key_ids.size(); ++i)
		{
			if (recipients)
			{
				oss << "-r " << key_ids[i];
				if (i + 1 < key_ids.size())
					oss << ' ';
			}
			else
			{
				oss << key_ids[i] << '\n';
			}
		}
		return oss.str();
	}

	int resolve(const Options &opts, const AppConfig &cfg, const TrustOrchestrator *orchestrator, std::ostream &out)
	{
		std::vector<std::string> key_ids;
		key_ids.reserve(opts.aliases.size());

		for (std::size_t i = 0; i < opts.aliases.size(); ++i)
		{
			const auto &alias = opts.aliases[i];
			spdlog::debug("{} - {}", i, alias);

			auto it = cfg.aliases.find(alias);
			if (it == cfg.aliases.end())
			{
				spdlog::error("no such alias found: `{}`", alias);
				return 1;
			}

			if (orchestrator && !check_binding(*orchestrator, alias, it->second))
				return 1;

			key_ids.push_back(it->second);
		}

		out << format_output(key_ids, opts.recipients);
		out.flush();
		if (!out)
		{
			spdlog::error("could not flush stdout");
			return 1;
		}
		return 0;
	}

	int sign_all(const AppConfig &cfg, const TrustOrchestrator *orchestrator)
	{
		if (!orchestrator)
		{
			spdlog::warn("signing is disabled in the config; nothing to sign");
			return 0;
		}

		for (const auto &[alias, key_id] : cfg.aliases)
		{
			spdlog::debug("checking alias `{}`", alias);
			if (!check_binding(*orchestrator, alias, key_id))
				return 1;
		}
		spdlog::info("all {} aliases are signed", cfg.aliases.size());
		return 0;
	}

	int run(int argc, char *argv[], std::ostream &out)
	{
		if (auto logger = logging::set_up_logger(); !logger)
		{
			std::cerr << "could not set up logger: " << logger.error().what() << std::endl;
			return 1;
		}

		CLI::App app{"Resolve short aliases to OpenPGP key IDs, guarded by trust-on-first-use signatures"};
		app.name("gpg-alias");
		app.set_version_flag("-v,--version", GPGALIAS_VERSION, "prints version information");

		Options opts;
		app.add_flag("-s,--sign-all", opts.sign_all, "check for any unsigned aliases, sign them, then exit");
		app.add_flag("-r,--recipients", opts.recipients, "prefixes each alias with `-r ` for use on the command line");
		app.add_option("-c,--config", opts.config_path, "Path to config TOML");
		app.add_flag("--dump-config", opts.dump_config, "Load and print config as JSON");
		app.add_option("alias", opts.aliases, "alias to print");

		CLI11_PARSE(app, argc, argv);

		if (opts.aliases.empty() && !opts.sign_all && !opts.dump_config)
		{
			std::cerr << app.help() << std::endl;
			spdlog::error("at least one alias is required");
			return 1;
		}
		if (spdlog::should_log(spdlog::level::debug))
		{
			std::string requested;
			for (const auto &a : opts.aliases)
				requested += (requested.empty() ? "" : ", ") + a;
			spdlog::debug("aliases requested: [{}]", requested);
		}

		auto cfg = load_config(opts);
		if (!cfg)
		{
			spdlog::error("{}", cfg.error().what());
			return 1;
		}
		spdlog::trace("{}", ConfigLoader::to_json(*cfg).dump());

		if (opts.dump_config)
		{
			out << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		std::optional<AnchorStore> store;
		std::unique_ptr<crypto::GpgmeCryptoProvider> provider;
		StreamConsentPrompt prompt(std::cin, std::cerr);
		std::optional<TrustOrchestrator> orchestrator;

		if (cfg->signing.enabled)
		{
			auto default_store = AnchorStore::open_default();
			if (!default_store)
			{
				spdlog::error("{}", default_store.error().what());
				return 1;
			}
			store.emplace(std::move(*default_store));

			auto gpgme = crypto::GpgmeCryptoProvider::create();
			if (!gpgme)
			{
				spdlog::error("{}", gpgme.error().what());
				return 1;
			}
			provider = std::move(*gpgme);
			orchestrator.emplace(cfg->signing, *store, *provider, prompt);
		}

		const TrustOrchestrator *decider = orchestrator ? &*orchestrator : nullptr;
		if (opts.sign_all)
			return sign_all(*cfg, decider);
		return resolve(opts, *cfg, decider, out);
	}

	int run(int argc, char *argv[])
	{
		return run(argc, argv, std::cout);
	}

} // namespace gpgalias::cli
