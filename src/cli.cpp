#include "agentreg/cli.hpp"
#include "agentreg/config.hpp"
#include "agentreg/crypto.hpp"
#include "agentreg/dispatcher.hpp"
#include "agentreg/journal.hpp"
#include "agentreg/logging.hpp"
#include "agentreg/proof_verifier.hpp"
#include "agentreg/suite.hpp"
#include <format>
#include <iostream>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#ifdef AGENTREG_HAVE_CLI11
#include <CLI/CLI.hpp>
#endif

namespace agentreg::cli
{

	namespace
	{
		Result<RegistryConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::from_env();
			return ConfigLoader::load(path);
		}

		Result<std::string> read_file(const std::string &path)
		{
			std::ifstream f(path);
			if (!f.is_open())
				return std::unexpected(RegistryError(ErrorCode::IOError, std::format("Unable to open {}", path)));
			std::stringstream buf;
			buf << f.rdbuf();
			return buf.str();
		}
	} // namespace

	int run(int argc, char *argv[])
	{
#ifdef AGENTREG_HAVE_CLI11
		CLI::App app{"agentreg: agent identity, reputation, validation and incident registries"};

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print the effective config as JSON");

		std::string keygen_out;
		auto keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 keypair for an agent wallet");
		keygen_cmd->add_option("--out", keygen_out, "Output file path (defaults to stdout)");

		std::string sign_key_path;
		std::string sign_owner;
		AgentId sign_agent{0};
		uint64_t sign_nonce{0};
		uint64_t sign_deadline{0};
		auto sign_cmd = app.add_subcommand("sign-delegation", "Sign a wallet delegation with the wallet's key");
		sign_cmd->add_option("--key", sign_key_path, "Path to the wallet's Ed25519 keypair JSON")->required();
		sign_cmd->add_option("--agent", sign_agent, "Agent id")->required();
		sign_cmd->add_option("--owner", sign_owner, "Current owner address of the agent")->required();
		sign_cmd->add_option("--nonce", sign_nonce, "Current wallet nonce of the agent");
		sign_cmd->add_option("--deadline", sign_deadline, "Last timestamp at which the proof is accepted")->required();

		std::string script_path;
		bool persist_events{false};
		bool echo_events{false};
		auto exec_cmd = app.add_subcommand("execute", "Run a JSON operation script against a fresh registry suite");
		exec_cmd->add_option("--script", script_path, "Path to JSON script")->required();
		exec_cmd->add_flag("--persist", persist_events, "Append the resulting events to the configured journal");
		exec_cmd->add_flag("--echo-events", echo_events, "Log each event as it is committed");

		auto verify_cmd = app.add_subcommand("journal-verify", "Verify the hash chain of the persisted journal");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}
		if (auto res = logging::init(cfg->logging.level); !res)
		{
			std::cerr << res.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			auto env = ConfigLoader::resolve(*cfg);
			if (!env)
			{
				std::cerr << env.error().what() << std::endl;
				return 1;
			}
			auto out = ConfigLoader::to_json(*cfg);
			out["resolved"] = {{"chain_id", env->chain_id},
							   {"identity_registry", env->identity_registry.to_hex()},
							   {"reputation_registry", env->reputation_registry.to_hex()},
							   {"validation_registry", env->validation_registry.to_hex()},
							   {"incident_registry", env->incident_registry.to_hex()}};
			std::cout << out.dump(2) << std::endl;
			return 0;
		}

		if (*keygen_cmd)
		{
			auto kp = crypto::Ed25519KeyPair::generate();
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			auto doc = nlohmann::json::parse(kp->to_json());
			doc["address"] = address_from_public_key(kp->public_key).to_hex();
			if (keygen_out.empty())
			{
				std::cout << doc.dump(2) << std::endl;
			}
			else
			{
				std::ofstream out(keygen_out);
				if (!out.is_open())
				{
					std::cerr << "Unable to open output file" << std::endl;
					return 1;
				}
				out << doc.dump(2) << std::endl;
			}
			return 0;
		}

		if (*sign_cmd)
		{
			auto text = read_file(sign_key_path);
			if (!text)
			{
				std::cerr << text.error().what() << std::endl;
				return 1;
			}
			auto kp = crypto::Ed25519KeyPair::from_json(*text);
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			auto owner = Address::from_hex(sign_owner);
			if (!owner)
			{
				std::cerr << owner.error().what() << std::endl;
				return 1;
			}
			auto env = ConfigLoader::resolve(*cfg);
			if (!env)
			{
				std::cerr << env.error().what() << std::endl;
				return 1;
			}

			DelegationRequest req;
			req.chain_id = env->chain_id;
			req.registry = env->identity_registry;
			req.agent_id = sign_agent;
			req.owner = *owner;
			req.wallet = address_from_public_key(kp->public_key);
			req.nonce = sign_nonce;
			req.deadline = sign_deadline;

			nlohmann::json out = {{"request", req.to_json()},
								  {"wallet", req.wallet.to_hex()},
								  {"proof", sign_delegation(req, *kp).to_json()}};
			std::cout << out.dump(2) << std::endl;
			return 0;
		}

		if (*exec_cmd)
		{
			auto env = ConfigLoader::resolve(*cfg);
			if (!env)
			{
				std::cerr << env.error().what() << std::endl;
				return 1;
			}
			auto text = read_file(script_path);
			if (!text)
			{
				std::cerr << text.error().what() << std::endl;
				return 1;
			}
			nlohmann::json script;
			try
			{
				script = nlohmann::json::parse(*text);
			}
			catch (const nlohmann::json::parse_error &e)
			{
				std::cerr << "Invalid script JSON: " << e.what() << std::endl;
				return 1;
			}

			std::unique_ptr<EventJournal> journal;
			if (persist_events || cfg->journal.enabled)
			{
				auto journal_cfg = cfg->journal;
				journal_cfg.enabled = true;
				auto opened = open_journal(journal_cfg);
				if (!opened)
				{
					std::cerr << opened.error().what() << std::endl;
					return 1;
				}
				journal = std::move(*opened);
				// the suite starts empty, so its chain can only extend an empty journal
				if (journal->size() != 0)
				{
					std::cerr << "Journal at " << cfg->journal.rocksdb_path << " already holds "
							  << journal->size() << " events" << std::endl;
					return 1;
				}
			}

			RegistrySuite suite(*env);
			EventLogger event_logger;
			if (echo_events)
				event_logger.attach(suite.events());

			Dispatcher dispatcher(suite);
			auto result = dispatcher.run_script(script);
			if (!result)
			{
				std::cerr << result.error().what() << std::endl;
				return 1;
			}

			if (journal)
			{
				auto written = persist(suite.events(), *journal);
				if (!written)
				{
					std::cerr << written.error().what() << std::endl;
					return 1;
				}
				(*result)["persisted"] = *written;
			}
			std::cout << result->dump(2) << std::endl;
			return 0;
		}

		if (*verify_cmd)
		{
			auto journal_cfg = cfg->journal;
			journal_cfg.enabled = true;
			auto opened = open_journal(journal_cfg);
			if (!opened)
			{
				std::cerr << opened.error().what() << std::endl;
				return 1;
			}
			auto events = (*opened)->load_all();
			if (!events)
			{
				std::cerr << events.error().what() << std::endl;
				return 1;
			}
			if (auto res = EventLog::verify(*events); !res)
			{
				std::cerr << res.error().what() << std::endl;
				return 2;
			}
			std::cout << "Journal OK: " << events->size() << " events";
			if (!events->empty())
				std::cout << "; head=" << events->back().hash;
			std::cout << std::endl;
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
#else
		(void)argc;
		(void)argv;
		std::cout << "agentreg built without CLI11" << std::endl;
		return 0;
#endif
	}

} // namespace agentreg::cli
