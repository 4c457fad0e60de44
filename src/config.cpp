#include "agentreg/config.hpp"
#include "agentreg/crypto.hpp"
#include <charconv>
#include <format>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

#ifdef AGENTREG_HAVE_TOMLPP
#include <toml++/toml.h>
#endif

namespace agentreg
{
    namespace
    {
        Address derived_address(uint64_t chain_id, const std::string &deployment, std::string_view name)
        {
            auto digest = crypto::DigestBuilder("agentreg.registry-address")
                              .add(chain_id)
                              .add(deployment)
                              .add(name)
                              .finish();
            Address a;
            std::copy_n(digest.bytes.begin() + (Hash32::kSize - Address::kSize), Address::kSize, a.bytes.begin());
            return a;
        }

        Result<Address> resolve_one(const std::optional<std::string> &override_hex,
                                    const Address &fallback,
                                    const char *name)
        {
            if (!override_hex)
                return fallback;
            auto parsed = Address::from_hex(*override_hex);
            if (!parsed)
                return std::unexpected(RegistryError::config(std::format("Invalid {} address: {}", name, parsed.error().what())));
            if (parsed->is_zero())
                return std::unexpected(RegistryError::config(std::format("{} address must not be zero", name)));
            return parsed;
        }

#ifdef AGENTREG_HAVE_TOMLPP
        Result<RegistryConfig> parse_toml(const toml::table &tbl, RegistryConfig cfg)
        {
            if (auto env = tbl["environment"].as_table())
            {
                if (auto chain = (*env)["chain_id"].value<int64_t>())
                {
                    if (*chain < 0)
                        return std::unexpected(RegistryError::config(std::format("chain_id must not be negative: {}", *chain)));
                    cfg.environment.chain_id = static_cast<uint64_t>(*chain);
                }
                if (auto dep = (*env)["deployment"].value<std::string>())
                    cfg.environment.deployment = *dep;
                if (auto a = (*env)["identity_address"].value<std::string>())
                    cfg.environment.identity_address = *a;
                if (auto a = (*env)["reputation_address"].value<std::string>())
                    cfg.environment.reputation_address = *a;
                if (auto a = (*env)["validation_address"].value<std::string>())
                    cfg.environment.validation_address = *a;
                if (auto a = (*env)["incident_address"].value<std::string>())
                    cfg.environment.incident_address = *a;
            }

            if (auto journal = tbl["journal"].as_table())
            {
                if (auto enabled = (*journal)["enabled"].value<bool>())
                    cfg.journal.enabled = *enabled;
                if (auto path = (*journal)["rocksdb_path"].value<std::string>())
                    cfg.journal.rocksdb_path = *path;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            return cfg;
        }
#endif

    } // namespace

    Environment Environment::derive(uint64_t chain_id, const std::string &deployment)
    {
        Environment env;
        env.chain_id = chain_id;
        env.identity_registry = derived_address(chain_id, deployment, "identity");
        env.reputation_registry = derived_address(chain_id, deployment, "reputation");
        env.validation_registry = derived_address(chain_id, deployment, "validation");
        env.incident_registry = derived_address(chain_id, deployment, "incident");
        return env;
    }

    Result<RegistryConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(RegistryError::config(std::format("Unable to open config file: {}", path)));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<RegistryConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        RegistryConfig cfg{};

#ifdef AGENTREG_HAVE_TOMLPP
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(RegistryError::config(std::format("Failed to parse TOML: {}", e.what())));
        }
#else
        (void)toml_content;
#endif

        if (auto r = apply_env_overrides(cfg); !r)
            return std::unexpected(r.error());
        return cfg;
    }

    Result<RegistryConfig> ConfigLoader::from_env()
    {
        RegistryConfig cfg{};
        if (auto r = apply_env_overrides(cfg); !r)
            return std::unexpected(r.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(RegistryConfig &cfg)
    {
        if (const char *chain = std::getenv("AGENTREG_CHAIN_ID"))
        {
            const std::string_view text(chain);
            uint64_t value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (text.empty() || ec != std::errc() || end != text.data() + text.size())
                return std::unexpected(RegistryError::config(std::format("Invalid AGENTREG_CHAIN_ID: '{}'", text)));
            cfg.environment.chain_id = value;
        }
        if (const char *dep = std::getenv("AGENTREG_DEPLOYMENT"))
            cfg.environment.deployment = dep;
        if (const char *path = std::getenv("AGENTREG_JOURNAL_PATH"))
            cfg.journal.rocksdb_path = path;
        if (const char *enabled = std::getenv("AGENTREG_JOURNAL_ENABLED"))
            cfg.journal.enabled = std::string(enabled) != "0";
        if (const char *level = std::getenv("AGENTREG_LOG_LEVEL"))
            cfg.logging.level = level;
        return {};
    }

    Result<Environment> ConfigLoader::resolve(const RegistryConfig &cfg)
    {
        auto env = Environment::derive(cfg.environment.chain_id, cfg.environment.deployment);

        auto identity = resolve_one(cfg.environment.identity_address, env.identity_registry, "identity");
        if (!identity)
            return std::unexpected(identity.error());
        auto reputation = resolve_one(cfg.environment.reputation_address, env.reputation_registry, "reputation");
        if (!reputation)
            return std::unexpected(reputation.error());
        auto validation = resolve_one(cfg.environment.validation_address, env.validation_registry, "validation");
        if (!validation)
            return std::unexpected(validation.error());
        auto incident = resolve_one(cfg.environment.incident_address, env.incident_registry, "incident");
        if (!incident)
            return std::unexpected(incident.error());

        env.identity_registry = *identity;
        env.reputation_registry = *reputation;
        env.validation_registry = *validation;
        env.incident_registry = *incident;
        return env;
    }

    nlohmann::json ConfigLoader::to_json(const RegistryConfig &cfg)
    {
        nlohmann::json j;
        j["environment"] = {
            {"chain_id", cfg.environment.chain_id},
            {"deployment", cfg.environment.deployment}};
        if (auto env = resolve(cfg))
        {
            j["environment"]["identity_address"] = env->identity_registry.to_hex();
            j["environment"]["reputation_address"] = env->reputation_registry.to_hex();
            j["environment"]["validation_address"] = env->validation_registry.to_hex();
            j["environment"]["incident_address"] = env->incident_registry.to_hex();
        }
        else
        {
            j["environment"]["error"] = env.error().what();
        }
        j["journal"] = {{"enabled", cfg.journal.enabled}, {"rocksdb_path", cfg.journal.rocksdb_path}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace agentreg
