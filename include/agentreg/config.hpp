#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentreg
{

    struct EnvironmentConfig
    {
        uint64_t chain_id{1};
        std::string deployment{"local"};

        // hex overrides; derived from (deployment, chain_id, name) when unset
        std::optional<std::string> identity_address;
        std::optional<std::string> reputation_address;
        std::optional<std::string> validation_address;
        std::optional<std::string> incident_address;
    };

    struct JournalConfig
    {
        bool enabled{false};
        std::string rocksdb_path{"./data/journal"};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct RegistryConfig
    {
        EnvironmentConfig environment{};
        JournalConfig journal{};
        LoggingConfig logging{};
    };

    /**
     * Execution environment identifier of one deployment: the chain id plus
     * the address of every registry instance. Folded into request ids and
     * delegation messages so values from one deployment never verify in
     * another.
     */
    struct Environment
    {
        uint64_t chain_id{1};
        Address identity_registry;
        Address reputation_registry;
        Address validation_registry;
        Address incident_registry;

        static Environment derive(uint64_t chain_id, const std::string &deployment);
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides. When
     * AGENTREG_HAVE_TOMLPP is not available, it falls back to defaults and
     * environment variables.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<RegistryConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<RegistryConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, no file */
        static Result<RegistryConfig> from_env();

        /** Resolve registry addresses, applying overrides */
        static Result<Environment> resolve(const RegistryConfig &cfg);

        static nlohmann::json to_json(const RegistryConfig &cfg);

    private:
        static Result<void> apply_env_overrides(RegistryConfig &cfg);
    };

} // namespace agentreg
