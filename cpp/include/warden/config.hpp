#pragma once

#include "rocksdb_store.hpp"
#include "token.hpp"
#include "types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace warden
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::size_t threads{4};
    };

    /** Master secrets for the license codec. */
    struct LicenseConfig
    {
        std::string encryption_key{"default-key-change-in-production"};
        std::string signing_key{"default-signing-key"};
    };

    struct SuperUserConfig
    {
        std::string email{"admin@warden.local"};
        std::string password{"ChangeMe123!"};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct AuditConfig
    {
        bool enabled{true};
        std::string log_path{"./logs/audit.log"};
    };

    struct WardenConfig
    {
        ServerConfig server{};
        LicenseConfig license{};
        TokenConfig jwt{};
        SuperUserConfig super_user{};
        StorageConfig storage{};
        LoggingConfig logging{};
        AuditConfig audit{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     * Environment variables always win over file values.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<WardenConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<WardenConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment, for running without a file. */
        static Result<WardenConfig> from_env();

        /** Serialize config to JSON for inspection; secrets appear only as present/absent. */
        static nlohmann::json to_json(const WardenConfig &cfg);

        static Result<void> apply_env_overrides(WardenConfig &cfg);
    };

} // namespace warden
