#include "warden/services.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    Result<Services> Services::create(const WardenConfig &cfg, std::shared_ptr<Store> store)
    {
        if (!store)
            return std::unexpected(WardenError::config("No store configured"));
        if (cfg.license.encryption_key.empty() || cfg.license.signing_key.empty())
            return std::unexpected(WardenError::config("License encryption and signing keys are required"));
        if (cfg.jwt.secret.empty())
            return std::unexpected(WardenError::config("JWT secret is required"));
        if (!crypto::AES256GCM::is_available())
            return std::unexpected(WardenError::crypto("AES-256-GCM is not supported on this CPU"));

        Services s;
        s.config = cfg;
        s.store = std::move(store);
        s.codec = std::make_shared<LicenseCodec>(cfg.license.encryption_key, cfg.license.signing_key);
        s.licenses = std::make_shared<LicenseManager>(s.store, s.codec);
        s.permissions = std::make_shared<PermissionResolver>(s.store);
        s.tokens = std::make_shared<TokenService>(cfg.jwt);
        s.pipeline = std::make_shared<AuthPipeline>(s.store, s.tokens, s.licenses, s.permissions);
        s.accounts = std::make_shared<AccountService>(s.store, s.licenses, s.permissions, s.tokens);
        s.audit = std::make_shared<AuditLogger>(cfg.audit.enabled, cfg.audit.log_path);

        auto seeded = s.permissions->seed_catalog();
        if (!seeded)
            return std::unexpected(seeded.error());

        if (cfg.jwt.secret == TokenConfig{}.secret || cfg.license.encryption_key == LicenseConfig{}.encryption_key)
        {
            spdlog::warn("Running with default development secrets; set JWT_SECRET and LICENSE_ENCRYPTION_KEY");
        }
        return s;
    }

    void configure_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && cfg.level != "off")
        {
            spdlog::warn("Unknown log level '{}', using info", cfg.level);
            level = spdlog::level::info;
        }
        spdlog::set_level(level);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    }

} // namespace warden
