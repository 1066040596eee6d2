#pragma once

#include "account_service.hpp"
#include "audit.hpp"
#include "auth_pipeline.hpp"
#include "config.hpp"
#include "license_codec.hpp"
#include "license_manager.hpp"
#include "permission_resolver.hpp"
#include "store.hpp"
#include "token.hpp"
#include <memory>

namespace warden
{

    /** The wired object graph shared by the CLI and the HTTP server. */
    struct Services
    {
        WardenConfig config;
        std::shared_ptr<Store> store;
        std::shared_ptr<const LicenseCodec> codec;
        std::shared_ptr<LicenseManager> licenses;
        std::shared_ptr<PermissionResolver> permissions;
        std::shared_ptr<const TokenService> tokens;
        std::shared_ptr<const AuthPipeline> pipeline;
        std::shared_ptr<AccountService> accounts;
        std::shared_ptr<AuditLogger> audit;

        /**
         * Wire every service over the given store and seed the permission
         * catalog. Throws WardenError on invalid configuration.
         */
        static Result<Services> create(const WardenConfig &cfg, std::shared_ptr<Store> store);
    };

    /** Apply the configured level to the global spdlog logger. */
    void configure_logging(const LoggingConfig &cfg);

} // namespace warden
