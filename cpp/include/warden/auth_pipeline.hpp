#pragma once

#include "license_manager.hpp"
#include "model.hpp"
#include "permission_resolver.hpp"
#include "store.hpp"
#include "token.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string_view>
#include <string>
#include <vector>

namespace warden
{

    /** Inbound request as seen by the pipeline. */
    struct AuthRequest
    {
        std::optional<std::string> authorization; // raw Authorization header
    };

    /**
     * Authorization context assembled once per request. Immutable after
     * construction; handlers receive it by shared_ptr-to-const.
     */
    struct AuthContext
    {
        User user;
        Organization organization;
        std::optional<Tenant> tenant;
        std::optional<License> license; // unset for the super-identity
        std::set<std::string> permissions;
        std::vector<Role> roles;

        bool has_permission(std::string_view name) const;

        /** View returned by GET /api/me. */
        nlohmann::json to_json() const;
    };

    using AuthContextPtr = std::shared_ptr<const AuthContext>;

    /**
     * Turns a bearer credential into an AuthContext:
     *   credential -> token -> user -> organization -> license -> tenant -> permissions
     *
     * Permission resolution runs concurrently with license validation.
     * The pipeline never retries; every failure is terminal for the request.
     */
    class AuthPipeline
    {
    public:
        AuthPipeline(std::shared_ptr<Store> store,
                     std::shared_ptr<const TokenService> tokens,
                     std::shared_ptr<LicenseManager> licenses,
                     std::shared_ptr<PermissionResolver> permissions);

        /**
         * Errors: Unauthenticated (credential, token, user), Forbidden
         * (organization missing or blocked, license), Cancelled (stop
         * requested), StorageError. The super-identity is exempt from the
         * block and license checks.
         */
        Result<AuthContextPtr> authenticate(const AuthRequest &request, std::stop_token stop = {}) const;

    private:
        std::shared_ptr<Store> store_;
        std::shared_ptr<const TokenService> tokens_;
        std::shared_ptr<LicenseManager> licenses_;
        std::shared_ptr<PermissionResolver> permissions_;
    };

    // ---- guards ------------------------------------------------------------
    // Guards read the context only; they never touch credentials or licenses.

    /** Requires a named permission; the super-identity always passes. */
    class PermissionGuard
    {
    public:
        explicit PermissionGuard(std::string permission);

        Result<void> check(const AuthContext &ctx) const;

        const std::string &permission() const { return permission_; }

    private:
        std::string permission_;
    };

    /** Requires the org-admin flag or the super-identity flag. */
    class OrgAdminGuard
    {
    public:
        Result<void> check(const AuthContext &ctx) const;
    };

    /** Requires the super-identity flag. */
    class SuperIdentityGuard
    {
    public:
        Result<void> check(const AuthContext &ctx) const;
    };

} // namespace warden
