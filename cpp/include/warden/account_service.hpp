#pragma once

#include "license_manager.hpp"
#include "model.hpp"
#include "permission_resolver.hpp"
#include "store.hpp"
#include "token.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace warden
{

    struct LoginResult
    {
        std::string token;
        User user;
    };

    struct CreatedOrganization
    {
        Organization organization;
        License license;
        std::vector<Role> roles;
        bool roles_seeded{true}; // false: retry with seed_default_roles
    };

    struct NewUser
    {
        std::string email;
        std::string password;
        std::string full_name;
        std::string company_id;
        std::optional<std::string> tenant_id;
        bool is_org_admin{false};
    };

    /** Features granted when an organization is created without explicit ones. */
    LicenseFeatures default_license_features();

    /**
     * Bootstrap and account paths that produce the rows the auth pipeline
     * consumes: the super-identity, organizations and their users.
     */
    class AccountService
    {
    public:
        static constexpr std::string_view kSystemCompanyName = "Warden System";
        static constexpr std::string_view kSystemDomain = "warden.system";
        static constexpr std::string_view kSystemLicenseKey = "SYSTEM-LICENSE";

        AccountService(std::shared_ptr<Store> store,
                       std::shared_ptr<LicenseManager> licenses,
                       std::shared_ptr<PermissionResolver> permissions,
                       std::shared_ptr<const TokenService> tokens);

        /**
         * One-time setup: system organization plus the single super-identity.
         * Conflict if a super-identity already exists.
         */
        Result<User> initialize_super_identity(const std::string &email, const std::string &password);

        /**
         * Create a user in an existing organization. A tenant, when given,
         * must belong to that organization (InvalidInput otherwise).
         */
        Result<User> register_user(const NewUser &request);

        /** Unauthenticated("Invalid credentials") on unknown email or wrong password. */
        Result<LoginResult> login(const std::string &email, const std::string &password);

        /**
         * Create an organization with its first license and default roles.
         * Conflict on duplicate domain. Organization and license are written
         * together; if role seeding then fails the organization is still
         * returned, with roles_seeded = false.
         */
        Result<CreatedOrganization> create_organization(const std::string &name,
                                                        const std::string &domain,
                                                        const LicenseFeatures &features,
                                                        std::optional<int> expires_in_days = std::nullopt);

        /** Idempotent; returns only the default roles it had to create. */
        Result<std::vector<Role>> seed_default_roles(const std::string &company_id);

        Result<Organization> block_organization(const std::string &company_id, std::optional<std::string> reason);
        Result<Organization> unblock_organization(const std::string &company_id);

        /** Sub-tenant under an organization. NotFound for an unknown organization. */
        Result<Tenant> create_tenant(const std::string &company_id,
                                     const std::string &name,
                                     nlohmann::json settings = nlohmann::json::object());

    private:
        std::shared_ptr<Store> store_;
        std::shared_ptr<LicenseManager> licenses_;
        std::shared_ptr<PermissionResolver> permissions_;
        std::shared_ptr<const TokenService> tokens_;
    };

} // namespace warden
