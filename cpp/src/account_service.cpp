#include "warden/account_service.hpp"
#include "warden/crypto.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    namespace
    {
        bool plausible_email(std::string_view email)
        {
            auto at = email.find('@');
            return at != std::string_view::npos && at > 0 && at + 1 < email.size();
        }
    } // namespace

    LicenseFeatures default_license_features()
    {
        LicenseFeatures f;
        f.max_users = 50;
        f.max_tenants = 10;
        f.api_rate_limit = 10000;
        f.enabled_modules = {"basic", "multi_tenant", "rbac"};
        return f;
    }

    AccountService::AccountService(std::shared_ptr<Store> store,
                                   std::shared_ptr<LicenseManager> licenses,
                                   std::shared_ptr<PermissionResolver> permissions,
                                   std::shared_ptr<const TokenService> tokens)
        : store_(std::move(store)),
          licenses_(std::move(licenses)),
          permissions_(std::move(permissions)),
          tokens_(std::move(tokens))
    {
    }

    Result<User> AccountService::initialize_super_identity(const std::string &email, const std::string &password)
    {
        if (!plausible_email(email) || password.empty())
        {
            return std::unexpected(WardenError::invalid_input("Super user email and password are required"));
        }

        auto hash = crypto::PasswordHash::hash(password);
        if (!hash)
            return std::unexpected(hash.error());

        Organization system_org;
        system_org.id = crypto::SecureRandom::uuid_v4();
        system_org.name = std::string(kSystemCompanyName);
        system_org.domain = std::string(kSystemDomain);
        system_org.license_key = std::string(kSystemLicenseKey);
        system_org.license_status = LicenseStatus::Active;
        system_org.domain_verified = true;
        system_org.created_at = now_ms();

        User user;
        user.id = crypto::SecureRandom::uuid_v4();
        user.email = email;
        user.full_name = "System Administrator";
        user.password_hash = std::move(*hash);
        user.company_id = system_org.id;
        user.is_super_user = true;
        user.is_org_admin = true;

        if (auto res = store_->create_super_identity(system_org, user); !res)
        {
            spdlog::warn("Super user initialization failed: {}", res.error().what());
            return std::unexpected(res.error());
        }

        spdlog::info("Super user {} created; change the password immediately", user.email);
        return user;
    }

    Result<User> AccountService::register_user(const NewUser &request)
    {
        if (!plausible_email(request.email))
            return std::unexpected(WardenError::invalid_input("A valid email is required"));
        if (request.password.empty())
            return std::unexpected(WardenError::invalid_input("Password is required"));

        auto org = store_->find_organization(request.company_id);
        if (!org)
            return std::unexpected(org.error());
        if (!org->has_value())
            return std::unexpected(WardenError::not_found("Company not found"));

        if (request.tenant_id)
        {
            auto tenant = store_->find_tenant(*request.tenant_id);
            if (!tenant)
                return std::unexpected(tenant.error());
            if (!tenant->has_value() || (*tenant)->parent_company_id != request.company_id)
                return std::unexpected(WardenError::invalid_input("Tenant does not belong to the company"));
        }

        auto hash = crypto::PasswordHash::hash(request.password);
        if (!hash)
            return std::unexpected(hash.error());

        User user;
        user.id = crypto::SecureRandom::uuid_v4();
        user.email = request.email;
        user.full_name = request.full_name;
        user.password_hash = std::move(*hash);
        user.company_id = request.company_id;
        user.tenant_id = request.tenant_id;
        user.is_org_admin = request.is_org_admin;

        if (auto res = store_->insert_user(user); !res)
            return std::unexpected(res.error());

        spdlog::info("Registered user {} in company {}", user.id, user.company_id);
        return user;
    }

    Result<LoginResult> AccountService::login(const std::string &email, const std::string &password)
    {
        auto found = store_->find_user_by_email(email);
        if (!found)
            return std::unexpected(found.error());
        if (!found->has_value() || !crypto::PasswordHash::verify(password, (*found)->password_hash))
        {
            return std::unexpected(WardenError::unauthenticated("Invalid credentials"));
        }

        User user = std::move(**found);

        auto resolved = permissions_->resolve_for_user(user.id);
        if (!resolved)
            return std::unexpected(resolved.error());

        auto token = tokens_->issue(user, resolved->names());
        if (!token)
            return std::unexpected(token.error());

        auto at = now_ms();
        if (auto res = store_->record_login(user.id, at); !res)
            spdlog::warn("Could not record login for {}: {}", user.id, res.error().what());
        else
            user.last_login = at;

        return LoginResult{std::move(*token), std::move(user)};
    }

    Result<CreatedOrganization> AccountService::create_organization(const std::string &name,
                                                                    const std::string &domain,
                                                                    const LicenseFeatures &features,
                                                                    std::optional<int> expires_in_days)
    {
        if (name.empty() || domain.empty())
        {
            return std::unexpected(WardenError::invalid_input("Missing required fields: name and domain"));
        }

        Organization org;
        org.id = crypto::SecureRandom::uuid_v4();
        org.name = name;
        org.domain = domain;
        org.created_at = now_ms();

        auto license = licenses_->issue(org.id, org.name, features, expires_in_days);
        if (!license)
            return std::unexpected(license.error());

        // Domain uniqueness is checked inside the store, in the same write.
        if (auto res = store_->create_organization(org, *license); !res)
            return std::unexpected(res.error());
        org.license_key = license->license_key;
        org.license_status = license->status;

        CreatedOrganization created{std::move(org), std::move(*license), {}, true};
        auto roles = permissions_->create_default_roles(created.organization.id);
        if (roles)
        {
            created.roles = std::move(*roles);
        }
        else
        {
            // The organization is committed; seeding can be retried.
            spdlog::error("Company {} created but default roles failed: {}",
                          created.organization.id, roles.error().what());
            created.roles_seeded = false;
        }

        spdlog::info("Created company {} ({}) with license {}",
                     created.organization.name, created.organization.id, created.license.id);
        return created;
    }

    Result<std::vector<Role>> AccountService::seed_default_roles(const std::string &company_id)
    {
        auto org = store_->find_organization(company_id);
        if (!org)
            return std::unexpected(org.error());
        if (!org->has_value())
            return std::unexpected(WardenError::not_found("Company not found"));
        return permissions_->create_default_roles(company_id);
    }

    Result<Organization> AccountService::block_organization(const std::string &company_id,
                                                            std::optional<std::string> reason)
    {
        if (!reason || reason->empty())
            reason = "No reason provided";
        auto org = store_->set_organization_blocked(company_id, true, reason);
        if (org)
            spdlog::warn("Company {} blocked: {}", company_id, *reason);
        return org;
    }

    Result<Organization> AccountService::unblock_organization(const std::string &company_id)
    {
        auto org = store_->set_organization_blocked(company_id, false, std::nullopt);
        if (org)
            spdlog::info("Company {} unblocked", company_id);
        return org;
    }

    Result<Tenant> AccountService::create_tenant(const std::string &company_id,
                                                 const std::string &name,
                                                 nlohmann::json settings)
    {
        if (name.empty())
            return std::unexpected(WardenError::invalid_input("Tenant name is required"));
        if (!settings.is_object())
            return std::unexpected(WardenError::invalid_input("Tenant settings must be an object"));

        Tenant tenant;
        tenant.id = crypto::SecureRandom::uuid_v4();
        tenant.parent_company_id = company_id;
        tenant.name = name;
        tenant.settings = std::move(settings);

        if (auto res = store_->insert_tenant(tenant); !res)
            return std::unexpected(res.error());

        spdlog::info("Created tenant {} under company {}", tenant.id, company_id);
        return tenant;
    }

} // namespace warden
