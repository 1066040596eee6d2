#include "warden/auth_pipeline.hpp"
#include <algorithm>
#include <future>
#include <spdlog/spdlog.h>

namespace warden
{

    namespace
    {
        Result<void> check_stop(const std::stop_token &stop)
        {
            if (stop.stop_requested())
                return std::unexpected(WardenError::cancelled("Request cancelled"));
            return {};
        }
    } // namespace

    bool AuthContext::has_permission(std::string_view name) const
    {
        return user.is_super_user || permissions.contains(std::string(name));
    }

    nlohmann::json AuthContext::to_json() const
    {
        nlohmann::json j;
        j["user"] = user.to_public_json();
        j["company"] = {
            {"id", organization.id},
            {"name", organization.name},
            {"domain", organization.domain},
            {"licenseStatus", license_status_to_string(organization.license_status)}};
        j["tenant"] = tenant ? tenant->to_json() : nlohmann::json(nullptr);
        if (license)
        {
            j["license"] = {
                {"id", license->id},
                {"status", license_status_to_string(license->status)},
                {"features", license->features.to_json()}};
            if (license->expires_at)
                j["license"]["expiresAt"] = to_iso8601(*license->expires_at);
        }
        else
        {
            j["license"] = nullptr;
        }
        j["permissions"] = permissions;

        auto roles_json = nlohmann::json::array();
        for (const auto &role : roles)
            roles_json.push_back({{"id", role.id}, {"name", role.name}});
        j["roles"] = std::move(roles_json);
        return j;
    }

    AuthPipeline::AuthPipeline(std::shared_ptr<Store> store,
                               std::shared_ptr<const TokenService> tokens,
                               std::shared_ptr<LicenseManager> licenses,
                               std::shared_ptr<PermissionResolver> permissions)
        : store_(std::move(store)),
          tokens_(std::move(tokens)),
          licenses_(std::move(licenses)),
          permissions_(std::move(permissions))
    {
    }

    Result<AuthContextPtr> AuthPipeline::authenticate(const AuthRequest &request, std::stop_token stop) const
    {
        // 1. Credential
        std::optional<std::string_view> credential;
        if (request.authorization)
            credential = extract_bearer(*request.authorization);
        if (!credential)
        {
            return std::unexpected(WardenError::unauthenticated("Missing or invalid authorization header"));
        }

        // 2. Token
        auto claims = tokens_->verify(*credential);
        if (!claims)
            return std::unexpected(claims.error());

        // 3. User
        if (auto s = check_stop(stop); !s)
            return std::unexpected(s.error());
        auto user = store_->find_user(claims->user_id);
        if (!user)
            return std::unexpected(user.error());
        if (!user->has_value())
            return std::unexpected(WardenError::unauthenticated("User not found"));

        // 4. Organization
        if (auto s = check_stop(stop); !s)
            return std::unexpected(s.error());
        auto org = store_->find_organization((*user)->company_id);
        if (!org)
            return std::unexpected(org.error());
        if (!org->has_value())
            return std::unexpected(WardenError::forbidden("Company not found"));
        if ((*org)->is_blocked && !(*user)->is_super_user)
        {
            auto reason = (*org)->blocked_reason.value_or("No reason provided");
            spdlog::info("Rejected user {} of blocked company {}", (*user)->id, (*org)->id);
            return std::unexpected(WardenError::forbidden("Company is blocked").with_reason(reason));
        }

        if (auto s = check_stop(stop); !s)
            return std::unexpected(s.error());

        // 7 (started early). Permissions do not depend on the license, so they
        // are resolved while the license is being validated.
        auto resolver = permissions_;
        auto user_id = (*user)->id;
        auto resolved_future = std::async(std::launch::async, [resolver, user_id]() {
            return resolver->resolve_for_user(user_id);
        });

        // 5. License
        std::optional<LicenseValidation> validation;
        if (!(*user)->is_super_user)
            validation = licenses_->validate((*org)->license_key);

        // 6. Tenant (best-effort)
        std::optional<Tenant> tenant;
        if ((*user)->tenant_id && !stop.stop_requested())
        {
            auto found = store_->find_tenant(*(*user)->tenant_id);
            if (found)
                tenant = std::move(*found);
            else
                spdlog::warn("Tenant lookup failed for user {}: {}", user_id, found.error().what());
        }

        // The future is joined on every path so no lookup outlives the call.
        auto resolved = resolved_future.get();

        if (auto s = check_stop(stop); !s)
            return std::unexpected(s.error());

        if (validation && !validation->valid)
        {
            auto reason = validation->reason.value_or("License validation failed");
            spdlog::info("Rejected user {} of company {}: {}", user_id, (*org)->id, reason);
            return std::unexpected(WardenError::forbidden("Invalid or expired license").with_reason(reason));
        }

        if (!resolved)
            return std::unexpected(resolved.error());

        auto ctx = std::make_shared<AuthContext>();
        ctx->user = std::move(**user);
        ctx->organization = std::move(**org);
        ctx->tenant = std::move(tenant);
        if (validation)
            ctx->license = std::move(validation->license);
        ctx->permissions = resolved->names();
        ctx->roles = std::move(resolved->roles);
        return AuthContextPtr(std::move(ctx));
    }

    // ============================================================================
    // Guards
    // ============================================================================

    PermissionGuard::PermissionGuard(std::string permission)
        : permission_(std::move(permission))
    {
    }

    Result<void> PermissionGuard::check(const AuthContext &ctx) const
    {
        if (ctx.has_permission(permission_))
            return {};
        return std::unexpected(
            WardenError::forbidden("Insufficient permissions: " + permission_ + " required").with_required(permission_));
    }

    Result<void> OrgAdminGuard::check(const AuthContext &ctx) const
    {
        if (ctx.user.is_org_admin || ctx.user.is_super_user)
            return {};
        return std::unexpected(
            WardenError::forbidden("Organization admin access required").with_required("org_admin"));
    }

    Result<void> SuperIdentityGuard::check(const AuthContext &ctx) const
    {
        if (ctx.user.is_super_user)
            return {};
        return std::unexpected(
            WardenError::forbidden("Super user access required").with_required("super_user"));
    }

} // namespace warden
