#include "warden/model.hpp"
#include <format>

using json = nlohmann::json;

namespace warden
{

    namespace
    {
        template <typename T>
        std::optional<T> optional_field(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            return it->get<T>();
        }

        std::optional<Timestamp> optional_ts(const json &j, const char *key)
        {
            auto ms = optional_field<std::int64_t>(j, key);
            if (!ms)
                return std::nullopt;
            return from_epoch_ms(*ms);
        }

        json ts_or_null(const std::optional<Timestamp> &ts)
        {
            return ts ? json(to_epoch_ms(*ts)) : json(nullptr);
        }

        template <typename T>
        json optional_or_null(const std::optional<T> &v)
        {
            return v ? json(*v) : json(nullptr);
        }

        WardenError parse_error(const char *what, const json::exception &e)
        {
            return WardenError::storage(std::format("Failed to parse {} record: {}", what, e.what()));
        }
    } // namespace

    std::string license_status_to_string(LicenseStatus status)
    {
        switch (status)
        {
        case LicenseStatus::Active:
            return "active";
        case LicenseStatus::Expired:
            return "expired";
        case LicenseStatus::Suspended:
            return "suspended";
        case LicenseStatus::Revoked:
            return "revoked";
        }
        return "unknown";
    }

    Result<LicenseStatus> license_status_from_string(std::string_view s)
    {
        if (s == "active")
            return LicenseStatus::Active;
        if (s == "expired")
            return LicenseStatus::Expired;
        if (s == "suspended")
            return LicenseStatus::Suspended;
        if (s == "revoked")
            return LicenseStatus::Revoked;
        return std::unexpected(WardenError::invalid_input(std::format("Invalid license status: {}", s)));
    }

    // ============================================================================
    // LicenseFeatures
    // ============================================================================

    json LicenseFeatures::to_json() const
    {
        json j = json::object();
        if (max_users)
            j["max_users"] = *max_users;
        if (max_tenants)
            j["max_tenants"] = *max_tenants;
        if (api_rate_limit)
            j["api_rate_limit"] = *api_rate_limit;
        j["enabled_modules"] = enabled_modules;
        j["custom_features"] = custom_features;
        return j;
    }

    Result<LicenseFeatures> LicenseFeatures::from_json(const json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(WardenError::invalid_input("License features must be an object"));
        }

        try
        {
            LicenseFeatures f;
            f.max_users = optional_field<std::int64_t>(j, "max_users");
            f.max_tenants = optional_field<std::int64_t>(j, "max_tenants");
            f.api_rate_limit = optional_field<std::int64_t>(j, "api_rate_limit");
            f.enabled_modules = j.value("enabled_modules", std::vector<std::string>{});
            f.custom_features = j.value("custom_features", std::map<std::string, bool>{});
            return f;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(WardenError::invalid_input(std::format("Invalid license features: {}", e.what())));
        }
    }

    // ============================================================================
    // License
    // ============================================================================

    json License::to_json() const
    {
        return json{{"id", id},
                    {"company_id", company_id},
                    {"license_key", license_key},
                    {"status", license_status_to_string(status)},
                    {"features", features.to_json()},
                    {"issued_at", to_epoch_ms(issued_at)},
                    {"expires_at", ts_or_null(expires_at)},
                    {"revoked_at", ts_or_null(revoked_at)},
                    {"signature", signature}};
    }

    Result<License> License::from_json(const json &j)
    {
        try
        {
            License l;
            l.id = j.at("id").get<std::string>();
            l.company_id = j.at("company_id").get<std::string>();
            l.license_key = j.at("license_key").get<std::string>();

            auto status = license_status_from_string(j.at("status").get<std::string>());
            if (!status)
                return std::unexpected(status.error());
            l.status = *status;

            auto features = LicenseFeatures::from_json(j.at("features"));
            if (!features)
                return std::unexpected(features.error());
            l.features = std::move(*features);

            l.issued_at = from_epoch_ms(j.at("issued_at").get<std::int64_t>());
            l.expires_at = optional_ts(j, "expires_at");
            l.revoked_at = optional_ts(j, "revoked_at");
            l.signature = j.value("signature", std::string());
            return l;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("license", e));
        }
    }

    // ============================================================================
    // Organization
    // ============================================================================

    json Organization::to_json() const
    {
        return json{{"id", id},
                    {"name", name},
                    {"domain", domain},
                    {"license_key", license_key},
                    {"license_status", license_status_to_string(license_status)},
                    {"domain_verified", domain_verified},
                    {"is_blocked", is_blocked},
                    {"blocked_reason", optional_or_null(blocked_reason)},
                    {"created_at", to_epoch_ms(created_at)}};
    }

    Result<Organization> Organization::from_json(const json &j)
    {
        try
        {
            Organization o;
            o.id = j.at("id").get<std::string>();
            o.name = j.at("name").get<std::string>();
            o.domain = j.at("domain").get<std::string>();
            o.license_key = j.value("license_key", std::string());

            auto status = license_status_from_string(j.value("license_status", std::string("active")));
            if (!status)
                return std::unexpected(status.error());
            o.license_status = *status;

            o.domain_verified = j.value("domain_verified", false);
            o.is_blocked = j.value("is_blocked", false);
            o.blocked_reason = optional_field<std::string>(j, "blocked_reason");
            o.created_at = from_epoch_ms(j.value("created_at", std::int64_t{0}));
            return o;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("organization", e));
        }
    }

    // ============================================================================
    // Tenant
    // ============================================================================

    json Tenant::to_json() const
    {
        return json{{"id", id},
                    {"parent_company_id", parent_company_id},
                    {"name", name},
                    {"settings", settings},
                    {"is_active", is_active}};
    }

    Result<Tenant> Tenant::from_json(const json &j)
    {
        try
        {
            Tenant t;
            t.id = j.at("id").get<std::string>();
            t.parent_company_id = j.at("parent_company_id").get<std::string>();
            t.name = j.at("name").get<std::string>();
            t.settings = j.value("settings", json::object());
            t.is_active = j.value("is_active", true);
            return t;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("tenant", e));
        }
    }

    // ============================================================================
    // User
    // ============================================================================

    json User::to_public_json() const
    {
        return json{{"id", id},
                    {"email", email},
                    {"full_name", full_name},
                    {"company_id", company_id},
                    {"tenant_id", optional_or_null(tenant_id)},
                    {"is_super_user", is_super_user},
                    {"is_org_admin", is_org_admin},
                    {"last_login", ts_or_null(last_login)}};
    }

    json User::to_json() const
    {
        json j = to_public_json();
        j["password_hash"] = password_hash;
        return j;
    }

    Result<User> User::from_json(const json &j)
    {
        try
        {
            User u;
            u.id = j.at("id").get<std::string>();
            u.email = j.at("email").get<std::string>();
            u.full_name = j.value("full_name", std::string());
            u.password_hash = j.value("password_hash", std::string());
            u.company_id = j.at("company_id").get<std::string>();
            u.tenant_id = optional_field<std::string>(j, "tenant_id");
            u.is_super_user = j.value("is_super_user", false);
            u.is_org_admin = j.value("is_org_admin", false);
            u.last_login = optional_ts(j, "last_login");
            return u;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("user", e));
        }
    }

    // ============================================================================
    // Permission / Role / UserRole
    // ============================================================================

    json Permission::to_json() const
    {
        return json{{"id", id},
                    {"name", name},
                    {"resource", resource},
                    {"action", action},
                    {"description", description}};
    }

    Result<Permission> Permission::from_json(const json &j)
    {
        try
        {
            return Permission{
                j.at("id").get<std::string>(),
                j.at("name").get<std::string>(),
                j.at("resource").get<std::string>(),
                j.at("action").get<std::string>(),
                j.value("description", std::string())};
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("permission", e));
        }
    }

    json Role::to_json() const
    {
        return json{{"id", id},
                    {"company_id", company_id},
                    {"name", name},
                    {"description", description}};
    }

    Result<Role> Role::from_json(const json &j)
    {
        try
        {
            return Role{
                j.at("id").get<std::string>(),
                j.at("company_id").get<std::string>(),
                j.at("name").get<std::string>(),
                j.value("description", std::string())};
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("role", e));
        }
    }

    json UserRole::to_json() const
    {
        return json{{"user_id", user_id},
                    {"role_id", role_id},
                    {"assigned_by", optional_or_null(assigned_by)},
                    {"assigned_at", to_epoch_ms(assigned_at)}};
    }

    Result<UserRole> UserRole::from_json(const json &j)
    {
        try
        {
            UserRole ur;
            ur.user_id = j.at("user_id").get<std::string>();
            ur.role_id = j.at("role_id").get<std::string>();
            ur.assigned_by = optional_field<std::string>(j, "assigned_by");
            ur.assigned_at = from_epoch_ms(j.value("assigned_at", std::int64_t{0}));
            return ur;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(parse_error("user role", e));
        }
    }

} // namespace warden
