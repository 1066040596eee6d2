#pragma once

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace warden
{

    enum class LicenseStatus
    {
        Active,
        Expired,
        Suspended,
        Revoked
    };

    std::string license_status_to_string(LicenseStatus status);

    Result<LicenseStatus> license_status_from_string(std::string_view s);

    /**
     * Feature set sealed into a license: numeric caps, enabled module names,
     * and free-form boolean flags.
     */
    struct LicenseFeatures
    {
        std::optional<std::int64_t> max_users;
        std::optional<std::int64_t> max_tenants;
        std::optional<std::int64_t> api_rate_limit;
        std::vector<std::string> enabled_modules;
        std::map<std::string, bool> custom_features;

        nlohmann::json to_json() const;
        static Result<LicenseFeatures> from_json(const nlohmann::json &j);

        bool operator==(const LicenseFeatures &) const = default;
    };

    struct License
    {
        std::string id;
        std::string company_id;
        std::string license_key;
        LicenseStatus status{LicenseStatus::Active};
        LicenseFeatures features;
        Timestamp issued_at{};
        std::optional<Timestamp> expires_at;
        std::optional<Timestamp> revoked_at;
        std::string signature; // HMAC over license_key

        nlohmann::json to_json() const;
        static Result<License> from_json(const nlohmann::json &j);
    };

    /** Top-level tenant (company). */
    struct Organization
    {
        std::string id;
        std::string name;
        std::string domain;
        std::string license_key;
        LicenseStatus license_status{LicenseStatus::Active};
        bool domain_verified{false};
        bool is_blocked{false};
        std::optional<std::string> blocked_reason;
        Timestamp created_at{};

        nlohmann::json to_json() const;
        static Result<Organization> from_json(const nlohmann::json &j);
    };

    /** Sub-tenant nested under an organization. */
    struct Tenant
    {
        std::string id;
        std::string parent_company_id;
        std::string name;
        nlohmann::json settings = nlohmann::json::object();
        bool is_active{true};

        nlohmann::json to_json() const;
        static Result<Tenant> from_json(const nlohmann::json &j);
    };

    struct User
    {
        std::string id;
        std::string email;
        std::string full_name;
        std::string password_hash;
        std::string company_id;
        std::optional<std::string> tenant_id;
        bool is_super_user{false};
        bool is_org_admin{false};
        std::optional<Timestamp> last_login;

        /** JSON without the password hash, for responses and logs. */
        nlohmann::json to_public_json() const;

        nlohmann::json to_json() const;
        static Result<User> from_json(const nlohmann::json &j);
    };

    /** Global capability named `resource.action`. */
    struct Permission
    {
        std::string id;
        std::string name;
        std::string resource;
        std::string action;
        std::string description;

        nlohmann::json to_json() const;
        static Result<Permission> from_json(const nlohmann::json &j);

        bool operator==(const Permission &) const = default;
    };

    /** Organization-scoped bundle of permissions. */
    struct Role
    {
        std::string id;
        std::string company_id;
        std::string name;
        std::string description;

        nlohmann::json to_json() const;
        static Result<Role> from_json(const nlohmann::json &j);
    };

    struct UserRole
    {
        std::string user_id;
        std::string role_id;
        std::optional<std::string> assigned_by;
        Timestamp assigned_at{};

        nlohmann::json to_json() const;
        static Result<UserRole> from_json(const nlohmann::json &j);
    };

} // namespace warden
