#pragma once

#include "model.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    /**
     * Abstract interface over the relational rows this core reads and writes
     * (organizations, users, sub-tenants, licenses and the RBAC join model).
     *
     * Implementations own their atomicity: every uniqueness rule below is
     * enforced inside the store, never by a caller's check-then-act.
     * Backend failures surface as StorageError.
     */
    class Store
    {
    public:
        virtual ~Store() = default;

        // ---- licenses ------------------------------------------------------

        /**
         * Insert a license row and mirror its key and status onto the owning
         * organization, atomically. The license it replaces as current, if
         * still active or suspended, is revoked in the same write (revoked_at
         * = the new license's issued_at). Conflict if the key already exists,
         * NotFound if the organization does not.
         */
        virtual Result<void> insert_license(const License &license) = 0;

        virtual Result<std::optional<License>> find_license(std::string_view id) = 0;

        virtual Result<std::optional<License>> find_license_by_key(std::string_view license_key) = 0;

        virtual Result<std::vector<License>> licenses_for_organization(std::string_view company_id) = 0;

        /**
         * Compare-and-set the status of a license. Applies only when the
         * stored status equals `from`; returns whether it applied. When the
         * license is its organization's current one, the organization's
         * status mirror is updated in the same write.
         */
        virtual Result<bool> transition_license(
            std::string_view id,
            LicenseStatus from,
            LicenseStatus to,
            std::optional<Timestamp> revoked_at) = 0;

        // ---- organizations and sub-tenants --------------------------------

        /**
         * Insert an organization together with its first license.
         * Conflict on duplicate domain or license key.
         */
        virtual Result<void> create_organization(const Organization &org, const License &license) = 0;

        virtual Result<std::optional<Organization>> find_organization(std::string_view id) = 0;

        virtual Result<std::optional<Organization>> find_organization_by_domain(std::string_view domain) = 0;

        /** Set or clear the blocked flag. NotFound for an unknown organization. */
        virtual Result<Organization> set_organization_blocked(
            std::string_view id,
            bool blocked,
            std::optional<std::string> reason) = 0;

        /** NotFound if the parent organization does not exist. */
        virtual Result<void> insert_tenant(const Tenant &tenant) = 0;

        virtual Result<std::optional<Tenant>> find_tenant(std::string_view id) = 0;

        // ---- users ---------------------------------------------------------

        /**
         * Conflict on duplicate email, or when the user is a super-identity
         * and one already exists.
         */
        virtual Result<void> insert_user(const User &user) = 0;

        /**
         * Insert the system organization (no license row) and the single
         * super-identity in one write. Conflict if a super-identity exists.
         */
        virtual Result<void> create_super_identity(const Organization &system_org, const User &user) = 0;

        virtual Result<std::optional<User>> find_user(std::string_view id) = 0;

        virtual Result<std::optional<User>> find_user_by_email(std::string_view email) = 0;

        virtual Result<void> record_login(std::string_view user_id, Timestamp at) = 0;

        // ---- RBAC ----------------------------------------------------------

        /** Conflict on duplicate permission name. */
        virtual Result<void> insert_permission(const Permission &permission) = 0;

        virtual Result<std::vector<Permission>> list_permissions() = 0;

        /** Conflict on duplicate (organization, name). */
        virtual Result<void> insert_role(const Role &role) = 0;

        virtual Result<std::optional<Role>> find_role(std::string_view id) = 0;

        virtual Result<std::vector<Role>> roles_for_organization(std::string_view company_id) = 0;

        /** Replace the permission set granted by a role. NotFound for unknown role. */
        virtual Result<void> set_role_permissions(
            std::string_view role_id,
            const std::vector<std::string> &permission_ids) = 0;

        virtual Result<std::vector<Permission>> permissions_for_role(std::string_view role_id) = 0;

        /** Conflict if the user already holds the role. */
        virtual Result<void> assign_role(const UserRole &assignment) = 0;

        /** NotFound if the user does not hold the role. */
        virtual Result<void> remove_role(std::string_view user_id, std::string_view role_id) = 0;

        virtual Result<std::vector<Role>> roles_for_user(std::string_view user_id) = 0;
    };

} // namespace warden
