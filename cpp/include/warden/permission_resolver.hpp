#pragma once

#include "model.hpp"
#include "store.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    /** Roles held by a user and the de-duplicated union of their permissions. */
    struct ResolvedPermissions
    {
        std::vector<Role> roles;
        std::vector<Permission> permissions; // ordered by name, unique by id

        std::set<std::string> names() const;
    };

    /** Entry of the global permission catalog. */
    struct CatalogEntry
    {
        std::string_view name;
        std::string_view resource;
        std::string_view action;
        std::string_view description;
    };

    /** The built-in `resource.action` catalog seeded on bootstrap. */
    const std::vector<CatalogEntry> &default_permission_catalog();

    /**
     * RBAC engine: users gain permissions only through roles; roles belong
     * to one organization, permissions are global.
     */
    class PermissionResolver
    {
    public:
        static constexpr std::string_view kAdminRole = "Admin";
        static constexpr std::string_view kOperatorRole = "Operator";
        static constexpr std::string_view kViewerRole = "Viewer";

        explicit PermissionResolver(std::shared_ptr<Store> store);

        /** Union of permissions over all roles; independent of role order. */
        Result<ResolvedPermissions> resolve_for_user(const std::string &user_id);

        /** Super-identity always passes; otherwise exact name match. */
        Result<bool> user_has_permission(const std::string &user_id, std::string_view permission_name);

        /**
         * Seed Admin (every permission), Operator (read/create actions plus
         * api.use and user.read) and Viewer (read actions plus api.use) for
         * an organization. Roles that already exist by name are skipped.
         * Returns the roles created by this call.
         */
        Result<std::vector<Role>> create_default_roles(const std::string &company_id);

        Result<Role> create_role(const std::string &company_id,
                                 const std::string &name,
                                 const std::string &description,
                                 const std::vector<std::string> &permission_ids = {});

        Result<void> set_role_permissions(const std::string &role_id,
                                          const std::vector<std::string> &permission_ids);

        /** Conflict if already assigned; the role must exist. */
        Result<void> assign_role(const std::string &user_id,
                                 const std::string &role_id,
                                 std::optional<std::string> assigned_by = std::nullopt);

        Result<void> remove_role(const std::string &user_id, const std::string &role_id);

        /** Insert catalog permissions that are not present yet. Returns how many were added. */
        Result<std::size_t> seed_catalog();

    private:
        std::shared_ptr<Store> store_;
    };

} // namespace warden
