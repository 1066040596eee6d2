#include "warden/permission_resolver.hpp"
#include "warden/crypto.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <spdlog/spdlog.h>

namespace warden
{

    namespace
    {
        bool operator_grant(const Permission &p)
        {
            return p.action == "read" || p.action == "create" || p.name == "api.use" || p.name == "user.read";
        }

        bool viewer_grant(const Permission &p)
        {
            return p.action == "read" || p.name == "api.use";
        }

        template <typename Pred>
        std::vector<std::string> ids_where(const std::vector<Permission> &catalog, Pred pred)
        {
            std::vector<std::string> ids;
            for (const auto &p : catalog)
            {
                if (pred(p))
                    ids.push_back(p.id);
            }
            return ids;
        }
    } // namespace

    std::set<std::string> ResolvedPermissions::names() const
    {
        std::set<std::string> out;
        for (const auto &p : permissions)
            out.insert(p.name);
        return out;
    }

    const std::vector<CatalogEntry> &default_permission_catalog()
    {
        static const std::vector<CatalogEntry> catalog = {
            {"company.read", "company", "read", "View company information"},
            {"company.update", "company", "update", "Update company settings"},
            {"company.delete", "company", "delete", "Delete company"},
            {"tenant.create", "tenant", "create", "Create child tenants"},
            {"tenant.read", "tenant", "read", "View tenant information"},
            {"tenant.update", "tenant", "update", "Update tenant settings"},
            {"tenant.delete", "tenant", "delete", "Delete tenant"},
            {"user.create", "user", "create", "Invite and create users"},
            {"user.read", "user", "read", "View user information"},
            {"user.update", "user", "update", "Update user details"},
            {"user.delete", "user", "delete", "Delete users"},
            {"role.create", "role", "create", "Create custom roles"},
            {"role.read", "role", "read", "View roles"},
            {"role.update", "role", "update", "Update role permissions"},
            {"role.delete", "role", "delete", "Delete roles"},
            {"role.assign", "role", "assign", "Assign roles to users"},
            {"license.read", "license", "read", "View license information"},
            {"license.update", "license", "update", "Update license"},
            {"license.revoke", "license", "revoke", "Revoke license"},
            {"api.use", "api", "use", "Access platform APIs"},
            {"audit.read", "audit", "read", "View audit logs"},
        };
        return catalog;
    }

    PermissionResolver::PermissionResolver(std::shared_ptr<Store> store)
        : store_(std::move(store))
    {
    }

    Result<ResolvedPermissions> PermissionResolver::resolve_for_user(const std::string &user_id)
    {
        auto roles = store_->roles_for_user(user_id);
        if (!roles)
            return std::unexpected(roles.error());

        // Keyed by permission id so the union does not depend on role order.
        std::map<std::string, Permission> by_id;
        for (const auto &role : *roles)
        {
            auto granted = store_->permissions_for_role(role.id);
            if (!granted)
                return std::unexpected(granted.error());
            for (auto &p : *granted)
                by_id.try_emplace(p.id, std::move(p));
        }

        ResolvedPermissions resolved;
        resolved.roles = std::move(*roles);
        resolved.permissions.reserve(by_id.size());
        for (auto &[id, p] : by_id)
            resolved.permissions.push_back(std::move(p));
        std::sort(resolved.permissions.begin(), resolved.permissions.end(),
                  [](const Permission &a, const Permission &b) { return a.name < b.name; });
        std::sort(resolved.roles.begin(), resolved.roles.end(),
                  [](const Role &a, const Role &b) { return a.id < b.id; });
        return resolved;
    }

    Result<bool> PermissionResolver::user_has_permission(const std::string &user_id, std::string_view permission_name)
    {
        auto user = store_->find_user(user_id);
        if (!user)
            return std::unexpected(user.error());
        if (user->has_value() && (*user)->is_super_user)
            return true;

        auto resolved = resolve_for_user(user_id);
        if (!resolved)
            return std::unexpected(resolved.error());

        return std::any_of(resolved->permissions.begin(), resolved->permissions.end(),
                           [&](const Permission &p) { return p.name == permission_name; });
    }

    Result<std::vector<Role>> PermissionResolver::create_default_roles(const std::string &company_id)
    {
        auto catalog = store_->list_permissions();
        if (!catalog)
            return std::unexpected(catalog.error());

        auto existing = store_->roles_for_organization(company_id);
        if (!existing)
            return std::unexpected(existing.error());

        auto exists = [&](std::string_view name) {
            return std::any_of(existing->begin(), existing->end(),
                               [&](const Role &r) { return r.name == name; });
        };

        struct Template
        {
            std::string_view name;
            std::string_view description;
            std::vector<std::string> permission_ids;
        };
        std::vector<Template> templates = {
            {kAdminRole, "Full administrative access", ids_where(*catalog, [](const Permission &) { return true; })},
            {kOperatorRole, "Operational access", ids_where(*catalog, operator_grant)},
            {kViewerRole, "Read-only access", ids_where(*catalog, viewer_grant)},
        };

        std::vector<Role> created;
        for (const auto &t : templates)
        {
            if (exists(t.name))
            {
                spdlog::debug("Default role {} already exists for company {}", t.name, company_id);
                continue;
            }
            auto role = create_role(company_id, std::string(t.name), std::string(t.description), t.permission_ids);
            if (!role)
                return std::unexpected(role.error());
            created.push_back(std::move(*role));
        }
        return created;
    }

    Result<Role> PermissionResolver::create_role(const std::string &company_id,
                                                 const std::string &name,
                                                 const std::string &description,
                                                 const std::vector<std::string> &permission_ids)
    {
        if (name.empty())
        {
            return std::unexpected(WardenError::invalid_input("Role name is required"));
        }

        Role role{crypto::SecureRandom::uuid_v4(), company_id, name, description};
        if (auto res = store_->insert_role(role); !res)
            return std::unexpected(res.error());

        if (!permission_ids.empty())
        {
            if (auto res = store_->set_role_permissions(role.id, permission_ids); !res)
                return std::unexpected(res.error());
        }

        spdlog::info("Created role {} ({}) for company {} with {} permission(s)",
                     role.name, role.id, company_id, permission_ids.size());
        return role;
    }

    Result<void> PermissionResolver::set_role_permissions(const std::string &role_id,
                                                          const std::vector<std::string> &permission_ids)
    {
        return store_->set_role_permissions(role_id, permission_ids);
    }

    Result<void> PermissionResolver::assign_role(const std::string &user_id,
                                                 const std::string &role_id,
                                                 std::optional<std::string> assigned_by)
    {
        auto role = store_->find_role(role_id);
        if (!role)
            return std::unexpected(role.error());
        if (!role->has_value())
            return std::unexpected(WardenError::not_found("Role not found"));

        UserRole assignment{user_id, role_id, std::move(assigned_by), now_ms()};
        return store_->assign_role(assignment);
    }

    Result<void> PermissionResolver::remove_role(const std::string &user_id, const std::string &role_id)
    {
        return store_->remove_role(user_id, role_id);
    }

    Result<std::size_t> PermissionResolver::seed_catalog()
    {
        auto existing = store_->list_permissions();
        if (!existing)
            return std::unexpected(existing.error());

        std::size_t added = 0;
        for (const auto &entry : default_permission_catalog())
        {
            bool present = std::any_of(existing->begin(), existing->end(),
                                       [&](const Permission &p) { return p.name == entry.name; });
            if (present)
                continue;

            Permission p{crypto::SecureRandom::uuid_v4(),
                         std::string(entry.name),
                         std::string(entry.resource),
                         std::string(entry.action),
                         std::string(entry.description)};
            auto res = store_->insert_permission(p);
            if (!res && res.error().code != ErrorCode::Conflict)
                return std::unexpected(res.error());
            if (res)
                ++added;
        }

        if (added > 0)
            spdlog::info("Seeded {} permission(s) into the global catalog", added);
        return added;
    }

} // namespace warden
