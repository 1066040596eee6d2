#pragma once

#include "store.hpp"
#include <memory>
#include <string>

namespace warden
{

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/rocksdb"};
    };

    /**
     * RocksDB-backed Store. Rows are JSON values under typed key prefixes
     * with secondary index keys; multi-row writes go through a WriteBatch
     * and read-modify-write sections are serialized by a writer mutex.
     * Throws std::runtime_error if the database cannot be opened.
     */
    class RocksDbStore : public Store
    {
    public:
        explicit RocksDbStore(const StorageConfig &cfg);
        ~RocksDbStore() override;

        Result<void> insert_license(const License &license) override;
        Result<std::optional<License>> find_license(std::string_view id) override;
        Result<std::optional<License>> find_license_by_key(std::string_view license_key) override;
        Result<std::vector<License>> licenses_for_organization(std::string_view company_id) override;
        Result<bool> transition_license(std::string_view id,
                                        LicenseStatus from,
                                        LicenseStatus to,
                                        std::optional<Timestamp> revoked_at) override;

        Result<void> create_organization(const Organization &org, const License &license) override;
        Result<std::optional<Organization>> find_organization(std::string_view id) override;
        Result<std::optional<Organization>> find_organization_by_domain(std::string_view domain) override;
        Result<Organization> set_organization_blocked(std::string_view id,
                                                      bool blocked,
                                                      std::optional<std::string> reason) override;
        Result<void> insert_tenant(const Tenant &tenant) override;
        Result<std::optional<Tenant>> find_tenant(std::string_view id) override;

        Result<void> insert_user(const User &user) override;
        Result<void> create_super_identity(const Organization &system_org, const User &user) override;
        Result<std::optional<User>> find_user(std::string_view id) override;
        Result<std::optional<User>> find_user_by_email(std::string_view email) override;
        Result<void> record_login(std::string_view user_id, Timestamp at) override;

        Result<void> insert_permission(const Permission &permission) override;
        Result<std::vector<Permission>> list_permissions() override;
        Result<void> insert_role(const Role &role) override;
        Result<std::optional<Role>> find_role(std::string_view id) override;
        Result<std::vector<Role>> roles_for_organization(std::string_view company_id) override;
        Result<void> set_role_permissions(std::string_view role_id,
                                          const std::vector<std::string> &permission_ids) override;
        Result<std::vector<Permission>> permissions_for_role(std::string_view role_id) override;
        Result<void> assign_role(const UserRole &assignment) override;
        Result<void> remove_role(std::string_view user_id, std::string_view role_id) override;
        Result<std::vector<Role>> roles_for_user(std::string_view user_id) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace warden
