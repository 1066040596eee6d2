#include "warden/rocksdb_store.hpp"
#include <format>
#include <mutex>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace warden
{

    namespace
    {
        // Row keys
        std::string license_key(std::string_view id) { return std::format("license/{}", id); }
        std::string org_key(std::string_view id) { return std::format("org/{}", id); }
        std::string tenant_key(std::string_view id) { return std::format("tenant/{}", id); }
        std::string user_key(std::string_view id) { return std::format("user/{}", id); }
        std::string permission_key(std::string_view id) { return std::format("permission/{}", id); }
        std::string role_key(std::string_view id) { return std::format("role/{}", id); }

        // Index keys (value = referenced id)
        std::string license_by_key(std::string_view k) { return std::format("idx/license_key/{}", k); }
        std::string org_licenses(std::string_view org, std::string_view id) { return std::format("idx/org_license/{}/{}", org, id); }
        std::string org_by_domain(std::string_view d) { return std::format("idx/org_domain/{}", d); }
        std::string user_by_email(std::string_view e) { return std::format("idx/user_email/{}", e); }
        std::string super_identity() { return "idx/super_identity"; }
        std::string permission_by_name(std::string_view n) { return std::format("idx/permission_name/{}", n); }
        std::string role_by_name(std::string_view org, std::string_view n) { return std::format("idx/role_name/{}/{}", org, n); }
        std::string org_roles(std::string_view org, std::string_view id) { return std::format("idx/org_role/{}/{}", org, id); }
        std::string role_permission(std::string_view role, std::string_view perm) { return std::format("rel/role_permission/{}/{}", role, perm); }
        std::string user_role(std::string_view user, std::string_view role) { return std::format("rel/user_role/{}/{}", user, role); }

        WardenError status_error(const char *op, const rocksdb::Status &status)
        {
            return WardenError::storage(std::format("RocksDB {} failed: {}", op, status.ToString()));
        }
    } // namespace

    class RocksDbStore::Impl
    {
    public:
        explicit Impl(const StorageConfig &cfg)
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
            if (!status.ok())
            {
                throw std::runtime_error("RocksDB open failed: " + status.ToString());
            }
            spdlog::info("Opened RocksDB store at {}", cfg.rocksdb_path);
        }

        ~Impl()
        {
            delete db;
        }

        Result<std::optional<std::string>> get(const std::string &key)
        {
            std::string value;
            auto status = db->Get(rocksdb::ReadOptions(), key, &value);
            if (status.IsNotFound())
                return std::optional<std::string>{};
            if (!status.ok())
                return std::unexpected(status_error("Get", status));
            return std::optional<std::string>{std::move(value)};
        }

        Result<bool> exists(const std::string &key)
        {
            auto v = get(key);
            if (!v)
                return std::unexpected(v.error());
            return v->has_value();
        }

        template <typename Row>
        Result<std::optional<Row>> get_row(const std::string &key)
        {
            auto raw = get(key);
            if (!raw)
                return std::unexpected(raw.error());
            if (!raw->has_value())
                return std::optional<Row>{};

            json j = json::parse(**raw, nullptr, false);
            if (j.is_discarded())
                return std::unexpected(WardenError::storage(std::format("Corrupt row at {}", key)));
            auto row = Row::from_json(j);
            if (!row)
                return std::unexpected(row.error());
            return std::optional<Row>{std::move(*row)};
        }

        template <typename Row>
        Result<std::optional<Row>> get_row_by_index(const std::string &index_key,
                                                    std::string (*row_key)(std::string_view))
        {
            auto id = get(index_key);
            if (!id)
                return std::unexpected(id.error());
            if (!id->has_value())
                return std::optional<Row>{};
            return get_row<Row>(row_key(**id));
        }

        /** Suffixes of every key under prefix (the part after the prefix). */
        std::vector<std::string> scan_suffixes(const std::string &prefix)
        {
            std::vector<std::string> out;
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
            {
                out.push_back(it->key().ToString().substr(prefix.size()));
            }
            return out;
        }

        Result<void> write(rocksdb::WriteBatch &batch)
        {
            auto status = db->Write(rocksdb::WriteOptions(), &batch);
            if (!status.ok())
                return std::unexpected(status_error("Write", status));
            return {};
        }

        rocksdb::DB *db{nullptr};
        std::mutex write_mutex;
    };

    RocksDbStore::RocksDbStore(const StorageConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbStore::~RocksDbStore() = default;

    // ============================================================================
    // Licenses
    // ============================================================================

    Result<void> RocksDbStore::insert_license(const License &license)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto dup = impl_->exists(license_by_key(license.license_key));
        if (!dup)
            return std::unexpected(dup.error());
        if (*dup)
            return std::unexpected(WardenError::conflict("License key already exists"));

        auto org = impl_->get_row<Organization>(org_key(license.company_id));
        if (!org)
            return std::unexpected(org.error());
        if (!org->has_value())
            return std::unexpected(WardenError::not_found("Organization not found"));

        rocksdb::WriteBatch batch;

        // The previous current license is superseded.
        if (!(*org)->license_key.empty())
        {
            auto previous = find_license_by_key((*org)->license_key);
            if (!previous)
                return std::unexpected(previous.error());
            if (previous->has_value() && (*previous)->company_id == license.company_id &&
                ((*previous)->status == LicenseStatus::Active || (*previous)->status == LicenseStatus::Suspended))
            {
                License superseded = **previous;
                superseded.status = LicenseStatus::Revoked;
                superseded.revoked_at = license.issued_at;
                batch.Put(license_key(superseded.id), superseded.to_json().dump());
            }
        }

        auto mirrored = **org;
        mirrored.license_key = license.license_key;
        mirrored.license_status = license.status;

        batch.Put(license_key(license.id), license.to_json().dump());
        batch.Put(license_by_key(license.license_key), license.id);
        batch.Put(org_licenses(license.company_id, license.id), "");
        batch.Put(org_key(mirrored.id), mirrored.to_json().dump());
        return impl_->write(batch);
    }

    Result<std::optional<License>> RocksDbStore::find_license(std::string_view id)
    {
        return impl_->get_row<License>(license_key(id));
    }

    Result<std::optional<License>> RocksDbStore::find_license_by_key(std::string_view key)
    {
        return impl_->get_row_by_index<License>(license_by_key(key), &license_key);
    }

    Result<std::vector<License>> RocksDbStore::licenses_for_organization(std::string_view company_id)
    {
        std::vector<License> out;
        for (const auto &id : impl_->scan_suffixes(std::format("idx/org_license/{}/", company_id)))
        {
            auto row = find_license(id);
            if (!row)
                return std::unexpected(row.error());
            if (row->has_value())
                out.push_back(std::move(**row));
        }
        return out;
    }

    Result<bool> RocksDbStore::transition_license(std::string_view id,
                                                  LicenseStatus from,
                                                  LicenseStatus to,
                                                  std::optional<Timestamp> revoked_at)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto row = find_license(id);
        if (!row)
            return std::unexpected(row.error());
        if (!row->has_value())
            return std::unexpected(WardenError::not_found("License not found"));

        License license = **row;
        if (license.status != from)
            return false;

        license.status = to;
        if (revoked_at)
            license.revoked_at = revoked_at;

        rocksdb::WriteBatch batch;
        batch.Put(license_key(license.id), license.to_json().dump());

        auto org = impl_->get_row<Organization>(org_key(license.company_id));
        if (!org)
            return std::unexpected(org.error());
        if (org->has_value() && (*org)->license_key == license.license_key)
        {
            auto mirrored = **org;
            mirrored.license_status = to;
            batch.Put(org_key(mirrored.id), mirrored.to_json().dump());
        }

        if (auto res = impl_->write(batch); !res)
            return std::unexpected(res.error());
        return true;
    }

    // ============================================================================
    // Organizations and sub-tenants
    // ============================================================================

    Result<void> RocksDbStore::create_organization(const Organization &org, const License &license)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto dup_domain = impl_->exists(org_by_domain(org.domain));
        if (!dup_domain)
            return std::unexpected(dup_domain.error());
        if (*dup_domain)
            return std::unexpected(WardenError::conflict("Company with this domain already exists"));

        auto dup_key = impl_->exists(license_by_key(license.license_key));
        if (!dup_key)
            return std::unexpected(dup_key.error());
        if (*dup_key)
            return std::unexpected(WardenError::conflict("License key already exists"));

        Organization stored = org;
        stored.license_key = license.license_key;
        stored.license_status = license.status;

        rocksdb::WriteBatch batch;
        batch.Put(org_key(stored.id), stored.to_json().dump());
        batch.Put(org_by_domain(stored.domain), stored.id);
        batch.Put(license_key(license.id), license.to_json().dump());
        batch.Put(license_by_key(license.license_key), license.id);
        batch.Put(org_licenses(stored.id, license.id), "");
        return impl_->write(batch);
    }

    Result<std::optional<Organization>> RocksDbStore::find_organization(std::string_view id)
    {
        return impl_->get_row<Organization>(org_key(id));
    }

    Result<std::optional<Organization>> RocksDbStore::find_organization_by_domain(std::string_view domain)
    {
        return impl_->get_row_by_index<Organization>(org_by_domain(domain), &org_key);
    }

    Result<Organization> RocksDbStore::set_organization_blocked(std::string_view id,
                                                                bool blocked,
                                                                std::optional<std::string> reason)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto row = find_organization(id);
        if (!row)
            return std::unexpected(row.error());
        if (!row->has_value())
            return std::unexpected(WardenError::not_found("Organization not found"));

        Organization org = **row;
        org.is_blocked = blocked;
        org.blocked_reason = blocked ? std::move(reason) : std::nullopt;

        rocksdb::WriteBatch batch;
        batch.Put(org_key(org.id), org.to_json().dump());
        if (auto res = impl_->write(batch); !res)
            return std::unexpected(res.error());
        return org;
    }

    Result<void> RocksDbStore::insert_tenant(const Tenant &tenant)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto parent = impl_->exists(org_key(tenant.parent_company_id));
        if (!parent)
            return std::unexpected(parent.error());
        if (!*parent)
            return std::unexpected(WardenError::not_found("Parent organization not found"));

        rocksdb::WriteBatch batch;
        batch.Put(tenant_key(tenant.id), tenant.to_json().dump());
        return impl_->write(batch);
    }

    Result<std::optional<Tenant>> RocksDbStore::find_tenant(std::string_view id)
    {
        return impl_->get_row<Tenant>(tenant_key(id));
    }

    // ============================================================================
    // Users
    // ============================================================================

    Result<void> RocksDbStore::insert_user(const User &user)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto dup = impl_->exists(user_by_email(user.email));
        if (!dup)
            return std::unexpected(dup.error());
        if (*dup)
            return std::unexpected(WardenError::conflict("User with this email already exists"));

        if (user.is_super_user)
        {
            auto existing = impl_->exists(super_identity());
            if (!existing)
                return std::unexpected(existing.error());
            if (*existing)
                return std::unexpected(WardenError::conflict("Only one super user is allowed in the system"));
        }

        rocksdb::WriteBatch batch;
        batch.Put(user_key(user.id), user.to_json().dump());
        batch.Put(user_by_email(user.email), user.id);
        if (user.is_super_user)
            batch.Put(super_identity(), user.id);
        return impl_->write(batch);
    }

    Result<void> RocksDbStore::create_super_identity(const Organization &system_org, const User &user)
    {
        if (!user.is_super_user || user.company_id != system_org.id)
        {
            return std::unexpected(WardenError::invalid_input("Super user must belong to the system organization"));
        }

        std::lock_guard lock(impl_->write_mutex);

        auto existing = impl_->exists(super_identity());
        if (!existing)
            return std::unexpected(existing.error());
        if (*existing)
            return std::unexpected(WardenError::conflict("Only one super user is allowed in the system"));

        auto dup_domain = impl_->exists(org_by_domain(system_org.domain));
        if (!dup_domain)
            return std::unexpected(dup_domain.error());
        if (*dup_domain)
            return std::unexpected(WardenError::conflict("Company with this domain already exists"));

        auto dup_email = impl_->exists(user_by_email(user.email));
        if (!dup_email)
            return std::unexpected(dup_email.error());
        if (*dup_email)
            return std::unexpected(WardenError::conflict("User with this email already exists"));

        rocksdb::WriteBatch batch;
        batch.Put(org_key(system_org.id), system_org.to_json().dump());
        batch.Put(org_by_domain(system_org.domain), system_org.id);
        batch.Put(user_key(user.id), user.to_json().dump());
        batch.Put(user_by_email(user.email), user.id);
        batch.Put(super_identity(), user.id);
        return impl_->write(batch);
    }

    Result<std::optional<User>> RocksDbStore::find_user(std::string_view id)
    {
        return impl_->get_row<User>(user_key(id));
    }

    Result<std::optional<User>> RocksDbStore::find_user_by_email(std::string_view email)
    {
        return impl_->get_row_by_index<User>(user_by_email(email), &user_key);
    }

    Result<void> RocksDbStore::record_login(std::string_view user_id, Timestamp at)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto row = find_user(user_id);
        if (!row)
            return std::unexpected(row.error());
        if (!row->has_value())
            return std::unexpected(WardenError::not_found("User not found"));

        User user = **row;
        user.last_login = at;

        rocksdb::WriteBatch batch;
        batch.Put(user_key(user.id), user.to_json().dump());
        return impl_->write(batch);
    }

    // ============================================================================
    // RBAC
    // ============================================================================

    Result<void> RocksDbStore::insert_permission(const Permission &permission)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto dup = impl_->exists(permission_by_name(permission.name));
        if (!dup)
            return std::unexpected(dup.error());
        if (*dup)
            return std::unexpected(WardenError::conflict(std::format("Permission {} already exists", permission.name)));

        rocksdb::WriteBatch batch;
        batch.Put(permission_key(permission.id), permission.to_json().dump());
        batch.Put(permission_by_name(permission.name), permission.id);
        return impl_->write(batch);
    }

    Result<std::vector<Permission>> RocksDbStore::list_permissions()
    {
        std::vector<Permission> out;
        for (const auto &id : impl_->scan_suffixes("permission/"))
        {
            auto row = impl_->get_row<Permission>(permission_key(id));
            if (!row)
                return std::unexpected(row.error());
            if (row->has_value())
                out.push_back(std::move(**row));
        }
        return out;
    }

    Result<void> RocksDbStore::insert_role(const Role &role)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto dup = impl_->exists(role_by_name(role.company_id, role.name));
        if (!dup)
            return std::unexpected(dup.error());
        if (*dup)
            return std::unexpected(WardenError::conflict(std::format("Role {} already exists", role.name)));

        rocksdb::WriteBatch batch;
        batch.Put(role_key(role.id), role.to_json().dump());
        batch.Put(role_by_name(role.company_id, role.name), role.id);
        batch.Put(org_roles(role.company_id, role.id), "");
        return impl_->write(batch);
    }

    Result<std::optional<Role>> RocksDbStore::find_role(std::string_view id)
    {
        return impl_->get_row<Role>(role_key(id));
    }

    Result<std::vector<Role>> RocksDbStore::roles_for_organization(std::string_view company_id)
    {
        std::vector<Role> out;
        for (const auto &id : impl_->scan_suffixes(std::format("idx/org_role/{}/", company_id)))
        {
            auto row = find_role(id);
            if (!row)
                return std::unexpected(row.error());
            if (row->has_value())
                out.push_back(std::move(**row));
        }
        return out;
    }

    Result<void> RocksDbStore::set_role_permissions(std::string_view role_id,
                                                    const std::vector<std::string> &permission_ids)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto role = impl_->exists(role_key(role_id));
        if (!role)
            return std::unexpected(role.error());
        if (!*role)
            return std::unexpected(WardenError::not_found("Role not found"));

        rocksdb::WriteBatch batch;
        for (const auto &existing : impl_->scan_suffixes(std::format("rel/role_permission/{}/", role_id)))
        {
            batch.Delete(role_permission(role_id, existing));
        }
        for (const auto &permission_id : permission_ids)
        {
            auto known = impl_->exists(permission_key(permission_id));
            if (!known)
                return std::unexpected(known.error());
            if (!*known)
                return std::unexpected(WardenError::not_found(std::format("Permission {} not found", permission_id)));
            batch.Put(role_permission(role_id, permission_id), "");
        }
        return impl_->write(batch);
    }

    Result<std::vector<Permission>> RocksDbStore::permissions_for_role(std::string_view role_id)
    {
        std::vector<Permission> out;
        for (const auto &id : impl_->scan_suffixes(std::format("rel/role_permission/{}/", role_id)))
        {
            auto row = impl_->get_row<Permission>(permission_key(id));
            if (!row)
                return std::unexpected(row.error());
            if (row->has_value())
                out.push_back(std::move(**row));
        }
        return out;
    }

    Result<void> RocksDbStore::assign_role(const UserRole &assignment)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto dup = impl_->exists(user_role(assignment.user_id, assignment.role_id));
        if (!dup)
            return std::unexpected(dup.error());
        if (*dup)
            return std::unexpected(WardenError::conflict("Role already assigned to user"));

        rocksdb::WriteBatch batch;
        batch.Put(user_role(assignment.user_id, assignment.role_id), assignment.to_json().dump());
        return impl_->write(batch);
    }

    Result<void> RocksDbStore::remove_role(std::string_view user_id, std::string_view role_id)
    {
        std::lock_guard lock(impl_->write_mutex);

        auto held = impl_->exists(user_role(user_id, role_id));
        if (!held)
            return std::unexpected(held.error());
        if (!*held)
            return std::unexpected(WardenError::not_found("Role is not assigned to user"));

        rocksdb::WriteBatch batch;
        batch.Delete(user_role(user_id, role_id));
        return impl_->write(batch);
    }

    Result<std::vector<Role>> RocksDbStore::roles_for_user(std::string_view user_id)
    {
        std::vector<Role> out;
        for (const auto &role_id : impl_->scan_suffixes(std::format("rel/user_role/{}/", user_id)))
        {
            auto row = find_role(role_id);
            if (!row)
                return std::unexpected(row.error());
            if (row->has_value())
                out.push_back(std::move(**row));
        }
        return out;
    }

} // namespace warden
