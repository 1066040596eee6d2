#pragma once

#include "in_memory_store.hpp"
#include "warden/services.hpp"
#include <atomic>
#include <chrono>
#include <memory>

namespace warden::testing
{
    /** Adjustable clock for expiry scenarios. */
    class ManualClock
    {
    public:
        explicit ManualClock(Timestamp start = now_ms()) : now_(to_epoch_ms(start)) {}

        Timestamp now() const { return from_epoch_ms(now_.load()); }

        void advance(std::chrono::milliseconds d) { now_ += d.count(); }

        LicenseManager::Clock fn()
        {
            return [this] { return now(); };
        }

    private:
        std::atomic<std::int64_t> now_;
    };

    inline WardenConfig test_config()
    {
        WardenConfig cfg;
        cfg.license.encryption_key = "test-encryption-secret";
        cfg.license.signing_key = "test-signing-secret";
        cfg.jwt.secret = "test-jwt-secret";
        cfg.jwt.expires_in = std::chrono::hours{1};
        cfg.audit.enabled = false;
        return cfg;
    }

    inline std::shared_ptr<const LicenseCodec> test_codec()
    {
        auto cfg = test_config();
        return std::make_shared<LicenseCodec>(cfg.license.encryption_key, cfg.license.signing_key);
    }

    inline Organization make_org(const std::string &id, const std::string &domain)
    {
        Organization org;
        org.id = id;
        org.name = "Org " + id;
        org.domain = domain;
        org.created_at = now_ms();
        return org;
    }

    inline User make_user(const std::string &id, const std::string &company_id, bool super_user = false)
    {
        User u;
        u.id = id;
        u.email = id + "@example.test";
        u.full_name = "User " + id;
        u.password_hash = "unused";
        u.company_id = company_id;
        u.is_super_user = super_user;
        return u;
    }

} // namespace warden::testing
