#include <catch2/catch_test_macros.hpp>
#include "support/fixtures.hpp"
#include "warden/license_manager.hpp"
#include <string>

using namespace warden;
using namespace warden::testing;
using namespace std::chrono_literals;

namespace {
    struct ManagerFixture
    {
        std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
        ManualClock clock;
        LicenseManager manager{store, test_codec(), clock.fn()};

        ManagerFixture()
        {
            store->put_organization(make_org("org1", "acme.test"));
        }

        LicenseFeatures features()
        {
            LicenseFeatures f;
            f.max_users = 50;
            return f;
        }

        std::string license_id_for(const std::string &key)
        {
            return store->find_license_by_key(key).value().value().id;
        }
    };
}

TEST_CASE("Generated license validates with its payload", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto key = f.manager.generate("org1", "Acme", f.features(), 365);
    REQUIRE(key.has_value());

    auto v = f.manager.validate(*key);
    REQUIRE(v.valid);
    REQUIRE(v.payload.has_value());
    REQUIRE(v.payload->company_id == "org1");
    REQUIRE(v.payload->features.max_users == 50);
    REQUIRE(v.payload->expires_at.has_value());

    auto expected = f.clock.now() + std::chrono::days{365};
    auto drift = *v.payload->expires_at - expected;
    REQUIRE(std::chrono::abs(drift) < 1min);

    SECTION("generated license becomes the organization's current one")
    {
        auto org = f.store->find_organization("org1").value().value();
        REQUIRE(org.license_key == *key);
        REQUIRE(org.license_status == LicenseStatus::Active);

        auto current = f.manager.current_for_organization("org1");
        REQUIRE(current.has_value());
        REQUIRE(current->has_value());
        REQUIRE((*current)->license_key == *key);
    }
}

TEST_CASE("Issue rejects bad input", "[license]")
{
    ManagerFixture f;
    REQUIRE(f.manager.issue("", "Acme", {}, 30).error().code == ErrorCode::InvalidInput);
    REQUIRE(f.manager.issue("org1", "Acme", {}, -1).error().code == ErrorCode::InvalidInput);
}

TEST_CASE("Zero or absent lifetime issues a perpetual license", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto a = f.manager.issue("org1", "Acme", {}, 0);
    auto b = f.manager.issue("org1", "Acme", {});
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE_FALSE(a->expires_at.has_value());
    REQUIRE_FALSE(b->expires_at.has_value());
}

TEST_CASE("Generate fails for an unknown organization", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto key = f.manager.generate("missing", "Nobody", {}, 30);
    REQUIRE_FALSE(key.has_value());
    REQUIRE(key.error().code == ErrorCode::NotFound);
}

TEST_CASE("Revoked license no longer validates", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto key = f.manager.generate("org1", "Acme", f.features(), 365).value();
    auto id = f.license_id_for(key);

    auto revoked = f.manager.revoke(id);
    REQUIRE(revoked.has_value());
    REQUIRE(revoked->status == LicenseStatus::Revoked);
    REQUIRE(revoked->revoked_at.has_value());

    auto v = f.manager.validate(key);
    REQUIRE_FALSE(v.valid);
    REQUIRE(v.code == ErrorCode::Revoked);
    REQUIRE(v.reason->find("revoked") != std::string::npos);
    REQUIRE(v.license.has_value());

    REQUIRE(f.store->find_organization("org1").value()->license_status == LicenseStatus::Revoked);
}

TEST_CASE("A newer license supersedes the current one", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto first = f.manager.generate("org1", "Acme", f.features(), 365).value();
    f.clock.advance(1s);

    SECTION("active predecessor is revoked")
    {
        auto second = f.manager.generate("org1", "Acme", f.features(), 365).value();

        auto old = f.manager.validate(first);
        REQUIRE_FALSE(old.valid);
        REQUIRE(old.code == ErrorCode::Revoked);
        REQUIRE(old.license->revoked_at.has_value());

        REQUIRE(f.manager.validate(second).valid);

        auto org = f.store->find_organization("org1").value().value();
        REQUIRE(org.license_key == second);
        REQUIRE(org.license_status == LicenseStatus::Active);
        REQUIRE(f.manager.current_for_organization("org1").value()->license_key == second);
    }

    SECTION("suspended predecessor is revoked too")
    {
        REQUIRE(f.manager.suspend(f.license_id_for(first)).has_value());
        f.manager.generate("org1", "Acme", f.features(), 365).value();

        REQUIRE(f.store->find_license_by_key(first).value()->status == LicenseStatus::Revoked);
        REQUIRE(f.manager.reactivate(f.license_id_for(first)).error().code == ErrorCode::Conflict);
    }
}

TEST_CASE("Suspend and reactivate", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto key = f.manager.generate("org1", "Acme", {}, 30).value();
    auto id = f.license_id_for(key);

    REQUIRE(f.manager.suspend(id).has_value());
    auto v = f.manager.validate(key);
    REQUIRE_FALSE(v.valid);
    REQUIRE(v.code == ErrorCode::Suspended);
    REQUIRE(*v.reason == "License is suspended");

    SECTION("suspending twice is a no-op")
    {
        auto again = f.manager.suspend(id);
        REQUIRE(again.has_value());
        REQUIRE(again->status == LicenseStatus::Suspended);
    }

    SECTION("reactivation restores access")
    {
        auto active = f.manager.reactivate(id);
        REQUIRE(active.has_value());
        REQUIRE(active->status == LicenseStatus::Active);
        REQUIRE(f.manager.validate(key).valid);
    }

    SECTION("a suspended license can still be revoked")
    {
        REQUIRE(f.manager.revoke(id).has_value());
    }
}

TEST_CASE("Revoked and expired are terminal", "[license][state]")
{
    REQUIRE(can_transition(LicenseStatus::Active, LicenseStatus::Suspended));
    REQUIRE(can_transition(LicenseStatus::Active, LicenseStatus::Revoked));
    REQUIRE(can_transition(LicenseStatus::Active, LicenseStatus::Expired));
    REQUIRE(can_transition(LicenseStatus::Suspended, LicenseStatus::Active));
    REQUIRE(can_transition(LicenseStatus::Suspended, LicenseStatus::Revoked));
    REQUIRE_FALSE(can_transition(LicenseStatus::Suspended, LicenseStatus::Expired));
    for (auto to : {LicenseStatus::Active, LicenseStatus::Suspended, LicenseStatus::Expired})
        REQUIRE_FALSE(can_transition(LicenseStatus::Revoked, to));
    for (auto to : {LicenseStatus::Active, LicenseStatus::Suspended, LicenseStatus::Revoked})
        REQUIRE_FALSE(can_transition(LicenseStatus::Expired, to));

    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto key = f.manager.generate("org1", "Acme", {}, 30).value();
    auto id = f.license_id_for(key);
    REQUIRE(f.manager.revoke(id).has_value());

    auto s = f.manager.suspend(id);
    REQUIRE_FALSE(s.has_value());
    REQUIRE(s.error().code == ErrorCode::Conflict);

    auto r = f.manager.reactivate(id);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == ErrorCode::Conflict);

    REQUIRE(f.manager.revoke(id).has_value());
}

TEST_CASE("Expired license is marked exactly once", "[license][expiry]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;
    auto key = f.manager.generate("org1", "Acme", {}, 1).value();
    REQUIRE(f.manager.validate(key).valid);

    f.clock.advance(std::chrono::days{2});
    int before = f.store->applied_transitions;

    auto first = f.manager.validate(key);
    REQUIRE_FALSE(first.valid);
    REQUIRE(first.code == ErrorCode::Expired);
    REQUIRE(*first.reason == "License has expired");

    auto second = f.manager.validate(key);
    REQUIRE_FALSE(second.valid);
    REQUIRE(second.code == ErrorCode::Expired);

    REQUIRE(f.store->applied_transitions - before == 1);

    auto stored = f.manager.find(f.license_id_for(key));
    REQUIRE(stored->status == LicenseStatus::Expired);

    // Expired is terminal, so it cannot be reactivated
    REQUIRE(f.manager.reactivate(stored->id).error().code == ErrorCode::Conflict);
}

TEST_CASE("Validation failures carry their reason", "[license]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    ManagerFixture f;

    SECTION("garbage key")
    {
        auto v = f.manager.validate("not-a-license");
        REQUIRE_FALSE(v.valid);
        REQUIRE(v.code == ErrorCode::InvalidFormat);
        REQUIRE(*v.reason == "Invalid license format");
    }

    SECTION("well-formed key never stored")
    {
        auto unsaved = f.manager.issue("org1", "Acme", {}, 30).value();
        auto v = f.manager.validate(unsaved.license_key);
        REQUIRE_FALSE(v.valid);
        REQUIRE(v.code == ErrorCode::NotFound);
        REQUIRE(*v.reason == "License not found in database");
    }

    SECTION("tampered key")
    {
        auto key = f.manager.generate("org1", "Acme", {}, 30).value();
        key[5] = key[5] == 'a' ? 'b' : 'a';
        auto v = f.manager.validate(key);
        REQUIRE_FALSE(v.valid);
        REQUIRE((v.code == ErrorCode::SignatureMismatch || v.code == ErrorCode::DecryptionFailed));
    }

    SECTION("key with a separator overwritten")
    {
        auto key = f.manager.generate("org1", "Acme", {}, 30).value();
        key[key.rfind('.')] = '0';
        auto v = f.manager.validate(key);
        REQUIRE_FALSE(v.valid);
        REQUIRE(v.code == ErrorCode::InvalidFormat);
        REQUIRE_FALSE(v.license.has_value());
    }
}

TEST_CASE("Transitions of unknown licenses are NotFound", "[license]")
{
    ManagerFixture f;
    REQUIRE(f.manager.revoke("nope").error().code == ErrorCode::NotFound);
    REQUIRE(f.manager.find("nope").error().code == ErrorCode::NotFound);
}
