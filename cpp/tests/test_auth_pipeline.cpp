#include <catch2/catch_test_macros.hpp>
#include "support/fixtures.hpp"
#include "warden/auth_pipeline.hpp"
#include <algorithm>
#include <future>
#include <vector>

using namespace warden;
using namespace warden::testing;

namespace {
    struct PipelineFixture
    {
        std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
        std::shared_ptr<LicenseManager> licenses = std::make_shared<LicenseManager>(store, test_codec());
        std::shared_ptr<PermissionResolver> resolver = std::make_shared<PermissionResolver>(store);
        std::shared_ptr<const TokenService> tokens = std::make_shared<TokenService>(test_config().jwt);
        AuthPipeline pipeline{store, tokens, licenses, resolver};
        std::string license_id;

        PipelineFixture()
        {
            REQUIRE(resolver->seed_catalog().has_value());
            store->put_organization(make_org("org1", "acme.test"));
            auto key = licenses->generate("org1", "Acme", {}, 30).value();
            license_id = store->find_license_by_key(key).value()->id;

            auto roles = resolver->create_default_roles("org1").value();
            auto viewer = std::find_if(roles.begin(), roles.end(), [](const Role &r) { return r.name == "Viewer"; });

            REQUIRE(store->insert_user(make_user("alice", "org1")).has_value());
            REQUIRE(resolver->assign_role("alice", viewer->id).has_value());

            store->put_organization(make_org("sys", "warden.system"));
            REQUIRE(store->insert_user(make_user("root", "sys", true)).has_value());
        }

        AuthRequest request_for(const std::string &user_id)
        {
            auto user = store->find_user(user_id).value().value();
            return AuthRequest{"Bearer " + tokens->issue(user, {}).value()};
        }
    };
}

TEST_CASE("Missing credential fails before any store lookup", "[pipeline]")
{
    auto store = std::make_shared<InMemoryStore>();
    auto tokens = std::make_shared<const TokenService>(test_config().jwt);
    AuthPipeline pipeline(store,
                          tokens,
                          std::make_shared<LicenseManager>(store, test_codec()),
                          std::make_shared<PermissionResolver>(store));

    for (const auto &req : {AuthRequest{}, AuthRequest{"Basic abc"}, AuthRequest{"Bearer "}})
    {
        auto ctx = pipeline.authenticate(req);
        REQUIRE_FALSE(ctx.has_value());
        REQUIRE(ctx.error().code == ErrorCode::Unauthenticated);
        REQUIRE(std::string(ctx.error().what()) == "Missing or invalid authorization header");
    }

    auto bad_token = pipeline.authenticate(AuthRequest{"Bearer not.a.jwt"});
    REQUIRE(bad_token.error().code == ErrorCode::Unauthenticated);
    REQUIRE(std::string(bad_token.error().what()) == "Invalid or expired token");

    REQUIRE(store->lookups == 0);
}

TEST_CASE("Context is assembled for a licensed user", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    auto ctx = f.pipeline.authenticate(f.request_for("alice"));
    REQUIRE(ctx.has_value());

    const AuthContext &c = **ctx;
    REQUIRE(c.user.id == "alice");
    REQUIRE(c.organization.id == "org1");
    REQUIRE(c.license.has_value());
    REQUIRE(c.license->id == f.license_id);
    REQUIRE_FALSE(c.tenant.has_value());
    REQUIRE(c.permissions.contains("api.use"));
    REQUIRE(c.permissions.contains("user.read"));
    REQUIRE_FALSE(c.permissions.contains("user.delete"));
    REQUIRE(c.roles.size() == 1);

    auto view = c.to_json();
    REQUIRE(view.at("user").at("id") == "alice");
    REQUIRE_FALSE(view.at("user").contains("password_hash"));
}

TEST_CASE("Unknown user is unauthenticated", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    auto ghost = make_user("ghost", "org1");
    AuthRequest req{"Bearer " + f.tokens->issue(ghost, {}).value()};

    auto ctx = f.pipeline.authenticate(req);
    REQUIRE(ctx.error().code == ErrorCode::Unauthenticated);
    REQUIRE(std::string(ctx.error().what()) == "User not found");
}

TEST_CASE("Missing organization is forbidden", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    auto req = f.request_for("alice");
    f.store->erase_organization("org1");

    auto ctx = f.pipeline.authenticate(req);
    REQUIRE(ctx.error().code == ErrorCode::Forbidden);
    REQUIRE(std::string(ctx.error().what()) == "Company not found");
}

TEST_CASE("Blocked organization is forbidden with its reason", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    REQUIRE(f.store->set_organization_blocked("org1", true, "Terms violation").has_value());

    auto ctx = f.pipeline.authenticate(f.request_for("alice"));
    REQUIRE_FALSE(ctx.has_value());
    REQUIRE(ctx.error().code == ErrorCode::Forbidden);
    REQUIRE(std::string(ctx.error().what()) == "Company is blocked");
    REQUIRE(ctx.error().reason == "Terms violation");

    REQUIRE(f.store->set_organization_blocked("sys", true, std::nullopt).has_value());
    REQUIRE(f.pipeline.authenticate(f.request_for("root")).has_value());

    REQUIRE(f.store->set_organization_blocked("org1", false, std::nullopt).has_value());
    REQUIRE(f.pipeline.authenticate(f.request_for("alice")).has_value());
}

TEST_CASE("Invalid license is forbidden with its reason", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    REQUIRE(f.licenses->revoke(f.license_id).has_value());

    auto ctx = f.pipeline.authenticate(f.request_for("alice"));
    REQUIRE_FALSE(ctx.has_value());
    REQUIRE(ctx.error().code == ErrorCode::Forbidden);
    REQUIRE(std::string(ctx.error().what()) == "Invalid or expired license");
    REQUIRE(ctx.error().reason == "License has been revoked");
}

TEST_CASE("Super user skips license validation", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    // The system organization has no license row at all
    auto ctx = f.pipeline.authenticate(f.request_for("root"));
    REQUIRE(ctx.has_value());
    REQUIRE_FALSE((*ctx)->license.has_value());
    REQUIRE((*ctx)->has_permission("anything.at-all"));
}

TEST_CASE("Tenant lookup is best-effort", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    auto carol = make_user("carol", "org1");
    carol.tenant_id = "t-missing";
    REQUIRE(f.store->insert_user(carol).has_value());

    auto ctx = f.pipeline.authenticate(f.request_for("carol"));
    REQUIRE(ctx.has_value());
    REQUIRE_FALSE((*ctx)->tenant.has_value());

    Tenant t{"t1", "org1", "Branch", nlohmann::json::object(), true};
    REQUIRE(f.store->insert_tenant(t).has_value());
    auto dave = make_user("dave", "org1");
    dave.tenant_id = "t1";
    REQUIRE(f.store->insert_user(dave).has_value());

    auto ctx2 = f.pipeline.authenticate(f.request_for("dave"));
    REQUIRE(ctx2.has_value());
    REQUIRE((*ctx2)->tenant.has_value());
    REQUIRE((*ctx2)->tenant->name == "Branch");
}

TEST_CASE("Stop request cancels authentication", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    auto req = f.request_for("alice");
    std::stop_source source;
    source.request_stop();

    auto ctx = f.pipeline.authenticate(req, source.get_token());
    REQUIRE_FALSE(ctx.has_value());
    REQUIRE(ctx.error().code == ErrorCode::Cancelled);
}

TEST_CASE("Concurrent requests each get their own context", "[pipeline]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    PipelineFixture f;
    auto alice = f.request_for("alice");
    auto root = f.request_for("root");

    std::vector<std::future<Result<AuthContextPtr>>> results;
    for (int i = 0; i < 16; ++i)
    {
        const auto &req = (i % 2 == 0) ? alice : root;
        results.push_back(std::async(std::launch::async, [&f, &req] { return f.pipeline.authenticate(req); }));
    }
    for (int i = 0; i < 16; ++i)
    {
        auto ctx = results[i].get();
        REQUIRE(ctx.has_value());
        REQUIRE((*ctx)->user.id == (i % 2 == 0 ? "alice" : "root"));
    }
}

TEST_CASE("Guards read only the context", "[pipeline][guards]")
{
    AuthContext member;
    member.user = make_user("m", "org1");
    member.permissions = {"api.use"};

    AuthContext admin = member;
    admin.user.is_org_admin = true;

    AuthContext super = member;
    super.user.is_super_user = true;
    super.permissions.clear();

    SECTION("permission guard")
    {
        PermissionGuard guard("role.assign");
        auto denied = guard.check(member);
        REQUIRE_FALSE(denied.has_value());
        REQUIRE(denied.error().code == ErrorCode::Forbidden);
        REQUIRE(denied.error().required == "role.assign");
        REQUIRE(std::string(denied.error().what()).find("role.assign") != std::string::npos);

        REQUIRE(PermissionGuard("api.use").check(member).has_value());
        REQUIRE(guard.check(super).has_value());
    }

    SECTION("organization admin guard")
    {
        OrgAdminGuard guard;
        auto denied = guard.check(member);
        REQUIRE(denied.error().code == ErrorCode::Forbidden);
        REQUIRE(std::string(denied.error().what()) == "Organization admin access required");
        REQUIRE(guard.check(admin).has_value());
        REQUIRE(guard.check(super).has_value());
    }

    SECTION("super identity guard")
    {
        SuperIdentityGuard guard;
        REQUIRE(std::string(guard.check(admin).error().what()) == "Super user access required");
        REQUIRE(guard.check(super).has_value());
    }
}
