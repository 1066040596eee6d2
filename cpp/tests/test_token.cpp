#include <catch2/catch_test_macros.hpp>
#include "support/fixtures.hpp"
#include "warden/token.hpp"

using namespace warden;
using namespace warden::testing;

TEST_CASE("Issued tokens verify with their claims", "[token]")
{
    TokenService tokens(test_config().jwt);
    auto user = make_user("u1", "org1");
    user.is_org_admin = true;
    user.tenant_id = "t1";

    auto token = tokens.issue(user, {"api.use", "user.read"});
    REQUIRE(token.has_value());

    auto claims = tokens.verify(*token);
    REQUIRE(claims.has_value());
    REQUIRE(claims->user_id == "u1");
    REQUIRE(claims->company_id == "org1");
    REQUIRE(claims->tenant_id == "t1");
    REQUIRE(claims->is_org_admin);
    REQUIRE_FALSE(claims->is_super_user);
    REQUIRE(claims->permissions == std::set<std::string>{"api.use", "user.read"});
    REQUIRE(claims->expires_at > claims->issued_at);
}

TEST_CASE("Optional claims fall back to defaults", "[token]")
{
    TokenService tokens(test_config().jwt);
    auto root = make_user("root", "sys", true);

    auto claims = tokens.verify(tokens.issue(root, {}).value());
    REQUIRE(claims.has_value());
    REQUIRE(claims->user_id == "root");
    REQUIRE(claims->company_id == "sys");
    REQUIRE(claims->is_super_user);
    REQUIRE_FALSE(claims->is_org_admin);
    REQUIRE_FALSE(claims->tenant_id.has_value());
    REQUIRE(claims->permissions.empty());
}

TEST_CASE("Tokens signed elsewhere are rejected", "[token]")
{
    auto cfg = test_config().jwt;
    TokenService ours(cfg);
    cfg.secret = "someone-else";
    TokenService theirs(cfg);

    auto token = theirs.issue(make_user("u1", "org1"), {}).value();
    auto r = ours.verify(token);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == ErrorCode::Unauthenticated);
}

TEST_CASE("Expired tokens are rejected", "[token]")
{
    auto cfg = test_config().jwt;
    cfg.expires_in = std::chrono::seconds{-120};
    TokenService tokens(cfg);

    auto token = tokens.issue(make_user("u1", "org1"), {}).value();
    auto r = tokens.verify(token);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == ErrorCode::Unauthenticated);
}

TEST_CASE("Garbage tokens are rejected", "[token]")
{
    TokenService tokens(test_config().jwt);
    for (std::string bad : {"", "abc", "a.b.c", "eyJhbGciOiJub25lIn0.e30."})
    {
        INFO(bad);
        REQUIRE(tokens.verify(bad).error().code == ErrorCode::Unauthenticated);
    }
}

TEST_CASE("Bearer extraction", "[token]")
{
    REQUIRE(extract_bearer("Bearer abc.def") == std::optional<std::string_view>("abc.def"));
    REQUIRE(extract_bearer("Bearer   abc ") == std::optional<std::string_view>("abc"));
    REQUIRE_FALSE(extract_bearer("Bearer ").has_value());
    REQUIRE_FALSE(extract_bearer("Basic dXNlcjpwYXNz").has_value());
    REQUIRE_FALSE(extract_bearer("bearer abc").has_value());
    REQUIRE_FALSE(extract_bearer("").has_value());
}

TEST_CASE("Empty JWT secret is a configuration error", "[token]")
{
    TokenConfig cfg;
    cfg.secret.clear();
    REQUIRE_THROWS_AS(TokenService(cfg), WardenError);
}
