#pragma once

#include "model.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace warden
{

    struct TokenConfig
    {
        std::string secret{"default-secret-change-in-production"};
        std::chrono::seconds expires_in{std::chrono::hours{24}};
        std::string issuer{"warden"};
    };

    /** Claims carried by a bearer token. */
    struct TokenClaims
    {
        std::string user_id;
        std::string company_id;
        std::optional<std::string> tenant_id;
        bool is_super_user{false};
        bool is_org_admin{false};
        std::set<std::string> permissions; // snapshot at issue time
        Timestamp issued_at{};
        Timestamp expires_at{};
    };

    /**
     * HS256 bearer tokens (jwt-cpp).
     * The permission snapshot is informational; authorization always
     * re-resolves permissions from the store.
     */
    class TokenService
    {
    public:
        explicit TokenService(TokenConfig cfg);

        Result<std::string> issue(const User &user, const std::set<std::string> &permissions) const;

        /** Unauthenticated on any decode, signature, issuer or expiry failure. */
        Result<TokenClaims> verify(std::string_view token) const;

        const TokenConfig &config() const { return cfg_; }

    private:
        TokenConfig cfg_;
    };

    /**
     * Extract the credential from an Authorization header value.
     * Accepts "Bearer <token>" only; returns nullopt otherwise.
     */
    std::optional<std::string_view> extract_bearer(std::string_view header);

} // namespace warden
