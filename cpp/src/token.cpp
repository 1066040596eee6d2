#include "warden/token.hpp"

#include <jwt-cpp/traits/nlohmann-json/defaults.h>
#include <spdlog/spdlog.h>

namespace warden
{

    namespace
    {
        Timestamp to_timestamp(const jwt::date &d)
        {
            return std::chrono::time_point_cast<std::chrono::milliseconds>(d);
        }
    } // namespace

    TokenService::TokenService(TokenConfig cfg)
        : cfg_(std::move(cfg))
    {
        if (cfg_.secret.empty())
        {
            throw WardenError::config("JWT secret must not be empty");
        }
    }

    Result<std::string> TokenService::issue(const User &user, const std::set<std::string> &permissions) const
    {
        if (user.id.empty())
        {
            return std::unexpected(WardenError::invalid_input("Cannot issue a token without a user id"));
        }

        auto now = std::chrono::system_clock::now();
        try
        {
            auto builder = jwt::create()
                               .set_type("JWT")
                               .set_issuer(cfg_.issuer)
                               .set_subject(user.id)
                               .set_issued_at(now)
                               .set_expires_at(now + cfg_.expires_in)
                               .set_payload_claim("companyId", jwt::claim(user.company_id))
                               .set_payload_claim("isSuperUser", jwt::claim(nlohmann::json(user.is_super_user)))
                               .set_payload_claim("isOrgAdmin", jwt::claim(nlohmann::json(user.is_org_admin)))
                               .set_payload_claim("permissions", jwt::claim(nlohmann::json(permissions)));
            if (user.tenant_id)
            {
                builder.set_payload_claim("tenantId", jwt::claim(*user.tenant_id));
            }
            return builder.sign(jwt::algorithm::hs256{cfg_.secret});
        }
        catch (const std::exception &e)
        {
            return std::unexpected(WardenError::crypto(std::string("Token signing failed: ") + e.what()));
        }
    }

    Result<TokenClaims> TokenService::verify(std::string_view token) const
    {
        try
        {
            auto decoded = jwt::decode(std::string(token));
            if (!decoded.has_expires_at() || !decoded.has_subject())
            {
                return std::unexpected(WardenError::unauthenticated("Invalid or expired token"));
            }

            auto verifier = jwt::verify()
                                .allow_algorithm(jwt::algorithm::hs256{cfg_.secret})
                                .with_issuer(cfg_.issuer);
            verifier.verify(decoded);

            TokenClaims claims;
            claims.user_id = decoded.get_subject();
            claims.expires_at = to_timestamp(decoded.get_expires_at());
            if (decoded.has_issued_at())
                claims.issued_at = to_timestamp(decoded.get_issued_at());

            const nlohmann::json payload = decoded.get_payload_json();
            if (auto it = payload.find("companyId"); it != payload.end() && it->is_string())
                claims.company_id = it->get<std::string>();
            if (auto it = payload.find("tenantId"); it != payload.end() && it->is_string())
                claims.tenant_id = it->get<std::string>();
            claims.is_super_user = payload.value("isSuperUser", false);
            claims.is_org_admin = payload.value("isOrgAdmin", false);
            if (auto it = payload.find("permissions"); it != payload.end() && it->is_array())
            {
                for (const auto &p : *it)
                {
                    if (p.is_string())
                        claims.permissions.insert(p.get<std::string>());
                }
            }
            return claims;
        }
        catch (const std::exception &e)
        {
            spdlog::debug("Token verification failed: {}", e.what());
            return std::unexpected(WardenError::unauthenticated("Invalid or expired token"));
        }
    }

    std::optional<std::string_view> extract_bearer(std::string_view header)
    {
        constexpr std::string_view prefix = "Bearer ";
        if (!header.starts_with(prefix))
            return std::nullopt;

        auto token = header.substr(prefix.size());
        while (!token.empty() && token.front() == ' ')
            token.remove_prefix(1);
        while (!token.empty() && (token.back() == ' ' || token.back() == '\r'))
            token.remove_suffix(1);
        if (token.empty())
            return std::nullopt;
        return token;
    }

} // namespace warden
