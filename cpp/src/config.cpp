#include "warden/config.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace warden
{
    namespace
    {
        template <typename Int>
        Result<Int> parse_int(std::string_view name, std::string_view text)
        {
            Int value{};
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size())
            {
                return std::unexpected(WardenError::config(std::string(name) + " must be an integer, got '" + std::string(text) + "'"));
            }
            return value;
        }

        bool parse_flag(std::string_view text)
        {
            return !(text == "0" || text == "false" || text == "no" || text == "off");
        }

        Result<WardenConfig> parse_toml(const toml::table &tbl, WardenConfig cfg)
        {
            if (auto server = tbl["server"].as_table())
            {
                if (auto addr = (*server)["address"].value<std::string>())
                    cfg.server.address = *addr;
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    if (*port <= 0 || *port > 65535)
                        return std::unexpected(WardenError::config("server.port out of range"));
                    cfg.server.port = static_cast<std::uint16_t>(*port);
                }
                if (auto threads = (*server)["threads"].value<int64_t>())
                {
                    if (*threads <= 0)
                        return std::unexpected(WardenError::config("server.threads must be positive"));
                    cfg.server.threads = static_cast<std::size_t>(*threads);
                }
            }

            if (auto license = tbl["license"].as_table())
            {
                if (auto key = (*license)["encryption_key"].value<std::string>())
                    cfg.license.encryption_key = *key;
                if (auto key = (*license)["signing_key"].value<std::string>())
                    cfg.license.signing_key = *key;
            }

            if (auto jwt = tbl["jwt"].as_table())
            {
                if (auto secret = (*jwt)["secret"].value<std::string>())
                    cfg.jwt.secret = *secret;
                if (auto ttl = (*jwt)["expires_in_seconds"].value<int64_t>())
                {
                    if (*ttl <= 0)
                        return std::unexpected(WardenError::config("jwt.expires_in_seconds must be positive"));
                    cfg.jwt.expires_in = std::chrono::seconds{*ttl};
                }
            }

            if (auto su = tbl["super_user"].as_table())
            {
                if (auto email = (*su)["email"].value<std::string>())
                    cfg.super_user.email = *email;
                if (auto password = (*su)["password"].value<std::string>())
                    cfg.super_user.password = *password;
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            if (auto audit = tbl["audit"].as_table())
            {
                if (auto enabled = (*audit)["enabled"].value<bool>())
                    cfg.audit.enabled = *enabled;
                if (auto path = (*audit)["log_path"].value<std::string>())
                    cfg.audit.log_path = *path;
            }

            return cfg;
        }

    } // namespace

    Result<WardenConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<WardenConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        WardenConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(WardenError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::from_env()
    {
        WardenConfig cfg{};
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(WardenConfig &cfg)
    {
        if (const char *port = std::getenv("WARDEN_PORT"))
        {
            auto parsed = parse_int<std::uint16_t>("WARDEN_PORT", port);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.server.port = *parsed;
        }
        if (const char *threads = std::getenv("WARDEN_THREADS"))
        {
            auto parsed = parse_int<std::size_t>("WARDEN_THREADS", threads);
            if (!parsed || *parsed == 0)
                return std::unexpected(WardenError::config("WARDEN_THREADS must be a positive integer"));
            cfg.server.threads = *parsed;
        }
        if (const char *key = std::getenv("LICENSE_ENCRYPTION_KEY"))
            cfg.license.encryption_key = key;
        if (const char *key = std::getenv("LICENSE_SIGNING_KEY"))
            cfg.license.signing_key = key;
        if (const char *secret = std::getenv("JWT_SECRET"))
            cfg.jwt.secret = secret;
        if (const char *ttl = std::getenv("JWT_EXPIRES_IN_SECONDS"))
        {
            auto parsed = parse_int<int64_t>("JWT_EXPIRES_IN_SECONDS", ttl);
            if (!parsed || *parsed <= 0)
                return std::unexpected(WardenError::config("JWT_EXPIRES_IN_SECONDS must be a positive integer"));
            cfg.jwt.expires_in = std::chrono::seconds{*parsed};
        }
        if (const char *email = std::getenv("SUPER_USER_EMAIL"))
            cfg.super_user.email = email;
        if (const char *password = std::getenv("SUPER_USER_PASSWORD"))
            cfg.super_user.password = password;
        if (const char *path = std::getenv("WARDEN_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *level = std::getenv("LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit_en = std::getenv("WARDEN_AUDIT_ENABLED"))
            cfg.audit.enabled = parse_flag(audit_en);
        if (const char *audit_path = std::getenv("WARDEN_AUDIT_LOG"))
            cfg.audit.log_path = audit_path;
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const WardenConfig &cfg)
    {
        nlohmann::json j;
        j["server"] = {
            {"address", cfg.server.address},
            {"port", cfg.server.port},
            {"threads", cfg.server.threads}};
        j["license"] = {
            {"has_encryption_key", !cfg.license.encryption_key.empty()},
            {"has_signing_key", !cfg.license.signing_key.empty()}};
        j["jwt"] = {
            {"has_secret", !cfg.jwt.secret.empty()},
            {"expires_in_seconds", cfg.jwt.expires_in.count()},
            {"issuer", cfg.jwt.issuer}};
        j["super_user"] = {
            {"email", cfg.super_user.email},
            {"has_password", !cfg.super_user.password.empty()}};
        j["storage"] = {{"rocksdb_path", cfg.storage.rocksdb_path}};
        j["logging"] = {{"level", cfg.logging.level}};
        j["audit"] = {{"enabled", cfg.audit.enabled}, {"log_path", cfg.audit.log_path}};
        return j;
    }

} // namespace warden
