#include <catch2/catch_test_macros.hpp>
#include "warden/config.hpp"
#include <cstdlib>

using namespace warden;

namespace {
    /** Sets an environment variable for the lifetime of the guard. */
    class EnvGuard
    {
    public:
        EnvGuard(const char *name, const char *value) : name_(name)
        {
            ::setenv(name, value, 1);
        }
        ~EnvGuard()
        {
            ::unsetenv(name_);
        }

    private:
        const char *name_;
    };
}

TEST_CASE("Config defaults", "[config]")
{
    auto cfg = ConfigLoader::from_string("");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->server.port == 3000);
    REQUIRE(cfg->jwt.expires_in == std::chrono::hours{24});
    REQUIRE(cfg->jwt.issuer == "warden");
    REQUIRE(cfg->storage.rocksdb_path == "./data/rocksdb");
    REQUIRE(cfg->logging.level == "info");
    REQUIRE(cfg->audit.enabled);
}

TEST_CASE("Config parses every section", "[config]")
{
    auto cfg = ConfigLoader::from_string(R"(
[server]
address = "127.0.0.1"
port = 8443
threads = 2

[license]
encryption_key = "enc"
signing_key = "sig"

[jwt]
secret = "jwt"
expires_in_seconds = 600

[super_user]
email = "root@example.test"
password = "pw"

[storage]
rocksdb_path = "/tmp/warden-db"

[logging]
level = "debug"

[audit]
enabled = false
log_path = "/tmp/audit.log"
)");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->server.address == "127.0.0.1");
    REQUIRE(cfg->server.port == 8443);
    REQUIRE(cfg->server.threads == 2);
    REQUIRE(cfg->license.encryption_key == "enc");
    REQUIRE(cfg->license.signing_key == "sig");
    REQUIRE(cfg->jwt.secret == "jwt");
    REQUIRE(cfg->jwt.expires_in == std::chrono::seconds{600});
    REQUIRE(cfg->super_user.email == "root@example.test");
    REQUIRE(cfg->storage.rocksdb_path == "/tmp/warden-db");
    REQUIRE(cfg->logging.level == "debug");
    REQUIRE_FALSE(cfg->audit.enabled);
    REQUIRE(cfg->audit.log_path == "/tmp/audit.log");
}

TEST_CASE("Environment overrides file values", "[config]")
{
    EnvGuard port("WARDEN_PORT", "9000");
    EnvGuard secret("JWT_SECRET", "from-env");
    EnvGuard audit("WARDEN_AUDIT_ENABLED", "0");

    auto cfg = ConfigLoader::from_string("[server]\nport = 8443\n[jwt]\nsecret = \"from-file\"\n");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->server.port == 9000);
    REQUIRE(cfg->jwt.secret == "from-env");
    REQUIRE_FALSE(cfg->audit.enabled);
}

TEST_CASE("Invalid config is reported", "[config]")
{
    REQUIRE(ConfigLoader::from_string("[server\nport=1").error().code == ErrorCode::ConfigError);
    REQUIRE(ConfigLoader::from_string("[server]\nport = 70000\n").error().code == ErrorCode::ConfigError);
    REQUIRE(ConfigLoader::from_string("[jwt]\nexpires_in_seconds = 0\n").error().code == ErrorCode::ConfigError);
    REQUIRE(ConfigLoader::load("/nonexistent/warden.toml").error().code == ErrorCode::ConfigError);

    EnvGuard port("WARDEN_PORT", "eighty");
    REQUIRE(ConfigLoader::from_string("").error().code == ErrorCode::ConfigError);
}

TEST_CASE("Printed config hides secrets", "[config]")
{
    auto cfg = ConfigLoader::from_string("[license]\nsigning_key = \"top-secret\"\n[super_user]\npassword = \"hunter2\"\n");
    REQUIRE(cfg.has_value());
    auto dumped = ConfigLoader::to_json(*cfg).dump();
    REQUIRE(dumped.find("top-secret") == std::string::npos);
    REQUIRE(dumped.find("hunter2") == std::string::npos);
    REQUIRE(ConfigLoader::to_json(*cfg)["license"]["has_signing_key"] == true);
}
