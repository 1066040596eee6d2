#include <catch2/catch_test_macros.hpp>
#include "support/fixtures.hpp"
#include "warden/license_codec.hpp"
#include <algorithm>

using namespace warden;
using namespace warden::testing;

namespace {
    LicensePayload sample_payload()
    {
        LicensePayload p;
        p.company_id = "org-1";
        p.company_name = "Acme";
        p.features.max_users = 50;
        p.features.enabled_modules = {"basic", "rbac"};
        p.features.custom_features = {{"sso", true}};
        p.issued_at = from_epoch_ms(1'700'000'000'123);
        p.expires_at = from_epoch_ms(1'731'536'000'123);
        p.nonce = "0b6d7a38-6a0c-4c38-9a9e-2f4f1f3f9b11";
        return p;
    }

    char other_hex(char c)
    {
        return c == '0' ? '1' : '0';
    }
}

TEST_CASE("License key round-trips its payload", "[codec]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    auto codec = test_codec();
    auto payload = sample_payload();

    auto key = codec->encode(payload);
    REQUIRE(key.has_value());
    REQUIRE(std::count(key->begin(), key->end(), '.') == 3);

    auto decoded = codec->decode(*key);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == payload);

    SECTION("perpetual payload keeps expiresAt absent")
    {
        payload.expires_at.reset();
        auto k = codec->encode(payload).value();
        auto d = codec->decode(k);
        REQUIRE(d.has_value());
        REQUIRE_FALSE(d->expires_at.has_value());
    }

    SECTION("identical payloads encode differently")
    {
        auto k2 = codec->encode(payload).value();
        REQUIRE(k2 != *key);
    }
}

TEST_CASE("Payload JSON uses the wire field names", "[codec]")
{
    auto j = sample_payload().to_json();
    REQUIRE(j.at("companyId") == "org-1");
    REQUIRE(j.at("companyName") == "Acme");
    REQUIRE(j.at("issuedAt") == 1'700'000'000'123);
    REQUIRE(j.at("expiresAt") == 1'731'536'000'123);
    REQUIRE(j.contains("nonce"));
    REQUIRE(j.at("features").at("max_users") == 50);
}

TEST_CASE("Malformed keys are rejected as invalid format", "[codec]")
{
    auto codec = test_codec();

    for (std::string bad : {"", "abc", "a.b", "a.b.c", "a.b.c.d.e", "a..c.d", ".b.c.d", "a.b.c."})
    {
        INFO("key: " << bad);
        auto r = codec->decode(bad);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::InvalidFormat);
        REQUIRE(std::string(r.error().what()) == "Invalid license format");
    }
}

TEST_CASE("Any single-character change is detected", "[codec][tamper]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    auto codec = test_codec();
    auto key = codec->encode(sample_payload()).value();

    int separators = 0;
    for (std::size_t i = 0; i < key.size(); ++i)
    {
        auto tampered = key;
        tampered[i] = other_hex(tampered[i]);

        auto r = codec->decode(tampered);
        INFO("position " << i);
        REQUIRE_FALSE(r.has_value());
        if (key[i] == '.')
        {
            // Losing a separator changes the segment count.
            ++separators;
            REQUIRE(r.error().code == ErrorCode::InvalidFormat);
        }
        else
        {
            REQUIRE((r.error().code == ErrorCode::SignatureMismatch || r.error().code == ErrorCode::DecryptionFailed));
        }
    }
    REQUIRE(separators == 3);
}

TEST_CASE("Keys from another deployment fail signature verification", "[codec]")
{
    if (!crypto::AES256GCM::is_available())
        SKIP("AES-256-GCM not supported on this CPU");

    LicenseCodec ours("enc-a", "sign-a");
    LicenseCodec theirs("enc-b", "sign-b");
    LicenseCodec same_signer("enc-b", "sign-a");

    auto key = theirs.encode(sample_payload()).value();
    auto r = ours.decode(key);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == ErrorCode::SignatureMismatch);

    // Signature matches but the encryption key differs
    auto key2 = same_signer.encode(sample_payload()).value();
    auto r2 = ours.decode(key2);
    REQUIRE_FALSE(r2.has_value());
    REQUIRE(r2.error().code == ErrorCode::DecryptionFailed);
}

TEST_CASE("Correctly signed segments with bad lengths fail decryption", "[codec]")
{
    auto codec = test_codec();
    std::string blob = "abcd.00ff.1234";
    auto key = blob + "." + codec->sign(blob);

    auto r = codec->decode(key);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == ErrorCode::DecryptionFailed);
}
