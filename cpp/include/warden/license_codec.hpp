#pragma once

#include "crypto.hpp"
#include "model.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * Plaintext sealed inside a license key. Never persisted directly.
     * The nonce only makes otherwise-identical payloads encode differently.
     */
    struct LicensePayload
    {
        std::string company_id;
        std::string company_name;
        LicenseFeatures features;
        Timestamp issued_at{};
        std::optional<Timestamp> expires_at;
        std::string nonce;

        nlohmann::json to_json() const;
        static Result<LicensePayload> from_json(const nlohmann::json &j);

        bool operator==(const LicensePayload &) const = default;
    };

    /**
     * Turns a LicensePayload into an opaque, tamper-evident key and back.
     *
     * Key layout: <ivHex>.<ciphertextHex>.<tagHex>.<signatureHex>
     * The signature is HMAC-SHA-256 over the first three segments, so a
     * forged or corrupted key is rejected before decryption is attempted.
     * Encryption and signing keys are derived independently (SHA-256) from
     * two master secrets.
     */
    class LicenseCodec
    {
    public:
        static constexpr char kSeparator = '.';

        LicenseCodec(std::string_view encryption_secret, std::string_view signing_secret);

        /** Encrypt, then sign. Fails only on crypto backend errors. */
        Result<std::string> encode(const LicensePayload &payload) const;

        /**
         * Verify, then decrypt.
         * Errors: InvalidFormat, SignatureMismatch, DecryptionFailed.
         */
        Result<LicensePayload> decode(std::string_view license_key) const;

        /** Hex HMAC of arbitrary text under the signing key. */
        std::string sign(std::string_view text) const;

    private:
        crypto::AESKey encryption_key_;
        crypto::HmacKey signing_key_;
    };

} // namespace warden
