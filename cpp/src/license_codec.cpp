#include "warden/license_codec.hpp"
#include <format>
#include <vector>

using json = nlohmann::json;

namespace warden
{

    namespace
    {
        std::vector<std::string_view> split(std::string_view s, char sep)
        {
            std::vector<std::string_view> parts;
            size_t start = 0;
            while (true)
            {
                auto pos = s.find(sep, start);
                if (pos == std::string_view::npos)
                {
                    parts.push_back(s.substr(start));
                    break;
                }
                parts.push_back(s.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }

        template <size_t N>
        bool copy_exact(const crypto::Bytes &src, std::array<uint8_t, N> &dst)
        {
            if (src.size() != N)
                return false;
            std::copy(src.begin(), src.end(), dst.begin());
            return true;
        }
    } // namespace

    // ============================================================================
    // LicensePayload
    // ============================================================================

    json LicensePayload::to_json() const
    {
        json j = {{"companyId", company_id},
                  {"companyName", company_name},
                  {"features", features.to_json()},
                  {"issuedAt", to_epoch_ms(issued_at)},
                  {"nonce", nonce}};
        if (expires_at)
            j["expiresAt"] = to_epoch_ms(*expires_at);
        return j;
    }

    Result<LicensePayload> LicensePayload::from_json(const json &j)
    {
        try
        {
            LicensePayload p;
            p.company_id = j.at("companyId").get<std::string>();
            p.company_name = j.at("companyName").get<std::string>();

            auto features = LicenseFeatures::from_json(j.at("features"));
            if (!features)
                return std::unexpected(WardenError::invalid_format(features.error().what()));
            p.features = std::move(*features);

            p.issued_at = from_epoch_ms(j.at("issuedAt").get<std::int64_t>());
            if (auto it = j.find("expiresAt"); it != j.end() && !it->is_null())
                p.expires_at = from_epoch_ms(it->get<std::int64_t>());
            p.nonce = j.at("nonce").get<std::string>();
            return p;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(WardenError::invalid_format(std::format("Invalid license payload: {}", e.what())));
        }
    }

    // ============================================================================
    // LicenseCodec
    // ============================================================================

    LicenseCodec::LicenseCodec(std::string_view encryption_secret, std::string_view signing_secret)
        : encryption_key_(crypto::derive_key(encryption_secret)),
          signing_key_(crypto::derive_key(signing_secret))
    {
    }

    Result<std::string> LicenseCodec::encode(const LicensePayload &payload) const
    {
        auto serialized = payload.to_json().dump();
        auto box = crypto::AES256GCM::encrypt(encryption_key_, crypto::Bytes(serialized.begin(), serialized.end()));
        if (!box)
            return std::unexpected(box.error());

        auto blob = std::format("{}{}{}{}{}",
                                crypto::Hex::encode(box->iv),
                                kSeparator,
                                crypto::Hex::encode(box->ciphertext),
                                kSeparator,
                                crypto::Hex::encode(box->tag));

        return std::format("{}{}{}", blob, kSeparator, sign(blob));
    }

    Result<LicensePayload> LicenseCodec::decode(std::string_view license_key) const
    {
        // Outer level: <blob>.<signature>; the blob itself holds two separators.
        auto parts = split(license_key, kSeparator);
        if (parts.size() != 4)
        {
            return std::unexpected(WardenError::invalid_format("Invalid license format"));
        }
        for (auto part : parts)
        {
            if (part.empty())
                return std::unexpected(WardenError::invalid_format("Invalid license format"));
        }

        auto sig_pos = license_key.rfind(kSeparator);
        auto blob = license_key.substr(0, sig_pos);
        auto signature = license_key.substr(sig_pos + 1);

        if (!crypto::constant_time_equals(signature, sign(blob)))
        {
            return std::unexpected(WardenError::signature_mismatch("Invalid license signature"));
        }

        auto iv = crypto::Hex::decode(parts[0]);
        auto ciphertext = crypto::Hex::decode(parts[1]);
        auto tag = crypto::Hex::decode(parts[2]);
        if (!iv || !ciphertext || !tag)
        {
            return std::unexpected(WardenError::decryption_failed("License decryption failed: malformed segment"));
        }

        crypto::SealedBox box;
        box.ciphertext = std::move(*ciphertext);
        if (!copy_exact(*iv, box.iv) || !copy_exact(*tag, box.tag))
        {
            return std::unexpected(WardenError::decryption_failed("License decryption failed: bad IV or tag length"));
        }

        auto plain = crypto::AES256GCM::decrypt(encryption_key_, box);
        if (!plain)
        {
            if (plain.error().code == ErrorCode::DecryptionFailed)
                return std::unexpected(WardenError::decryption_failed("License decryption failed"));
            return std::unexpected(plain.error());
        }

        json j = json::parse(plain->begin(), plain->end(), nullptr, false);
        if (j.is_discarded())
        {
            return std::unexpected(WardenError::invalid_format("Invalid license payload: not JSON"));
        }
        return LicensePayload::from_json(j);
    }

    std::string LicenseCodec::sign(std::string_view text) const
    {
        return crypto::Hex::encode(crypto::HmacSha256::sign(signing_key_, text));
    }

} // namespace warden
