#include "warden/crypto.hpp"
#include <sodium.h>
#include <format>

namespace warden::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // AES256GCM Implementation
    // ============================================================================

    bool AES256GCM::is_available()
    {
        return crypto_aead_aes256gcm_is_available() == 1;
    }

    Result<SealedBox> AES256GCM::encrypt(
        const AESKey &key,
        const Bytes &plaintext,
        const Bytes &associated_data)
    {
        if (!is_available())
        {
            return std::unexpected(WardenError::crypto("AES-256-GCM is not supported on this CPU"));
        }

        SealedBox box;
        randombytes_buf(box.iv.data(), box.iv.size());
        box.ciphertext.resize(plaintext.size());

        unsigned long long tag_len = 0;
        if (crypto_aead_aes256gcm_encrypt_detached(
                box.ciphertext.data(),
                box.tag.data(),
                &tag_len,
                plaintext.data(),
                plaintext.size(),
                associated_data.data(),
                associated_data.size(),
                nullptr, // nsec (not used)
                box.iv.data(),
                key.data()) != 0)
        {
            return std::unexpected(WardenError::crypto("AES-256-GCM encryption failed"));
        }

        return box;
    }

    Result<Bytes> AES256GCM::decrypt(
        const AESKey &key,
        const SealedBox &box,
        const Bytes &associated_data)
    {
        if (!is_available())
        {
            return std::unexpected(WardenError::crypto("AES-256-GCM is not supported on this CPU"));
        }

        Bytes plaintext(box.ciphertext.size());
        if (crypto_aead_aes256gcm_decrypt_detached(
                plaintext.data(),
                nullptr, // nsec (not used)
                box.ciphertext.data(),
                box.ciphertext.size(),
                box.tag.data(),
                associated_data.data(),
                associated_data.size(),
                box.iv.data(),
                key.data()) != 0)
        {
            return std::unexpected(WardenError::decryption_failed("AES-256-GCM decryption failed (authentication failed)"));
        }

        return plaintext;
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    HmacTag HmacSha256::sign(const HmacKey &key, std::string_view message)
    {
        HmacTag tag;
        crypto_auth_hmacsha256(tag.data(),
                               reinterpret_cast<const uint8_t *>(message.data()),
                               message.size(),
                               key.data());
        return tag;
    }

    bool HmacSha256::verify(const HmacKey &key, std::string_view message, const HmacTag &tag)
    {
        return crypto_auth_hmacsha256_verify(tag.data(),
                                             reinterpret_cast<const uint8_t *>(message.data()),
                                             message.size(),
                                             key.data()) == 0;
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    std::string Hex::encode(const uint8_t *data, size_t size)
    {
        std::string hex(size * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data, size);
        hex.resize(size * 2);
        return hex;
    }

    std::string Hex::encode(const Bytes &data)
    {
        return encode(data.data(), data.size());
    }

    Result<Bytes> Hex::decode(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(WardenError::invalid_format("Invalid hex length"));
        }

        Bytes decoded(hex.size() / 2);
        size_t decoded_len = 0;
        const char *end = nullptr;

        if (sodium_hex2bin(
                decoded.data(),
                decoded.size(),
                hex.data(),
                hex.size(),
                nullptr, // no ignored characters
                &decoded_len,
                &end) != 0 ||
            end != hex.data() + hex.size())
        {
            return std::unexpected(WardenError::invalid_format("Invalid hex character"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    std::string SecureRandom::uuid_v4()
    {
        std::array<uint8_t, 16> b;
        randombytes_buf(b.data(), b.size());
        b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40);
        b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);

        auto hex = Hex::encode(b);
        return std::format("{}-{}-{}-{}-{}",
                           hex.substr(0, 8),
                           hex.substr(8, 4),
                           hex.substr(12, 4),
                           hex.substr(16, 4),
                           hex.substr(20, 12));
    }

    // ============================================================================
    // PasswordHash Implementation
    // ============================================================================

    Result<std::string> PasswordHash::hash(std::string_view password)
    {
        std::string out(crypto_pwhash_STRBYTES, '\0');
        if (crypto_pwhash_str(
                out.data(),
                password.data(),
                password.size(),
                crypto_pwhash_OPSLIMIT_INTERACTIVE,
                crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
        {
            return std::unexpected(WardenError::crypto("Argon2 password hashing failed (out of memory?)"));
        }
        out.resize(std::char_traits<char>::length(out.c_str()));
        return out;
    }

    bool PasswordHash::verify(std::string_view password, const std::string &encoded)
    {
        if (encoded.empty() || encoded.size() >= crypto_pwhash_STRBYTES)
            return false;
        return crypto_pwhash_str_verify(encoded.c_str(), password.data(), password.size()) == 0;
    }

    // ============================================================================
    // Helpers
    // ============================================================================

    bool constant_time_equals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
            return false;
        if (a.empty())
            return true;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    std::array<uint8_t, 32> derive_key(std::string_view secret)
    {
        return SHA256::hash(secret);
    }

} // namespace warden::crypto
